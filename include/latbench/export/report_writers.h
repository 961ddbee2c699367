#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <latbench/bench/benchmark_runner.h>
#include <latbench/bench/result_sink.h>
#include <latbench/bench/statistics.h>
#include <latbench/core/types.h>

namespace latbench::exporting {

inline constexpr const char* kDetailFileName = "detailed_results.csv";
inline constexpr const char* kSummaryCsvFileName = "summary_statistics.csv";
inline constexpr const char* kSummaryJsonFileName = "summary_statistics.json";

/// Quote a CSV field when it contains a delimiter, quote or line break (RFC 4180).
std::string csvEscape(std::string_view field);

/// "N/A" for an undefined ratio, fixed-point otherwise.
std::string formatOptional(const std::optional<double>& v, int precision);

/// Create `<base>/<prefix>_<YYYY-MM-DD>` (local date) if needed and return it.
Result<std::filesystem::path> makeDatedOutputDir(const std::filesystem::path& base,
                                                 std::string_view prefix);

/**
 * Appends one CSV row per outcome. open() truncates the file and writes the header once.
 */
class CsvDetailWriter final : public bench::IDetailWriter {
public:
    explicit CsvDetailWriter(std::filesystem::path path);

    Result<void> open();
    Result<void> writeBatch(const std::vector<bench::RequestOutcome>& batch) override;

    const std::filesystem::path& path() const noexcept { return path_; }

    static std::string header();
    static std::string formatRow(const bench::RequestOutcome& outcome);

private:
    std::filesystem::path path_;
    bool opened_{false};
};

class CsvSummaryWriter final : public bench::ISummaryWriter {
public:
    explicit CsvSummaryWriter(std::filesystem::path path);

    Result<void> write(const std::vector<bench::SummaryRow>& rows) override;

    static std::string header();
    static std::string formatRow(const bench::SummaryRow& row);

private:
    std::filesystem::path path_;
};

class JsonSummaryWriter final : public bench::ISummaryWriter {
public:
    explicit JsonSummaryWriter(std::filesystem::path path);

    Result<void> write(const std::vector<bench::SummaryRow>& rows) override;

private:
    std::filesystem::path path_;
};

/// Fans one summary out to several writers; stops at the first failure.
class MultiSummaryWriter final : public bench::ISummaryWriter {
public:
    void add(std::unique_ptr<bench::ISummaryWriter> writer);

    Result<void> write(const std::vector<bench::SummaryRow>& rows) override;

private:
    std::vector<std::unique_ptr<bench::ISummaryWriter>> writers_;
};

nlohmann::json toJson(const bench::SummaryRow& row);
nlohmann::json toJson(const std::vector<bench::SummaryRow>& rows);

} // namespace latbench::exporting
