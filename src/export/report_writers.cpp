#include <latbench/export/report_writers.h>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <fstream>
#include <system_error>

namespace latbench::exporting {

namespace {

std::string isoTimestamp(WallTimePoint tp) {
    const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    const std::time_t t = std::chrono::system_clock::to_time_t(secs);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", fmt::gmtime(t), static_cast<int>(ms));
}

std::string extractedField(const bench::RequestOutcome& o, const std::string& key) {
    auto it = o.extracted.find(key);
    return it == o.extracted.end() ? std::string{} : it->second;
}

std::string reasonsText(const std::map<std::string, std::uint64_t>& reasons) {
    std::string out;
    for (const auto& [reason, count] : reasons) {
        if (!out.empty())
            out.push_back(';');
        out += fmt::format("{}={}", reason, count);
    }
    return out;
}

nlohmann::json optionalJson(const std::optional<double>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

Result<void> writeWhole(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::WriteError, "Cannot open " + path.string() + " for writing"};
    }
    out << content;
    out.flush();
    if (!out) {
        return Error{ErrorCode::WriteError, "Failed writing " + path.string()};
    }
    return {};
}

} // namespace

std::string csvEscape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char c : field) {
        if (c == '"')
            out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string formatOptional(const std::optional<double>& v, int precision) {
    if (!v) {
        return "N/A";
    }
    return fmt::format("{:.{}f}", *v, precision);
}

Result<std::filesystem::path> makeDatedOutputDir(const std::filesystem::path& base,
                                                 std::string_view prefix) {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    const std::string date = fmt::format("{:%Y-%m-%d}", fmt::localtime(now));
    const auto dir = base / (prefix.empty() ? date : fmt::format("{}_{}", prefix, date));

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::WriteError,
                     "Cannot create output directory " + dir.string() + ": " + ec.message()};
    }
    return dir;
}

// ---------------------------------------------------------------------------
// CsvDetailWriter
// ---------------------------------------------------------------------------

CsvDetailWriter::CsvDetailWriter(std::filesystem::path path) : path_(std::move(path)) {}

std::string CsvDetailWriter::header() {
    return "timestamp,request_index,target,sequence,status_code,response_time_s,"
           "content_size_kb,success,reason,error_message,ip,country";
}

std::string CsvDetailWriter::formatRow(const bench::RequestOutcome& o) {
    const std::string status = o.httpStatus ? std::to_string(*o.httpStatus) : std::string{};
    const std::string sizeKb =
        o.payloadBytes ? fmt::format("{:.3f}", static_cast<double>(*o.payloadBytes) / 1024.0)
                       : std::string{};
    return fmt::format("{},{},{},{},{},{:.6f},{},{},{},{},{},{}", isoTimestamp(o.wallStart),
                       o.requestIndex, csvEscape(o.targetId), o.sequence, status,
                       toSeconds(o.elapsed), sizeKb, o.success() ? "true" : "false",
                       csvEscape(o.classification.reasonCode()),
                       csvEscape(o.errorDetail().value_or("")),
                       csvEscape(extractedField(o, "ip")), csvEscape(extractedField(o, "country")));
}

Result<void> CsvDetailWriter::open() {
    auto r = writeWhole(path_, header() + "\n");
    if (r) {
        opened_ = true;
        spdlog::debug("[CsvDetailWriter] Writing detail rows to {}", path_.string());
    }
    return r;
}

Result<void> CsvDetailWriter::writeBatch(const std::vector<bench::RequestOutcome>& batch) {
    if (!opened_) {
        if (auto r = open(); !r) {
            return r;
        }
    }

    std::string buffer;
    for (const auto& o : batch) {
        buffer += formatRow(o);
        buffer.push_back('\n');
    }

    std::ofstream out(path_, std::ios::binary | std::ios::app);
    if (!out) {
        return Error{ErrorCode::WriteError, "Cannot append to " + path_.string()};
    }
    out << buffer;
    out.flush();
    if (!out) {
        return Error{ErrorCode::WriteError, "Failed appending to " + path_.string()};
    }
    return {};
}

// ---------------------------------------------------------------------------
// Summary writers
// ---------------------------------------------------------------------------

CsvSummaryWriter::CsvSummaryWriter(std::filesystem::path path) : path_(std::move(path)) {}

std::string CsvSummaryWriter::header() {
    return "category,target,total_requests,concurrency,request_rate_s,success_count,"
           "failure_count,success_rate_pct,mean_latency_s,min_latency_s,max_latency_s,"
           "mean_size_kb,target_span_s,run_wall_clock_s,failures_by_reason";
}

std::string CsvSummaryWriter::formatRow(const bench::SummaryRow& r) {
    return fmt::format("{},{},{},{},{},{},{},{},{},{},{},{},{:.3f},{:.3f},{}",
                       csvEscape(r.category), csvEscape(r.targetId), r.totalRequests,
                       r.concurrency, formatOptional(r.requestRateSeconds, 6), r.successCount,
                       r.failureCount, formatOptional(r.successRatePercent, 2),
                       formatOptional(r.meanLatencySeconds, 6),
                       formatOptional(r.minLatencySeconds, 6),
                       formatOptional(r.maxLatencySeconds, 6), formatOptional(r.meanSizeKb, 3),
                       r.targetSpanSeconds, r.runWallClockSeconds,
                       csvEscape(reasonsText(r.failuresByReason)));
}

Result<void> CsvSummaryWriter::write(const std::vector<bench::SummaryRow>& rows) {
    std::string content = header() + "\n";
    for (const auto& r : rows) {
        content += formatRow(r);
        content.push_back('\n');
    }
    auto res = writeWhole(path_, content);
    if (res) {
        spdlog::info("[CsvSummaryWriter] Summary written to {}", path_.string());
    }
    return res;
}

nlohmann::json toJson(const bench::SummaryRow& r) {
    nlohmann::json j;
    j["category"] = r.category;
    j["target"] = r.targetId;
    j["total_requests"] = r.totalRequests;
    j["concurrency"] = r.concurrency;
    j["request_rate_s"] = optionalJson(r.requestRateSeconds);
    j["success_count"] = r.successCount;
    j["failure_count"] = r.failureCount;
    j["success_rate_pct"] = optionalJson(r.successRatePercent);
    j["mean_latency_s"] = optionalJson(r.meanLatencySeconds);
    j["min_latency_s"] = optionalJson(r.minLatencySeconds);
    j["max_latency_s"] = optionalJson(r.maxLatencySeconds);
    j["mean_size_kb"] = optionalJson(r.meanSizeKb);
    j["target_span_s"] = r.targetSpanSeconds;
    j["run_wall_clock_s"] = r.runWallClockSeconds;
    j["failures_by_reason"] = r.failuresByReason;
    return j;
}

nlohmann::json toJson(const std::vector<bench::SummaryRow>& rows) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : rows) {
        arr.push_back(toJson(r));
    }
    return arr;
}

JsonSummaryWriter::JsonSummaryWriter(std::filesystem::path path) : path_(std::move(path)) {}

Result<void> JsonSummaryWriter::write(const std::vector<bench::SummaryRow>& rows) {
    auto res = writeWhole(path_, toJson(rows).dump(2) + "\n");
    if (res) {
        spdlog::info("[JsonSummaryWriter] Summary written to {}", path_.string());
    }
    return res;
}

void MultiSummaryWriter::add(std::unique_ptr<bench::ISummaryWriter> writer) {
    if (writer) {
        writers_.push_back(std::move(writer));
    }
}

Result<void> MultiSummaryWriter::write(const std::vector<bench::SummaryRow>& rows) {
    for (auto& w : writers_) {
        if (auto r = w->write(rows); !r) {
            return r;
        }
    }
    return {};
}

} // namespace latbench::exporting
