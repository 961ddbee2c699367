#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <latbench/bench/outcome.h>
#include <latbench/core/clock.h>

namespace latbench::bench {

/**
 * Running totals for one target. Owned and updated by the result sink's writer thread only.
 */
struct TargetAggregate {
    std::string targetId;
    std::uint64_t total{0};
    std::uint64_t successes{0};
    std::map<std::string, std::uint64_t> failuresByReason;

    Duration successElapsedSum{0};
    std::optional<Duration> successElapsedMin;
    std::optional<Duration> successElapsedMax;
    std::uint64_t successBytesSum{0};
    std::uint64_t successBytesSamples{0};

    std::optional<TimePoint> firstStart;
    std::optional<TimePoint> lastEnd;

    void record(const RequestOutcome& outcome);

    std::uint64_t failures() const noexcept { return total - successes; }
};

/**
 * Run-level context stamped on every summary row.
 */
struct SummaryContext {
    std::string category;
    std::size_t concurrency{0};
    Duration runWallClock{0};
};

/**
 * Derived per-target statistics. Ratios with a zero denominator are nullopt (reported as N/A).
 */
struct SummaryRow {
    std::string category;
    std::string targetId;
    std::uint64_t totalRequests{0};
    std::uint64_t successCount{0};
    std::uint64_t failureCount{0};
    std::size_t concurrency{0};

    std::optional<double> successRatePercent;
    std::optional<double> requestRateSeconds; // target span / total requests
    std::optional<double> meanLatencySeconds;
    std::optional<double> minLatencySeconds;
    std::optional<double> maxLatencySeconds;
    std::optional<double> meanSizeKb;

    double targetSpanSeconds{0.0}; // first dispatch -> last completion
    double runWallClockSeconds{0.0};

    std::map<std::string, std::uint64_t> failuresByReason;
};

/// Pure: the same aggregate and context always produce the same row.
SummaryRow summarize(const TargetAggregate& aggregate, const SummaryContext& context);

std::vector<SummaryRow> summarizeAll(const std::vector<TargetAggregate>& aggregates,
                                     const SummaryContext& context);

} // namespace latbench::bench
