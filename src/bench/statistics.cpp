#include <latbench/bench/statistics.h>

#include <algorithm>

namespace latbench::bench {

void TargetAggregate::record(const RequestOutcome& outcome) {
    if (targetId.empty()) {
        targetId = outcome.targetId;
    }
    ++total;

    if (!firstStart || outcome.start < *firstStart)
        firstStart = outcome.start;
    if (!lastEnd || outcome.end > *lastEnd)
        lastEnd = outcome.end;

    if (!outcome.success()) {
        ++failuresByReason[outcome.classification.reasonCode()];
        return;
    }

    ++successes;
    successElapsedSum += outcome.elapsed;
    successElapsedMin =
        successElapsedMin ? std::min(*successElapsedMin, outcome.elapsed) : outcome.elapsed;
    successElapsedMax =
        successElapsedMax ? std::max(*successElapsedMax, outcome.elapsed) : outcome.elapsed;
    if (outcome.payloadBytes) {
        successBytesSum += *outcome.payloadBytes;
        ++successBytesSamples;
    }
}

SummaryRow summarize(const TargetAggregate& aggregate, const SummaryContext& context) {
    SummaryRow row;
    row.category = context.category;
    row.targetId = aggregate.targetId;
    row.totalRequests = aggregate.total;
    row.successCount = aggregate.successes;
    row.failureCount = aggregate.failures();
    row.concurrency = context.concurrency;
    row.runWallClockSeconds = toSeconds(context.runWallClock);
    row.failuresByReason = aggregate.failuresByReason;

    if (aggregate.firstStart && aggregate.lastEnd && *aggregate.lastEnd > *aggregate.firstStart) {
        row.targetSpanSeconds = toSeconds(*aggregate.lastEnd - *aggregate.firstStart);
    }

    if (aggregate.total > 0) {
        row.successRatePercent = 100.0 * static_cast<double>(aggregate.successes) /
                                 static_cast<double>(aggregate.total);
        row.requestRateSeconds = row.targetSpanSeconds / static_cast<double>(aggregate.total);
    }

    if (aggregate.successes > 0) {
        row.meanLatencySeconds =
            toSeconds(aggregate.successElapsedSum) / static_cast<double>(aggregate.successes);
        row.minLatencySeconds = toSeconds(*aggregate.successElapsedMin);
        row.maxLatencySeconds = toSeconds(*aggregate.successElapsedMax);
    }

    if (aggregate.successBytesSamples > 0) {
        row.meanSizeKb = static_cast<double>(aggregate.successBytesSum) /
                         static_cast<double>(aggregate.successBytesSamples) / 1024.0;
    }

    return row;
}

std::vector<SummaryRow> summarizeAll(const std::vector<TargetAggregate>& aggregates,
                                     const SummaryContext& context) {
    std::vector<SummaryRow> rows;
    rows.reserve(aggregates.size());
    for (const auto& a : aggregates) {
        rows.push_back(summarize(a, context));
    }
    return rows;
}

} // namespace latbench::bench
