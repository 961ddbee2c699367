#pragma once

/*
 * latbench - Benchmark run orchestration
 *
 * BenchmarkRunner wires the pieces of one run together:
 *   targets -> expandWorkQueue -> Dispatcher(RateLimiter, ConcurrencyGate)
 *           -> RequestExecutor -> ResultSink -> summarize -> ISummaryWriter
 */

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <latbench/bench/http_transport.h>
#include <latbench/bench/result_sink.h>
#include <latbench/bench/statistics.h>
#include <latbench/bench/target.h>
#include <latbench/core/clock.h>
#include <latbench/core/types.h>

namespace latbench::bench {

/**
 * Parameters for one run. Validated before any work is scheduled.
 */
struct RunParameters {
    std::string category{"benchmark"};
    std::size_t concurrency{10};
    double ratePerSecond{0.0}; // 0 = unlimited
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds readTimeout{20000};
    bool detailedLogging{true};
    std::size_t batchSize{1000};
    std::size_t requestsPerTarget{10};
    std::chrono::milliseconds progressInterval{10000}; // 0 = no progress reports
    bool verifyTls{false};
};

/// Reject invalid parameters/targets with ErrorCode::ConfigurationError.
Result<void> validateRunParameters(const RunParameters& params,
                                   const std::vector<TargetDescriptor>& targets);

/**
 * Finalized summary consumer. Receives the full list exactly once per run.
 */
class ISummaryWriter {
public:
    virtual ~ISummaryWriter() = default;

    virtual Result<void> write(const std::vector<SummaryRow>& rows) = 0;
};

struct ProgressSnapshot {
    std::size_t total{0};
    std::size_t dispatched{0};
    std::size_t completed{0};
    std::size_t inFlight{0};
    std::uint64_t successes{0};
    Duration elapsed{0};
};

using ProgressCallback = std::function<void(const ProgressSnapshot&)>;

struct RunReport {
    std::vector<SummaryRow> summaries;
    Duration wallClock{0};
    std::size_t totalRequests{0};
    std::size_t outcomes{0};
    std::size_t peakInFlight{0};
    std::uint64_t cleanupFailures{0};
    std::uint64_t detailFlushErrors{0};
    std::size_t internalFailures{0};
};

class BenchmarkRunner {
public:
    explicit BenchmarkRunner(std::shared_ptr<IHttpTransport> transport,
                             IClock& clock = steadyClock());

    /**
     * Execute the whole run. Returns after every work item produced exactly one outcome and the
     * summary was handed to `summaryWriter`. `detailWriter` may be null.
     */
    Result<RunReport> run(const std::vector<TargetDescriptor>& targets,
                          const RunParameters& params, IDetailWriter* detailWriter,
                          ISummaryWriter& summaryWriter,
                          const ProgressCallback& onProgress = {});

private:
    std::shared_ptr<IHttpTransport> transport_;
    IClock& clock_;
};

} // namespace latbench::bench
