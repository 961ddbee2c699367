/*
 * latbench/src/bench/benchmark_runner.cpp
 *
 * One run, start to finish:
 * - Validate parameters before anything is scheduled
 * - Expand targets into the work queue and drain it through the dispatcher
 * - Fold outcomes in the result sink, then summarize once everything is in
 * - Optional monitor thread reports progress at a fixed interval
 */

#include <latbench/bench/benchmark_runner.h>
#include <latbench/bench/dispatcher.h>
#include <latbench/bench/rate_limiter.h>
#include <latbench/bench/request_executor.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <condition_variable>
#include <mutex>
#include <set>
#include <thread>
#include <unordered_map>
#include <utility>

namespace latbench::bench {

namespace {

// Periodically samples live counters on its own thread; stops and joins on destruction.
class ProgressMonitor {
public:
    using Sampler = std::function<ProgressSnapshot()>;

    ProgressMonitor(std::chrono::milliseconds interval, Sampler sample, ProgressCallback report)
        : interval_(interval), sample_(std::move(sample)), report_(std::move(report)) {
        if (interval_.count() > 0 && report_) {
            thread_ = std::thread([this]() { loop(); });
        }
    }

    ~ProgressMonitor() { stop(); }

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void stop() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    void loop() {
        std::unique_lock<std::mutex> lk(mutex_);
        while (!cv_.wait_for(lk, interval_, [this] { return stop_; })) {
            lk.unlock();
            try {
                report_(sample_());
            } catch (const std::exception& e) {
                spdlog::warn("[Runner] progress callback failed: {}", e.what());
            }
            lk.lock();
        }
    }

    std::chrono::milliseconds interval_;
    Sampler sample_;
    ProgressCallback report_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_{false};
    std::thread thread_;
};

} // namespace

Result<void> validateRunParameters(const RunParameters& params,
                                   const std::vector<TargetDescriptor>& targets) {
    if (params.concurrency < 1) {
        return Error{ErrorCode::ConfigurationError, "concurrency must be at least 1"};
    }
    if (!std::isfinite(params.ratePerSecond) || params.ratePerSecond < 0.0) {
        return Error{ErrorCode::ConfigurationError,
                     "rate must be a non-negative number of requests per second"};
    }
    if (params.ratePerSecond > 0.0 && !dispatchInterval(params.ratePerSecond)) {
        return Error{ErrorCode::ConfigurationError,
                     fmt::format("rate {} per second is too low to schedule", params.ratePerSecond)};
    }
    if (params.connectTimeout.count() <= 0 || params.readTimeout.count() <= 0) {
        return Error{ErrorCode::ConfigurationError, "timeouts must be positive"};
    }
    if (params.detailedLogging && params.batchSize < 1) {
        return Error{ErrorCode::ConfigurationError, "batch size must be at least 1"};
    }
    if (targets.empty()) {
        return Error{ErrorCode::ConfigurationError, "no targets to benchmark"};
    }

    std::set<std::string> seen;
    for (const auto& t : targets) {
        if (t.id.empty()) {
            return Error{ErrorCode::ConfigurationError, "target with empty id"};
        }
        if (!seen.insert(t.id).second) {
            return Error{ErrorCode::ConfigurationError, "duplicate target id: " + t.id};
        }
        if (t.endpoint.empty()) {
            return Error{ErrorCode::ConfigurationError, "target " + t.id + " has no endpoint"};
        }
        if ((t.connectTimeout && t.connectTimeout->count() <= 0) ||
            (t.readTimeout && t.readTimeout->count() <= 0)) {
            return Error{ErrorCode::ConfigurationError,
                         "target " + t.id + " has a non-positive timeout"};
        }
    }
    return {};
}

BenchmarkRunner::BenchmarkRunner(std::shared_ptr<IHttpTransport> transport, IClock& clock)
    : transport_(std::move(transport)), clock_(clock) {}

Result<RunReport> BenchmarkRunner::run(const std::vector<TargetDescriptor>& targets,
                                       const RunParameters& params, IDetailWriter* detailWriter,
                                       ISummaryWriter& summaryWriter,
                                       const ProgressCallback& onProgress) {
    if (!transport_) {
        return Error{ErrorCode::NotInitialized, "no HTTP transport configured"};
    }
    if (auto v = validateRunParameters(params, targets); !v) {
        return v.error();
    }

    auto items = expandWorkQueue(targets, params.requestsPerTarget);
    const std::size_t total = items.size();

    spdlog::info("[Runner] {}: {} targets, {} requests, concurrency={}, rate={}/s", params.category,
                 targets.size(), total, params.concurrency,
                 params.ratePerSecond > 0.0 ? fmt::format("{:g}", params.ratePerSecond)
                                            : std::string("unlimited"));

    ConnectionPolicy policy;
    policy.reuseConnections = false;
    policy.connectTimeout = params.connectTimeout;
    policy.readTimeout = params.readTimeout;
    policy.verifyTls = params.verifyTls;

    RequestExecutor executor(*transport_, policy, clock_);
    auto limiter = makeRateLimiter(params.ratePerSecond, clock_);
    Dispatcher dispatcher(params.concurrency, *limiter, clock_);
    ResultSink sink(ResultSink::Config{params.detailedLogging, params.batchSize}, detailWriter);
    sink.start();

    const auto runStart = clock_.now();
    DispatchStats dispatchStats;
    {
        ProgressMonitor monitor(
            params.progressInterval,
            [&]() {
                ProgressSnapshot s;
                s.total = total;
                s.dispatched = dispatcher.dispatched();
                s.completed = sink.processed();
                s.inFlight = dispatcher.inFlight();
                s.successes = sink.successes();
                s.elapsed = clock_.now() - runStart;
                return s;
            },
            onProgress);

        dispatchStats = dispatcher.run(
            std::move(items), [&executor](const WorkItem& w) { return executor.execute(w); },
            [&sink](RequestOutcome o) { sink.submit(std::move(o)); });
    }

    auto aggregates = sink.finish();
    const auto runEnd = clock_.now();
    const auto sinkStats = sink.getStats();

    SummaryContext ctx;
    ctx.category = params.category;
    ctx.concurrency = params.concurrency;
    ctx.runWallClock = runEnd - runStart;

    // Rows follow target order.
    std::unordered_map<std::string, const TargetAggregate*> byId;
    for (const auto& a : aggregates) {
        byId[a.targetId] = &a;
    }
    RunReport report;
    for (const auto& t : targets) {
        auto it = byId.find(t.id);
        if (it != byId.end()) {
            report.summaries.push_back(summarize(*it->second, ctx));
        } else {
            // Target scheduled with zero requests.
            TargetAggregate empty;
            empty.targetId = t.id;
            report.summaries.push_back(summarize(empty, ctx));
        }
    }

    report.wallClock = ctx.runWallClock;
    report.totalRequests = total;
    report.outcomes = static_cast<std::size_t>(sinkStats.processed);
    report.peakInFlight = dispatchStats.peakInFlight;
    report.cleanupFailures = sinkStats.cleanupFailures;
    report.detailFlushErrors = sinkStats.flushErrors;
    report.internalFailures = dispatchStats.internalFailures;

    if (report.outcomes != total) {
        spdlog::error("[Runner] {} requests scheduled but {} outcomes recorded", total,
                      report.outcomes);
        return Error{ErrorCode::InternalError, "outcome count does not match work item count"};
    }

    spdlog::info("[Runner] {} finished in {:.2f}s ({} outcomes, peak in-flight {})",
                 params.category, toSeconds(report.wallClock), report.outcomes,
                 report.peakInFlight);

    if (auto w = summaryWriter.write(report.summaries); !w) {
        spdlog::error("[Runner] Failed to write summary: {}", w.error().message);
        return w.error();
    }
    return report;
}

} // namespace latbench::bench
