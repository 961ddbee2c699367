#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <latbench/bench/outcome.h>
#include <latbench/bench/statistics.h>
#include <latbench/core/types.h>

namespace latbench::bench {

/**
 * Destination for detailed per-request rows. Called only from the sink's writer thread.
 */
class IDetailWriter {
public:
    virtual ~IDetailWriter() = default;

    virtual Result<void> writeBatch(const std::vector<RequestOutcome>& batch) = 0;
};

/**
 * ResultSink serializes every aggregate update onto one writer thread.
 *
 * Workers call submit() from any thread; the call only appends to a pending vector under a
 * short lock. The writer thread drains pending outcomes, folds them into the per-target
 * aggregates and, when detailed logging is on, buffers them and flushes a batch to the
 * detail writer every `batchSize` outcomes. finish() drains what is left, performs the final
 * partial flush, joins the writer and returns the finalized aggregates.
 *
 * Usage:
 *   ResultSink sink(config, &csvWriter);
 *   sink.start();
 *   sink.submit(outcome);   // from worker threads
 *   auto aggregates = sink.finish();
 */
class ResultSink {
public:
    struct Config {
        bool detailedLogging{true};
        std::size_t batchSize{1000};
    };

    struct Stats {
        std::uint64_t received = 0;
        std::uint64_t processed = 0;
        std::uint64_t successes = 0;
        std::uint64_t batchesFlushed = 0;
        std::uint64_t rowsFlushed = 0;
        std::uint64_t flushErrors = 0;
        std::uint64_t cleanupFailures = 0;
    };

    ResultSink(Config config, IDetailWriter* detailWriter);
    ~ResultSink();

    ResultSink(const ResultSink&) = delete;
    ResultSink& operator=(const ResultSink&) = delete;

    /// Start the writer thread.
    void start();

    /// Hand one outcome to the sink. Thread-safe.
    void submit(RequestOutcome outcome);

    /**
     * Drain all submitted outcomes, flush remaining detail rows and stop the writer.
     * Aggregates are returned in first-seen target order.
     */
    std::vector<TargetAggregate> finish();

    /// Processed outcome count, safe to poll from a monitor thread.
    std::uint64_t processed() const noexcept { return processed_.load(std::memory_order_relaxed); }
    std::uint64_t successes() const noexcept { return successes_.load(std::memory_order_relaxed); }

    Stats getStats() const;

private:
    void writerLoop();
    void apply(RequestOutcome&& outcome);
    void flushDetails();

    Config config_;
    IDetailWriter* detailWriter_;

    mutable std::mutex queueMutex_;
    std::condition_variable queueCv_;
    std::vector<RequestOutcome> pending_;
    bool stop_{false};

    std::thread writer_;
    bool started_{false};
    bool finished_{false};

    // Owned by the writer thread until finish() joins it.
    std::map<std::string, std::size_t> index_;
    std::vector<TargetAggregate> aggregates_;
    std::vector<RequestOutcome> detailBuffer_;

    std::atomic<std::uint64_t> processed_{0};
    std::atomic<std::uint64_t> successes_{0};

    mutable std::mutex statsMutex_;
    Stats stats_;
};

} // namespace latbench::bench
