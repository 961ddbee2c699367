#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <semaphore>
#include <vector>

#include <latbench/bench/outcome.h>
#include <latbench/bench/rate_limiter.h>
#include <latbench/bench/target.h>
#include <latbench/core/clock.h>

namespace latbench::bench {

// ============================================================================
// Concurrency gate
// ============================================================================

/// Counting gate bounding the number of in-flight executor invocations.
class ConcurrencyGate {
public:
    explicit ConcurrencyGate(std::size_t permits);

    ConcurrencyGate(const ConcurrencyGate&) = delete;
    ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

    /// Blocks until a permit is available.
    void acquire();
    void release();

    std::size_t capacity() const noexcept { return capacity_; }
    std::size_t inFlight() const noexcept { return inFlight_.load(std::memory_order_relaxed); }
    std::size_t peakInFlight() const noexcept { return peak_.load(std::memory_order_relaxed); }
    void resetPeak() noexcept { peak_.store(inFlight(), std::memory_order_relaxed); }

    /// RAII owner of a permit that was already acquired; releases it on every exit path.
    class Permit {
    public:
        explicit Permit(ConcurrencyGate& gate) : gate_(gate) {}
        ~Permit() { gate_.release(); }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit(Permit&&) = delete;
        Permit& operator=(Permit&&) = delete;

    private:
        ConcurrencyGate& gate_;
    };

private:
    const std::size_t capacity_;
    std::counting_semaphore<> sem_;
    std::atomic<std::size_t> inFlight_{0};
    std::atomic<std::size_t> peak_{0};
};

// ============================================================================
// Dispatcher
// ============================================================================

struct DispatchStats {
    std::size_t dispatched{0};
    std::size_t completed{0};
    std::size_t peakInFlight{0};
    std::size_t internalFailures{0};
};

/**
 * Drains a work queue onto a fixed pool of C workers.
 *
 * The calling thread walks the queue in order: rate limiter first, then the concurrency gate,
 * then the item is posted to the pool. Each task runs the executor, converts any exception into
 * an Internal failure outcome, hands the outcome to the consumer and releases its permit.
 * run() returns once every item has produced exactly one outcome.
 */
class Dispatcher {
public:
    using Executor = std::function<RequestOutcome(const WorkItem&)>;
    using Consumer = std::function<void(RequestOutcome)>;

    Dispatcher(std::size_t concurrency, IRateLimiter& limiter, IClock& clock = steadyClock());

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Counters and peak restart at zero on every call.
    DispatchStats run(std::vector<WorkItem> items, const Executor& execute,
                      const Consumer& consume);

    // Live counters for progress reporting.
    std::size_t dispatched() const noexcept { return dispatched_.load(std::memory_order_relaxed); }
    std::size_t completed() const noexcept { return completed_.load(std::memory_order_relaxed); }
    std::size_t inFlight() const noexcept { return gate_.inFlight(); }

private:
    std::size_t concurrency_;
    IRateLimiter& limiter_;
    IClock& clock_;
    ConcurrencyGate gate_;

    std::atomic<std::size_t> dispatched_{0};
    std::atomic<std::size_t> completed_{0};
    std::atomic<std::size_t> internalFailures_{0};
};

} // namespace latbench::bench
