#include <latbench/bench/dispatcher.h>
#include <latbench/bench/request_executor.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace latbench::bench {

ConcurrencyGate::ConcurrencyGate(std::size_t permits)
    : capacity_(std::max<std::size_t>(1, permits)),
      sem_(static_cast<std::ptrdiff_t>(std::max<std::size_t>(1, permits))) {}

void ConcurrencyGate::acquire() {
    sem_.acquire();
    const auto now = inFlight_.fetch_add(1, std::memory_order_relaxed) + 1;
    auto prev = peak_.load(std::memory_order_relaxed);
    while (now > prev && !peak_.compare_exchange_weak(prev, now, std::memory_order_relaxed)) {
    }
}

void ConcurrencyGate::release() {
    inFlight_.fetch_sub(1, std::memory_order_relaxed);
    sem_.release();
}

Dispatcher::Dispatcher(std::size_t concurrency, IRateLimiter& limiter, IClock& clock)
    : concurrency_(std::max<std::size_t>(1, concurrency)), limiter_(limiter), clock_(clock),
      gate_(concurrency_) {}

DispatchStats Dispatcher::run(std::vector<WorkItem> items, const Executor& execute,
                              const Consumer& consume) {
    spdlog::debug("[Dispatcher] Dispatching {} items with concurrency {}", items.size(),
                  concurrency_);

    dispatched_.store(0);
    completed_.store(0);
    internalFailures_.store(0);
    gate_.resetPeak();

    boost::asio::thread_pool pool(concurrency_);

    for (auto& item : items) {
        limiter_.acquire();
        gate_.acquire();
        dispatched_.fetch_add(1, std::memory_order_relaxed);

        try {
            boost::asio::post(pool, [this, &execute, &consume, item = std::move(item)]() {
                ConcurrencyGate::Permit permit(gate_);

                RequestOutcome outcome;
                const auto started = clock_.now();
                try {
                    outcome = execute(item);
                } catch (const std::exception& e) {
                    internalFailures_.fetch_add(1, std::memory_order_relaxed);
                    outcome = makeInternalFailure(item, e.what(), started, clock_.now());
                } catch (...) {
                    internalFailures_.fetch_add(1, std::memory_order_relaxed);
                    outcome = makeInternalFailure(item, "unknown exception", started, clock_.now());
                }

                try {
                    consume(std::move(outcome));
                } catch (const std::exception& e) {
                    spdlog::error("[Dispatcher] Failed to record outcome for {} #{}: {}",
                                  item.target ? item.target->id : std::string{}, item.sequence,
                                  e.what());
                }
                completed_.fetch_add(1, std::memory_order_relaxed);
            });
        } catch (...) {
            gate_.release();
            pool.join();
            throw;
        }
    }

    pool.join();

    DispatchStats stats;
    stats.dispatched = dispatched_.load();
    stats.completed = completed_.load();
    stats.peakInFlight = gate_.peakInFlight();
    stats.internalFailures = internalFailures_.load();
    spdlog::debug("[Dispatcher] Done: dispatched={}, completed={}, peakInFlight={}",
                  stats.dispatched, stats.completed, stats.peakInFlight);
    return stats;
}

} // namespace latbench::bench
