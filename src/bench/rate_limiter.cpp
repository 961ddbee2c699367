/*
 * latbench/src/bench/rate_limiter.cpp
 *
 * Fixed-interval dispatch limiter
 * - Grants are spaced at least `interval` apart, measured from the previous grant.
 * - The first grant is immediate; there is no burst allowance.
 * - Thread-safe for concurrent acquire() calls; waiters are serialized on the mutex so
 *   spacing holds across callers.
 */

#include <latbench/bench/rate_limiter.h>

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <optional>

namespace latbench::bench {

namespace {

class UnlimitedLimiter final : public IRateLimiter {
public:
    void acquire() override {}
};

class FixedIntervalLimiter final : public IRateLimiter {
public:
    FixedIntervalLimiter(Duration interval, IClock& clock) : interval_(interval), clock_(clock) {}

    void acquire() override {
        std::lock_guard<std::mutex> lk(mutex_);
        auto now = clock_.now();
        if (lastGrant_) {
            const auto next = *lastGrant_ + interval_;
            if (now < next) {
                clock_.sleepUntil(next);
                now = clock_.now();
            }
        }
        lastGrant_ = now;
    }

private:
    const Duration interval_;
    IClock& clock_;
    std::mutex mutex_;
    std::optional<TimePoint> lastGrant_;
};

} // namespace

std::optional<Duration> dispatchInterval(double ratePerSecond) {
    // Bound below Duration::max() so the cast and lastGrant + interval stay in range
    constexpr double kMaxIntervalNs = 9.0e18;
    const double ns = 1e9 / ratePerSecond;
    if (!(ns >= 0.0 && ns < kMaxIntervalNs)) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<Duration>(std::chrono::duration<double, std::nano>(ns));
}

std::unique_ptr<IRateLimiter> makeRateLimiter(double ratePerSecond, IClock& clock) {
    if (ratePerSecond <= 0.0) {
        return std::make_unique<UnlimitedLimiter>();
    }
    auto interval = dispatchInterval(ratePerSecond);
    if (!interval) {
        throw std::invalid_argument("rate too low to schedule: " + std::to_string(ratePerSecond));
    }
    return std::make_unique<FixedIntervalLimiter>(*interval, clock);
}

} // namespace latbench::bench
