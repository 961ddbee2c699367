#pragma once

#include <memory>
#include <optional>

#include <latbench/core/clock.h>

namespace latbench::bench {

/**
 * Paces dispatch. acquire() returns when the caller may start the next request.
 */
class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    /// Blocks until the next dispatch is permitted.
    virtual void acquire() = 0;
};

/// Spacing between grants for ratePerSecond > 0; nullopt when it does not fit in a Duration.
std::optional<Duration> dispatchInterval(double ratePerSecond);

/**
 * Limiter for `ratePerSecond` requests per second: consecutive grants are at least
 * 1/ratePerSecond apart. ratePerSecond <= 0 returns a limiter that never waits.
 * Throws std::invalid_argument when dispatchInterval() has no value for the rate.
 */
std::unique_ptr<IRateLimiter> makeRateLimiter(double ratePerSecond, IClock& clock = steadyClock());

} // namespace latbench::bench
