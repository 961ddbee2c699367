#pragma once

#include <chrono>

namespace latbench {

using MonotonicClock = std::chrono::steady_clock;
using TimePoint = MonotonicClock::time_point;
using Duration = std::chrono::nanoseconds;
using WallTimePoint = std::chrono::system_clock::time_point;

/**
 * Monotonic time source used for every latency measurement and rate decision.
 * Tests substitute a manual clock so pacing can be asserted without sleeping.
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual TimePoint now() const = 0;

    /// Block the calling thread until now() >= deadline.
    virtual void sleepUntil(TimePoint deadline) = 0;
};

/// Process-wide clock backed by std::chrono::steady_clock.
IClock& steadyClock();

inline double toSeconds(Duration d) {
    return std::chrono::duration<double>(d).count();
}

inline double toMillis(Duration d) {
    return std::chrono::duration<double, std::milli>(d).count();
}

} // namespace latbench
