#include <latbench/core/clock.h>

#include <thread>

namespace latbench {

namespace {

class SteadyClock final : public IClock {
public:
    TimePoint now() const override { return MonotonicClock::now(); }

    void sleepUntil(TimePoint deadline) override { std::this_thread::sleep_until(deadline); }
};

} // namespace

IClock& steadyClock() {
    static SteadyClock clock;
    return clock;
}

} // namespace latbench
