#include "core/clock.hpp"

namespace gbce {

Timestamp SystemClock::now() const {
    return std::chrono::system_clock::now();
}

const SystemClock& SystemClock::instance() {
    static const SystemClock clock;
    return clock;
}

ManualClock::ManualClock()
    : ticks_(0)
{}

ManualClock::ManualClock(Timestamp start)
    : ticks_(start.time_since_epoch().count())
{}

Timestamp ManualClock::now() const {
    return Timestamp(Timestamp::duration(ticks_.load(std::memory_order_acquire)));
}

void ManualClock::set_time(Timestamp t) {
    ticks_.store(t.time_since_epoch().count(), std::memory_order_release);
}

void ManualClock::advance(Timestamp::duration delta) {
    ticks_.fetch_add(delta.count(), std::memory_order_acq_rel);
}

}  // namespace gbce
