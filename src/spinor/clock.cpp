#include "spinor/clock.hpp"
#include "timing.hpp"

namespace spinor {

uint64_t SystemClock::now_ns() const {
    return get_timestamp_ns();
}

void SystemClock::sleep_ns(uint64_t ns) {
    ::sleep_ns(ns);
}

SystemClock& SystemClock::instance() {
    static SystemClock clock;
    return clock;
}

} // namespace spinor
