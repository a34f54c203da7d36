// Clock that only moves when something sleeps on it.
#ifndef NORWORKS_TESTS_MANUAL_CLOCK_HPP
#define NORWORKS_TESTS_MANUAL_CLOCK_HPP

#include "spinor/clock.hpp"

#include <stdint.h>
#include <vector>

namespace sim {

class ManualClock : public spinor::Clock {
public:
    uint64_t now_ns() const override { return now; }
    void sleep_ns(uint64_t ns) override {
        sleeps.push_back(ns);
        now += ns;
    }

    uint64_t now = 1000;
    std::vector<uint64_t> sleeps;
};

} // namespace sim

#endif // NORWORKS_TESTS_MANUAL_CLOCK_HPP
