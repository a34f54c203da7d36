#ifndef SPINOR_CLOCK_HPP
#define SPINOR_CLOCK_HPP

#include <stdint.h>

namespace spinor {

// Time source for completion polling.
class Clock {
public:
    virtual ~Clock() = default;

    virtual uint64_t now_ns() const = 0;
    virtual void sleep_ns(uint64_t ns) = 0;
};

// Monotonic raw clock, sleeping with clock_nanosleep.
class SystemClock : public Clock {
public:
    uint64_t now_ns() const override;
    void sleep_ns(uint64_t ns) override;

    static SystemClock& instance();
};

} // namespace spinor

#endif // SPINOR_CLOCK_HPP
