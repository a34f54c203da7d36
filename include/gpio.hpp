#ifndef NORWORKS_GPIO_HPP
#define NORWORKS_GPIO_HPP

#include <stdint.h>

// Map the bcm2835 peripherals (/dev/mem) and lock the process memory.
// Reference counted: nested calls succeed without re-mapping.
bool gpio_init();

// Drop one reference; the last one restores CPU affinity and unmaps bcm2835.
void gpio_shutdown();

// Configure pin as output and drive it. Used for the active-low WP# and HOLD# lines.
void gpio_drive(uint8_t pin, bool high);

// RAII owner of one gpio_init() reference.
class GpioSession {
public:
    explicit GpioSession(bool throw_on_failure = true);
    ~GpioSession();

    GpioSession(const GpioSession&) = delete;
    GpioSession& operator=(const GpioSession&) = delete;

    GpioSession(GpioSession&& other) noexcept;
    GpioSession& operator=(GpioSession&& other) noexcept;

    bool active() const noexcept { return active_; }

private:
    bool active_ = false;
};

#endif // NORWORKS_GPIO_HPP
