#include "gpio.hpp"
#include "logging.hpp"
#include <bcm2835.h>
#include <sched.h>
#include <sys/mman.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace {

struct HalState {
    unsigned int refcount = 0;
    bool memory_locked = false;
    bool affinity_saved = false;
    cpu_set_t saved_affinity;
};

HalState g_hal;

// NORWORKS_PIN_CPU=<n> keeps SPI polling on one core; unset leaves the affinity alone.
void pin_to_requested_cpu() {
    const char* env_cpu = std::getenv("NORWORKS_PIN_CPU");
    if (env_cpu == nullptr) {
        return;
    }
    char* end = nullptr;
    const long cpu = std::strtol(env_cpu, &end, 10);
    if (end == env_cpu || *end != '\0' || cpu < 0 || cpu >= CPU_SETSIZE) {
        LOG_HAL_WARN("ignoring invalid NORWORKS_PIN_CPU '%s'", env_cpu);
        return;
    }
    CPU_ZERO(&g_hal.saved_affinity);
    if (sched_getaffinity(0, sizeof(cpu_set_t), &g_hal.saved_affinity) != 0) {
        LOG_HAL_WARN("sched_getaffinity failed: %s", std::strerror(errno));
        return;
    }
    cpu_set_t set;
    CPU_ZERO(&set);
    CPU_SET(static_cast<unsigned>(cpu), &set);
    if (sched_setaffinity(0, sizeof(cpu_set_t), &set) != 0) {
        LOG_HAL_WARN("sched_setaffinity(%ld) failed: %s", cpu, std::strerror(errno));
        return;
    }
    g_hal.affinity_saved = true;
    LOG_HAL_DEBUG("pinned to CPU %ld", cpu);
}

void restore_affinity() {
    if (!g_hal.affinity_saved) {
        return;
    }
    if (sched_setaffinity(0, sizeof(cpu_set_t), &g_hal.saved_affinity) != 0) {
        LOG_HAL_WARN("failed to restore CPU affinity: %s", std::strerror(errno));
    }
    g_hal.affinity_saved = false;
}

} // namespace

bool gpio_init() {
    if (g_hal.refcount > 0) {
        ++g_hal.refcount;
        return true;
    }

    if (!bcm2835_init()) {
        LOG_HAL_ERROR("bcm2835_init failed, /dev/mem needs root");
        return false;
    }

    if (!g_hal.memory_locked) {
        if (mlockall(MCL_CURRENT | MCL_FUTURE) != 0) {
            LOG_HAL_WARN("mlockall failed: %s", std::strerror(errno));
        } else {
            g_hal.memory_locked = true;
        }
    }

    pin_to_requested_cpu();
    g_hal.refcount = 1;
    LOG_HAL_INFO("bcm2835 mapped");
    return true;
}

void gpio_shutdown() {
    if (g_hal.refcount == 0 || --g_hal.refcount > 0) {
        return;
    }
    restore_affinity();
    bcm2835_close();
    LOG_HAL_INFO("bcm2835 released");
}

void gpio_drive(uint8_t pin, bool high) {
    bcm2835_gpio_fsel(pin, BCM2835_GPIO_FSEL_OUTP);
    bcm2835_gpio_write(pin, high ? HIGH : LOW);
}

GpioSession::GpioSession(bool throw_on_failure)
    : active_(gpio_init())
{
    if (!active_ && throw_on_failure) {
        throw std::runtime_error("Cannot map bcm2835 peripherals. Are you running as root?");
    }
}

GpioSession::GpioSession(GpioSession&& other) noexcept
    : active_(other.active_)
{
    other.active_ = false;
}

GpioSession& GpioSession::operator=(GpioSession&& other) noexcept
{
    if (this != &other) {
        if (active_) {
            gpio_shutdown();
        }
        active_ = other.active_;
        other.active_ = false;
    }
    return *this;
}

GpioSession::~GpioSession()
{
    if (active_) {
        gpio_shutdown();
    }
}
