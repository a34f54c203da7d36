#include "timing.hpp"
#include <errno.h>
#include <time.h>

uint64_t get_timestamp_ns() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC_RAW, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1000000000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

void sleep_ns(uint64_t ns) {
    if (ns == 0) {
        return;
    }
    struct timespec req;
    req.tv_sec = static_cast<time_t>(ns / 1000000000ULL);
    req.tv_nsec = static_cast<long>(ns % 1000000000ULL);
    struct timespec rem;
    // clock_nanosleep returns the error number instead of setting errno.
    while (clock_nanosleep(CLOCK_MONOTONIC, 0, &req, &rem) == EINTR) {
        req = rem;
    }
}
