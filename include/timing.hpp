#ifndef NORWORKS_TIMING_HPP
#define NORWORKS_TIMING_HPP

#include <stdint.h>

// Monotonic timestamp in nanoseconds (CLOCK_MONOTONIC_RAW).
uint64_t get_timestamp_ns();

// Sleep for ns nanoseconds, resuming after signal interruptions.
void sleep_ns(uint64_t ns);

#endif // NORWORKS_TIMING_HPP
