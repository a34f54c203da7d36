#ifndef SPINOR_ERRORS_HPP
#define SPINOR_ERRORS_HPP

#include "spinor/types.hpp"

#include <stdexcept>
#include <stdint.h>
#include <string>

namespace spinor {

// Root of every failure raised by the SPI NOR layer.
class FlashError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Capability, block kind, timing kind or write mode absent from the matched device.
class NotSupportedError : public FlashError {
public:
    using FlashError::FlashError;
};

// JEDEC identifier read back fine but no registered family accepts it.
class UnknownDeviceError : public NotSupportedError {
public:
    explicit UnknownDeviceError(const JedecId& jedec);

    const JedecId& jedec() const noexcept { return jedec_; }

private:
    JedecId jedec_;
};

// Nothing answered on the bus (JEDEC identifier all zero).
class NoDeviceError : public FlashError {
public:
    NoDeviceError();
};

// The busy bit did not clear within typical + maximum time. The chip state is undefined afterwards.
class TimeoutError : public FlashError {
public:
    TimeoutError(TimingKind kind, unsigned polls, uint64_t elapsed_ns);

    TimingKind kind() const noexcept { return kind_; }
    unsigned polls() const noexcept { return polls_; }
    uint64_t elapsed_ns() const noexcept { return elapsed_ns_; }

private:
    TimingKind kind_;
    unsigned polls_;
    uint64_t elapsed_ns_;
};

// Alignment or argument violation, detected before any command is issued.
class ValueError : public FlashError {
public:
    using FlashError::FlashError;
};

class OutOfRangeError : public ValueError {
public:
    using ValueError::ValueError;
};

// The command ran but the chip did not end up in the requested state.
class RequestError : public FlashError {
public:
    using FlashError::FlashError;
};

// Verification after erase found bytes that are not 0xFF.
class IntegrityError : public FlashError {
public:
    IntegrityError(uint32_t address, uint32_t length, uint32_t bad_bytes);

    uint32_t bad_bytes() const noexcept { return bad_bytes_; }

private:
    uint32_t bad_bytes_;
};

} // namespace spinor

#endif // SPINOR_ERRORS_HPP
