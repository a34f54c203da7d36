#include "spinor/errors.hpp"

#include <cstdio>

namespace spinor {

namespace {
std::string hex_address(uint32_t address) {
    char text[16];
    std::snprintf(text, sizeof(text), "0x%06x", address);
    return text;
}
}

UnknownDeviceError::UnknownDeviceError(const JedecId& jedec)
    : NotSupportedError("Unknown flash device, JEDEC ID " + jedec.to_string()),
      jedec_(jedec) {}

NoDeviceError::NoDeviceError()
    : FlashError("No serial flash detected (JEDEC ID reads as zero)") {}

TimeoutError::TimeoutError(TimingKind kind, unsigned polls, uint64_t elapsed_ns)
    : FlashError(std::string("Command timeout waiting for ") + to_string(kind) + " completion (" +
                 std::to_string(polls) + " polls, " + std::to_string(elapsed_ns / 1000) + " us)"),
      kind_(kind),
      polls_(polls),
      elapsed_ns_(elapsed_ns) {}

IntegrityError::IntegrityError(uint32_t address, uint32_t length, uint32_t bad_bytes)
    : FlashError(std::to_string(bad_bytes) + " bytes are not erased in [" + hex_address(address) + ", " +
                 hex_address(address + length) + ")"),
      bad_bytes_(bad_bytes) {}

} // namespace spinor
