#ifndef SPINOR_IDENTIFY_HPP
#define SPINOR_IDENTIFY_HPP

#include "spinor/clock.hpp"
#include "spinor/descriptor.hpp"
#include "spinor/device.hpp"
#include "spinor/transport.hpp"

#include <memory>
#include <stdint.h>
#include <vector>

namespace spinor {

// JEDEC READ ID.
inline const std::vector<uint8_t> kJedecIdCommand{0x9F};
// READ ID at address 0, for parts without JEDEC support (SST25VFxxxA).
inline const std::vector<uint8_t> kLegacyIdCommand{0x90, 0x00, 0x00, 0x00};

struct IdentifyOptions {
    std::vector<uint8_t> jedec_command = kJedecIdCommand;
    uint32_t frequency_hz = 0;  // 0: device maximum
};

JedecId read_jedec_id(Transport& transport, const std::vector<uint8_t>& command = kJedecIdCommand);

// First registered descriptor accepting the identifier, or nullptr.
const DeviceDescriptor* match_descriptor(const JedecId& jedec);

// Reads the identifier, dispatches, builds the device and sets the bus frequency.
// Throws NoDeviceError, UnknownDeviceError, or RequestError from the family checks.
std::unique_ptr<FlashDevice> identify(Transport& transport, const IdentifyOptions& options = {},
                                      Clock& clock = SystemClock::instance());

} // namespace spinor

#endif // SPINOR_IDENTIFY_HPP
