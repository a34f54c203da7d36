#include "spinor/identify.hpp"

#include "spinor/errors.hpp"
#include "logging.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace spinor {

JedecId read_jedec_id(Transport& transport, const std::vector<uint8_t>& command) {
    const std::vector<uint8_t> reply = transport.exchange(command, 3);
    if (reply.size() != 3) {
        throw FlashError("Short reply to READ ID: " + std::to_string(reply.size()) + " bytes");
    }
    JedecId jedec;
    std::copy(reply.begin(), reply.end(), jedec.bytes.begin());
    return jedec;
}

const DeviceDescriptor* match_descriptor(const JedecId& jedec) {
    for (const auto& descriptor : registered_descriptors()) {
        if (matches(descriptor, jedec)) {
            return &descriptor;
        }
    }
    return nullptr;
}

std::unique_ptr<FlashDevice> identify(Transport& transport, const IdentifyOptions& options, Clock& clock) {
    const JedecId jedec = read_jedec_id(transport, options.jedec_command);
    if (jedec.all_zero()) {
        LOG_SPINOR_WARN("READ ID returned zeros, check wiring and chip select");
        throw NoDeviceError();
    }
    const DeviceDescriptor* descriptor = match_descriptor(jedec);
    if (!descriptor) {
        LOG_SPINOR_WARN("No family matches JEDEC ID %s", jedec.to_string().c_str());
        throw UnknownDeviceError(jedec);
    }
    auto resolution = resolve(*descriptor, jedec);
    if (!resolution) {
        throw std::logic_error("descriptor matched but did not resolve");
    }
    auto device = std::make_unique<FlashDevice>(*descriptor, std::move(*resolution), transport, clock);
    device->set_spi_frequency(options.frequency_hz);
    LOG_SPINOR_INFO("Found %s (JEDEC %s, family %s) at %u Hz", device->description().c_str(),
                    jedec.to_string().c_str(), descriptor->family, device->spi_frequency());
    return device;
}

} // namespace spinor
