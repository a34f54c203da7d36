#ifndef SPINOR_TRANSPORT_HPP
#define SPINOR_TRANSPORT_HPP

#include "hardware_locations.hpp"

#include <cstddef>
#include <stdint.h>
#include <vector>

namespace spinor {

// Byte-exchange channel bound to one chip-select line. Each exchange is a
// single chip-select assertion: the command bytes are clocked out, then
// read_length bytes are clocked in.
class Transport {
public:
    virtual ~Transport() = default;

    virtual std::vector<uint8_t> exchange(const std::vector<uint8_t>& command, std::size_t read_length = 0) = 0;
    virtual void set_frequency(uint32_t hz) = 0;
    virtual uint32_t frequency() const = 0;

    // Largest read_length accepted by a single exchange.
    virtual std::size_t max_payload() const = 0;
};

struct TransportConfig {
    uint8_t chip_select = NORWORKS_DEFAULT_CHIP_SELECT;  // 0 -> CE0, 1 -> CE1
    uint32_t frequency_hz = 1000000;                    // until identify() picks the device rate
    bool drive_wp_high = true;
    bool drive_hold_high = true;
};

// Throws std::invalid_argument for a chip select other than 0/1 or a zero clock.
void validate_transport_config(const TransportConfig& config);

// NORWORKS_SPI_CS overrides the chip select when set to 0 or 1.
TransportConfig transport_config_from_env(TransportConfig base = {});

} // namespace spinor

#endif // SPINOR_TRANSPORT_HPP
