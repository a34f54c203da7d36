#include "spinor/transport.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace spinor {

void validate_transport_config(const TransportConfig& config) {
    if (config.chip_select > 1) {
        throw std::invalid_argument("SPI0 chip select must be 0 or 1");
    }
    if (config.frequency_hz == 0) {
        throw std::invalid_argument("SPI frequency must be non-zero");
    }
}

TransportConfig transport_config_from_env(TransportConfig base) {
    const char* env_cs = std::getenv("NORWORKS_SPI_CS");
    if (!env_cs) {
        return base;
    }
    if (std::strcmp(env_cs, "0") == 0 || std::strcmp(env_cs, "1") == 0) {
        base.chip_select = static_cast<uint8_t>(env_cs[0] - '0');
    } else {
        std::cerr << "Warning: invalid NORWORKS_SPI_CS value '" << env_cs << "', keeping CE"
                  << static_cast<unsigned>(base.chip_select) << std::endl;
    }
    return base;
}

} // namespace spinor
