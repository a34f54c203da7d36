#include "spinor/bcm2835_transport.hpp"

#include "logging.hpp"

#include <bcm2835.h>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <string>

namespace spinor {

Bcm2835SpiTransport::Bcm2835SpiTransport(const TransportConfig& config)
    : session_(true), config_(config) {
    validate_transport_config(config_);
    if (!bcm2835_spi_begin()) {
        throw std::runtime_error("bcm2835_spi_begin failed. Are you running as root?");
    }
    // The destructor does not run for a half-built transport.
    try {
        const bcm2835SPIChipSelect cs = config_.chip_select ? BCM2835_SPI_CS1 : BCM2835_SPI_CS0;
        bcm2835_spi_setBitOrder(BCM2835_SPI_BIT_ORDER_MSBFIRST);
        bcm2835_spi_setDataMode(BCM2835_SPI_MODE0);
        bcm2835_spi_chipSelect(cs);
        bcm2835_spi_setChipSelectPolarity(cs, LOW);

        // WP# low freezes the status register, HOLD# low pauses the bus.
        if (config_.drive_wp_high) {
            gpio_drive(GPIO_FLASH_WP, true);
        }
        if (config_.drive_hold_high) {
            gpio_drive(GPIO_FLASH_HOLD, true);
        }
        set_frequency(config_.frequency_hz);
    } catch (const std::exception&) {
        bcm2835_spi_end();
        throw;
    }
    LOG_HAL_INFO("SPI0 CE%u ready at %u Hz", static_cast<unsigned>(config_.chip_select), frequency_hz_);
}

Bcm2835SpiTransport::~Bcm2835SpiTransport() {
    bcm2835_spi_end();
    LOG_HAL_DEBUG("SPI0 released");
}

void Bcm2835SpiTransport::set_frequency(uint32_t hz) {
    if (hz == 0) {
        throw std::invalid_argument("SPI frequency must be non-zero");
    }
    bcm2835_spi_set_speed_hz(hz);
    frequency_hz_ = hz;
    LOG_HAL_DEBUG("SPI clock %u Hz", hz);
}

std::vector<uint8_t> Bcm2835SpiTransport::exchange(const std::vector<uint8_t>& command, std::size_t read_length) {
    if (read_length > kMaxPayload) {
        throw std::invalid_argument("SPI read of " + std::to_string(read_length) + " bytes exceeds payload limit");
    }
    const std::size_t total = command.size() + read_length;
    tx_.assign(total, 0x00);
    std::memcpy(tx_.data(), command.data(), command.size());
    rx_.assign(total, 0x00);
    bcm2835_spi_transfernb(reinterpret_cast<char*>(tx_.data()), reinterpret_cast<char*>(rx_.data()),
                           static_cast<uint32_t>(total));
    return std::vector<uint8_t>(rx_.begin() + static_cast<std::ptrdiff_t>(command.size()), rx_.end());
}

} // namespace spinor
