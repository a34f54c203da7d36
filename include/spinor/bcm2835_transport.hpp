#ifndef SPINOR_BCM2835_TRANSPORT_HPP
#define SPINOR_BCM2835_TRANSPORT_HPP

#include "gpio.hpp"
#include "hardware_locations.hpp"
#include "spinor/transport.hpp"

#include <cstddef>
#include <stdint.h>
#include <vector>

namespace spinor {

// SPI0 master on the Raspberry Pi header, MODE0, MSB first, chip select active low.
class Bcm2835SpiTransport : public Transport {
public:
    static constexpr std::size_t kMaxPayload = 64 * 1024;

    explicit Bcm2835SpiTransport(const TransportConfig& config = {});
    ~Bcm2835SpiTransport() override;

    Bcm2835SpiTransport(const Bcm2835SpiTransport&) = delete;
    Bcm2835SpiTransport& operator=(const Bcm2835SpiTransport&) = delete;

    std::vector<uint8_t> exchange(const std::vector<uint8_t>& command, std::size_t read_length = 0) override;
    void set_frequency(uint32_t hz) override;
    uint32_t frequency() const override { return frequency_hz_; }
    std::size_t max_payload() const override { return kMaxPayload; }

    uint8_t chip_select() const noexcept { return config_.chip_select; }

private:
    GpioSession session_;
    TransportConfig config_;
    uint32_t frequency_hz_ = 0;
    std::vector<uint8_t> tx_;
    std::vector<uint8_t> rx_;
};

} // namespace spinor

#endif // SPINOR_BCM2835_TRANSPORT_HPP
