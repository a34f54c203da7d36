#include "norworks/driver_context.hpp"

#include "logging.hpp"

#include <stdexcept>
#include <utility>

namespace norworks {

DriverContext::DriverContext(bool verbose, TransportFactory factory, spinor::Clock& clock)
    : verbose_(verbose),
      factory_(std::move(factory)),
      clock_(clock),
      transport_config_(spinor::transport_config_from_env()) {}

DriverContext::~DriverContext() {
    shutdown();
}

spinor::Transport& DriverContext::require_transport() {
    if (!transport_) {
        if (!factory_) {
            throw std::runtime_error("No SPI transport available in this build");
        }
        transport_ = factory_(transport_config_);
        if (!transport_) {
            throw std::runtime_error("SPI transport factory returned nothing");
        }
    }
    return *transport_;
}

spinor::FlashDevice& DriverContext::require_device() {
    if (!device_) {
        spinor::Transport& transport = require_transport();
        // A failed identification leaves the bus open so the next attempt can retry with other options.
        device_ = spinor::identify(transport, identify_options_, clock_);
    }
    return *device_;
}

void DriverContext::shutdown() noexcept {
    // Device first: it refers to the transport.
    device_.reset();
    if (transport_) {
        transport_.reset();
        LOG_HAL_DEBUG("SPI session closed");
    }
}

} // namespace norworks
