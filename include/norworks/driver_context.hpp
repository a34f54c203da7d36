#ifndef NORWORKS_DRIVER_CONTEXT_HPP
#define NORWORKS_DRIVER_CONTEXT_HPP

#include "spinor/clock.hpp"
#include "spinor/device.hpp"
#include "spinor/identify.hpp"
#include "spinor/transport.hpp"

#include <functional>
#include <memory>

namespace norworks {

using TransportFactory = std::function<std::unique_ptr<spinor::Transport>(const spinor::TransportConfig&)>;

// Lazily opened SPI session: the transport is created on first use and the
// chip identified once; both are released by shutdown() or destruction.
class DriverContext {
public:
    DriverContext(bool verbose, TransportFactory factory, spinor::Clock& clock = spinor::SystemClock::instance());
    ~DriverContext();

    DriverContext(const DriverContext&) = delete;
    DriverContext& operator=(const DriverContext&) = delete;

    DriverContext(DriverContext&&) = delete;
    DriverContext& operator=(DriverContext&&) = delete;

    bool verbose() const noexcept { return verbose_; }
    void set_verbose(bool verbose) noexcept { verbose_ = verbose; }

    // Only honoured before the session opens.
    spinor::TransportConfig& transport_config() noexcept { return transport_config_; }
    spinor::IdentifyOptions& identify_options() noexcept { return identify_options_; }

    spinor::Transport& require_transport();
    spinor::FlashDevice& require_device();

    bool has_transport() const noexcept { return static_cast<bool>(transport_); }
    bool has_device() const noexcept { return static_cast<bool>(device_); }

    void shutdown() noexcept;

private:
    bool verbose_;
    TransportFactory factory_;
    spinor::Clock& clock_;
    spinor::TransportConfig transport_config_;
    spinor::IdentifyOptions identify_options_;
    std::unique_ptr<spinor::Transport> transport_;
    std::unique_ptr<spinor::FlashDevice> device_;
};

} // namespace norworks

#endif // NORWORKS_DRIVER_CONTEXT_HPP
