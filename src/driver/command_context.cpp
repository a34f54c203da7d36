#include "norworks/command_context.hpp"

#include "norworks/driver_context.hpp"
#include "spinor/device.hpp"
#include "spinor/identify.hpp"

#include <exception>
#include <ostream>
#include <stdexcept>
#include <utility>
#include <unistd.h>

namespace norworks {

CommandContext::CommandContext(CommandRegistry& registry_ref, DriverContext& driver_ref, const Command& command_ref,
                               ParsedCommand parsed, std::ostream& out_stream, std::ostream& err_stream,
                               bool verbose_flag)
    : registry(registry_ref),
      driver(driver_ref),
      command(command_ref),
      arguments(std::move(parsed.arguments)),
      out(out_stream),
      err(err_stream),
      verbose(verbose_flag),
      force(parsed.force) {}

spinor::FlashDevice& CommandContext::device() {
    if (!driver.has_device()) {
        if (arguments.has("cs")) {
            const int64_t cs = arguments.value_as_int("cs", 0);
            if (cs != 0 && cs != 1) {
                throw std::invalid_argument("--cs must be 0 or 1");
            }
            driver.transport_config().chip_select = static_cast<uint8_t>(cs);
        }
        if (arguments.has("frequency")) {
            driver.identify_options().frequency_hz = arguments.require_size("frequency");
        }
        if (arguments.has("legacy-id")) {
            driver.identify_options().jedec_command = spinor::kLegacyIdCommand;
        }
    }
    return driver.require_device();
}

FlashRange CommandContext::require_range() const {
    return FlashRange{arguments.require_size("address"), arguments.require_size("length")};
}

std::optional<FlashRange> CommandContext::optional_range() const {
    if (!arguments.has("address") && !arguments.has("length")) {
        return std::nullopt;
    }
    return require_range();
}

int run_command(CommandRegistry& registry, DriverContext& driver, const Command& command,
                const std::vector<std::string>& args, std::ostream& out, std::ostream& err, bool verbose) {
    ParsedCommand parsed;
    try {
        parsed = parse_command_line(command, args);
    } catch (const std::invalid_argument& ex) {
        err << "Argument error: " << ex.what() << "\n";
        print_usage(command, err);
        return 3;
    }
    if (parsed.help) {
        print_usage(command, out);
        return 0;
    }
    if (command.uses_bus() && ::geteuid() != 0) {
        err << "Command '" << command.name << "' needs root for SPI access. Please rerun with sudo.\n";
        return 5;
    }

    CommandContext context(registry, driver, command, std::move(parsed), out, err, verbose);
    try {
        return command.handler(context);
    } catch (const std::exception& ex) {
        err << "Command '" << command.name << "' failed: " << ex.what() << "\n";
    }
    return 4;
}

} // namespace norworks
