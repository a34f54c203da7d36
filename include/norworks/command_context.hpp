#ifndef NORWORKS_COMMAND_CONTEXT_HPP
#define NORWORKS_COMMAND_CONTEXT_HPP

#include "norworks/cli_parser.hpp"
#include "norworks/command_arguments.hpp"

#include <iosfwd>
#include <optional>
#include <stdint.h>
#include <string>
#include <vector>

namespace spinor {
class FlashDevice;
}

namespace norworks {

class CommandRegistry;
class DriverContext;

// Byte range given by --address and --length.
struct FlashRange {
    uint32_t address = 0;
    uint32_t length = 0;

    uint64_t end() const noexcept { return static_cast<uint64_t>(address) + length; }
};

// One invocation: its parsed arguments, where it prints, and the SPI
// session shared with every other command of the process.
struct CommandContext {
    CommandContext(CommandRegistry& registry, DriverContext& driver, const Command& command, ParsedCommand parsed,
                   std::ostream& out, std::ostream& err, bool verbose);

    // Opens the bus and identifies the chip on first use. The bus options of
    // this invocation are applied only if no session is open yet.
    spinor::FlashDevice& device();

    FlashRange require_range() const;
    // Both or neither of --address / --length; one alone is an error.
    std::optional<FlashRange> optional_range() const;

    CommandRegistry& registry;
    DriverContext& driver;
    const Command& command;
    const CommandArguments arguments;
    std::ostream& out;
    std::ostream& err;
    const bool verbose;
    const bool force;
};

// Parse, help, privilege check, then the handler. Returns the handler's
// status, 0 after --help, 3 for bad arguments (usage goes to err), 4 when
// the handler throws and 5 for a bus command run without root.
int run_command(CommandRegistry& registry, DriverContext& driver, const Command& command,
                const std::vector<std::string>& args, std::ostream& out, std::ostream& err, bool verbose);

} // namespace norworks

#endif // NORWORKS_COMMAND_CONTEXT_HPP
