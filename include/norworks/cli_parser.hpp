#ifndef NORWORKS_CLI_PARSER_HPP
#define NORWORKS_CLI_PARSER_HPP

#include "norworks/command.hpp"
#include "norworks/command_arguments.hpp"

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace norworks {

struct ParsedCommand {
    CommandArguments arguments;
    bool help = false;
    bool force = false;
};

// --cs, --frequency and --legacy-id. Only honoured before the SPI session opens.
const std::vector<OptionSpec>& bus_options();

// Looks in the command's own options first, then in bus_options() for bus commands.
const OptionSpec* find_option(const Command& command, std::string_view long_name);

// Throws std::invalid_argument for unknown or repeated options, a missing
// value or required option, a positional count out of range, and a Modify
// command without --force.
ParsedCommand parse_command_line(const Command& command, const std::vector<std::string>& args);

void print_usage(const Command& command, std::ostream& out);

} // namespace norworks

#endif // NORWORKS_CLI_PARSER_HPP
