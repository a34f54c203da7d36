#include "norworks/cli_parser.hpp"

#include <optional>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace norworks {

namespace {

bool is_option_token(const std::string& token) {
    return token.size() >= 2 && token[0] == '-';
}

// Splits "--name=value" / "-nvalue" into the spec it names and an inline value.
struct OptionToken {
    const OptionSpec* spec = nullptr;
    std::string spelled;
    std::optional<std::string> inline_value;
};

OptionToken lookup(const Command& command, const std::string& token) {
    OptionToken result;
    if (token[1] == '-') {
        const std::string body = token.substr(2);
        const auto equals = body.find('=');
        const std::string name = body.substr(0, equals);
        result.spelled = "--" + name;
        result.spec = find_option(command, name);
        if (equals != std::string::npos) {
            result.inline_value = body.substr(equals + 1);
        }
    } else {
        result.spelled = token.substr(0, 2);
        auto matches_short = [&](const std::vector<OptionSpec>& options) -> const OptionSpec* {
            for (const auto& option : options) {
                if (option.short_name == token[1]) return &option;
            }
            return nullptr;
        };
        result.spec = matches_short(command.options);
        if (result.spec == nullptr && command.uses_bus()) {
            result.spec = matches_short(bus_options());
        }
        if (token.size() > 2) {
            result.inline_value = token.substr(2);
        }
    }
    if (result.spec == nullptr) {
        throw std::invalid_argument("Unknown option '" + result.spelled + "'");
    }
    return result;
}

void check_positionals(const Command& command, std::size_t count) {
    if (count < command.min_positionals) {
        throw std::invalid_argument(command.name + " expects at least " + std::to_string(command.min_positionals) +
                                    " positional argument(s)");
    }
    if (command.max_positionals != kUnboundedPositionals && count > command.max_positionals) {
        throw std::invalid_argument(command.name + " takes at most " + std::to_string(command.max_positionals) +
                                    " positional argument(s)");
    }
}

void print_option(const OptionSpec& option, std::ostream& out) {
    out << "  --" << option.long_name;
    if (option.short_name != '\0') {
        out << ", -" << option.short_name;
    }
    if (option.takes_value()) {
        out << " <" << option.value_name << ">";
    }
    out << (option.required ? " (required)\n" : "\n");
    if (!option.help.empty()) {
        out << "      " << option.help << "\n";
    }
}

} // namespace

const char* to_string(FlashAccess access) {
    switch (access) {
    case FlashAccess::None: return "none";
    case FlashAccess::Read: return "read";
    case FlashAccess::Modify: return "modify";
    }
    return "?";
}

const std::vector<OptionSpec>& bus_options() {
    static const std::vector<OptionSpec> options{
        {"cs", '\0', "0|1", false, "SPI0 chip select (default CE0 or NORWORKS_SPI_CS)."},
        {"frequency", '\0', "hz", false, "Requested SPI clock; clamped to the device maximum."},
        {"legacy-id", '\0', "", false, "Identify with READ ID 0x90 for parts without JEDEC ID (SST25VFxxxA)."},
    };
    return options;
}

const OptionSpec* find_option(const Command& command, std::string_view long_name) {
    for (const auto& option : command.options) {
        if (option.long_name == long_name) return &option;
    }
    if (command.uses_bus()) {
        for (const auto& option : bus_options()) {
            if (option.long_name == long_name) return &option;
        }
    }
    return nullptr;
}

ParsedCommand parse_command_line(const Command& command, const std::vector<std::string>& args) {
    CommandArguments::OptionMap values;
    std::vector<std::string> positionals;
    ParsedCommand parsed;

    bool options_done = false;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& token = args[i];
        if (options_done || !is_option_token(token)) {
            positionals.push_back(token);
            options_done = options_done || command.forwards_trailing_arguments;
            continue;
        }
        if (token == "--") {
            options_done = true;
        } else if (token == "--help" || token == "-h") {
            parsed.help = true;
        } else if (token == "--force" || token == "-f") {
            parsed.force = true;
        } else {
            OptionToken option = lookup(command, token);
            const std::string& key = option.spec->long_name;
            if (values.count(key) != 0U) {
                throw std::invalid_argument("Option '--" + key + "' given more than once");
            }
            if (!option.spec->takes_value()) {
                if (option.inline_value) {
                    throw std::invalid_argument("Option '" + option.spelled + "' is a flag");
                }
                values[key].push_back("true");
                continue;
            }
            if (!option.inline_value) {
                if (i + 1 >= args.size()) {
                    throw std::invalid_argument("Option '" + option.spelled + "' needs <" +
                                                option.spec->value_name + ">");
                }
                option.inline_value = args[++i];
            }
            values[key].push_back(std::move(*option.inline_value));
        }
    }

    if (!parsed.help) {
        for (const auto& option : command.options) {
            if (option.required && values.count(option.long_name) == 0U) {
                throw std::invalid_argument("Missing required option '--" + option.long_name + "'");
            }
        }
        check_positionals(command, positionals.size());
        if (command.needs_force() && !parsed.force) {
            throw std::invalid_argument(command.name + " modifies flash contents; add --force to proceed");
        }
    }
    parsed.arguments = CommandArguments{std::move(values), std::move(positionals)};
    return parsed;
}

void print_usage(const Command& command, std::ostream& out) {
    out << "Usage: " << command.usage << "\n";
    if (!command.summary.empty()) {
        out << command.summary << "\n";
    }
    for (std::size_t i = 0; i < command.aliases.size(); ++i) {
        out << (i == 0 ? "Aliases: " : ", ") << command.aliases[i];
    }
    out << (command.aliases.empty() ? "" : "\n") << "Flash access: " << to_string(command.access) << "\n";

    out << "\nOptions:\n";
    for (const auto& option : command.options) {
        print_option(option, out);
    }
    if (command.needs_force()) {
        out << "  --force, -f\n      Confirm an operation that modifies flash contents.\n";
    }
    out << "  --help, -h\n      Show command-specific help.\n";
    if (command.uses_bus()) {
        out << "\nBus options:\n";
        for (const auto& option : bus_options()) {
            print_option(option, out);
        }
    }
}

} // namespace norworks
