#include "norworks/cli_parser.hpp"
#include "norworks/command_context.hpp"
#include "norworks/command_registry.hpp"
#include "norworks/commands.hpp"
#include "norworks/driver_context.hpp"
#include "spinor/bcm2835_transport.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr const char* kDriverBanner = "norworks";
constexpr const char* kDriverVersion = "0.1.0";

void print_global_help(const norworks::CommandRegistry& registry, std::ostream& out, bool verbose) {
    out << kDriverBanner << " (" << kDriverVersion << ")" << (verbose ? " [verbose]" : "") << "\n";
    out << "Usage: norworks [--verbose] <command> [options]\n";
    out << "       norworks help <command>\n\n";
    out << "Commands:\n";
    for (const auto& command : registry.commands()) {
        out << "  " << command.name;
        for (std::size_t i = 0; i < command.aliases.size(); ++i) {
            out << (i == 0 ? " (" : ", ") << command.aliases[i];
        }
        out << (command.aliases.empty() ? "" : ")") << "\n";
        if (!command.summary.empty()) {
            out << "    " << command.summary << "\n";
        }
    }
}

int help_command(norworks::CommandContext& context) {
    if (context.arguments.positional_count() == 0) {
        print_global_help(context.registry, context.out, context.verbose);
        return 0;
    }
    const std::string& target = context.arguments.positional(0);
    const norworks::Command* command = context.registry.find(target);
    if (command == nullptr) {
        context.err << "Unknown command: " << target << "\n";
        return 1;
    }
    norworks::print_usage(*command, context.out);
    return 0;
}

int version_command(norworks::CommandContext& context) {
    context.out << kDriverBanner << "\n";
    context.out << "Version: " << kDriverVersion << "\n";
    context.out << "Verbose: " << (context.verbose ? "yes" : "no") << "\n";
    context.out << "Chip select: CE" << static_cast<unsigned>(context.driver.transport_config().chip_select) << "\n";
    context.out << "Session active: " << (context.driver.has_device() ? "yes" : "no") << "\n";
    return 0;
}

void register_builtin_commands(norworks::CommandRegistry& registry) {
    registry.register_command({
        .name = "help",
        .aliases = {"?"},
        .summary = "List the commands, or show the options of one.",
        .usage = "norworks help [command]",
        .options = {},
        .min_positionals = 0,
        .max_positionals = 1,
        .access = norworks::FlashAccess::None,
        .handler = help_command,
    });

    registry.register_command({
        .name = "version",
        .aliases = {"about"},
        .summary = "Print the driver version, the configured chip select and whether a session is open.",
        .usage = "norworks version",
        .options = {},
        .access = norworks::FlashAccess::None,
        .handler = version_command,
    });
}

std::unique_ptr<spinor::Transport> open_spi(const spinor::TransportConfig& config) {
    return std::make_unique<spinor::Bcm2835SpiTransport>(config);
}

} // namespace

int main(int argc, char** argv) {
    bool verbose = false;
    bool global_help = false;
    std::string command_name;
    std::vector<std::string> raw_args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (command_name.empty()) {
            if (arg == "--verbose" || arg == "-v") {
                verbose = true;
                continue;
            }
            if (arg == "--help" || arg == "-h") {
                global_help = true;
                continue;
            }
            command_name = std::move(arg);
        } else {
            raw_args.emplace_back(std::move(arg));
        }
    }

    norworks::CommandRegistry registry;
    register_builtin_commands(registry);
    norworks::commands::register_flash_commands(registry);
    norworks::commands::register_script_commands(registry);

    if (command_name.empty()) {
        if (global_help) {
            print_global_help(registry, std::cout, verbose);
            return 0;
        }
        std::cerr << "No command specified. Use --help to list commands.\n";
        return 1;
    }

    const norworks::Command* command = registry.find(command_name);
    if (command == nullptr) {
        std::cerr << "Unknown command: " << command_name << "\n";
        print_global_help(registry, std::cerr, verbose);
        return 2;
    }

    norworks::DriverContext driver(verbose, open_spi);
    return norworks::run_command(registry, driver, *command, raw_args, std::cout, std::cerr, verbose);
}
