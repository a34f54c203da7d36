#include "norworks/cli_parser.hpp"
#include "norworks/command_context.hpp"
#include "norworks/command_registry.hpp"
#include "norworks/commands.hpp"
#include "norworks/driver_context.hpp"
#include "spinor/errors.hpp"

#include "manual_clock.hpp"
#include "sim_flash.hpp"

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

using namespace norworks;

namespace {

struct Output {
    std::ostringstream out;
    std::ostringstream err;
};

// Same flow as the executable: parse, then run the handler.
int run(CommandRegistry& registry, DriverContext& driver, const std::string& name,
        const std::vector<std::string>& args, Output& output, bool verbose = false) {
    const Command* command = registry.find(name);
    if (command == nullptr) {
        throw std::invalid_argument("no such command: " + name);
    }
    CommandContext context(registry, driver, *command, parse_command_line(*command, args), output.out, output.err,
                           verbose);
    return command->handler(context);
}

template <typename Error, typename Fn>
bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}

spinor::JedecId id_bytes(uint8_t a, uint8_t b, uint8_t c) {
    return spinor::JedecId{{a, b, c}};
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

void parser_and_registry() {
    CommandRegistry registry;

    Command parse_cmd{
        .name = "sample",
        .aliases = {"alias"},
        .summary = "",
        .usage = "norworks sample --count <n> <a> [b]",
        .options = {
            OptionSpec{"count", 'c', "n", true, ""},
            OptionSpec{"address", 'a', "addr", false, ""},
        },
        .min_positionals = 1,
        .max_positionals = 2,
        .access = FlashAccess::None,
        .handler = [](CommandContext&) { return 0; }
    };

    Command& stored = registry.register_command(parse_cmd);

    ParsedCommand parsed = parse_command_line(stored, {"--count", "5", "-a", "4K", "alpha", "beta"});
    assert(!parsed.help);
    assert(!parsed.force);
    assert(parsed.arguments.value("count") == std::string("5"));
    assert(parsed.arguments.require_int("count") == 5);
    assert(parsed.arguments.require_size("address") == 0x1000);
    assert(parsed.arguments.positional_count() == 2);
    assert(parsed.arguments.positional(1) == "beta");

    assert(registry.find("alias") == &stored);
    assert(registry.find("SAMPLE") == &stored);
    assert(registry.find("missing") == nullptr);

    assert(throws<std::invalid_argument>([&] { (void)parse_command_line(stored, {}); }));
    assert(throws<std::invalid_argument>([&] { (void)parse_command_line(stored, {"--count", "1", "x", "y", "z"}); }));
    assert(throws<std::invalid_argument>([&] { (void)parse_command_line(stored, {"--count", "1", "--bogus", "x"}); }));
    assert(parse_command_line(stored, {"--help"}).help);
    assert(throws<std::invalid_argument>([&] { (void)parse_command_line(stored, {"-c", "1", "-c", "2", "x"}); }));
    // Bus options belong to commands that touch the chip.
    assert(throws<std::invalid_argument>([&] { (void)parse_command_line(stored, {"-c", "1", "--cs", "1", "x"}); }));
    assert(find_option(stored, "frequency") == nullptr);

    const ParsedCommand no_address = parse_command_line(stored, {"--count", "1", "x"});
    assert(throws<std::invalid_argument>([&] { (void)no_address.arguments.require_size("address"); }));
    assert(no_address.arguments.value_as_size("address", 7) == 7);

    Command destructive{
        .name = "danger",
        .aliases = {},
        .summary = "",
        .usage = "norworks danger",
        .options = {},
        .min_positionals = 0,
        .max_positionals = 0,
        .access = FlashAccess::Modify,
        .handler = [](CommandContext&) { return 0; }
    };
    Command& stored_destructive = registry.register_command(destructive);

    bool refused = false;
    try {
        (void)parse_command_line(stored_destructive, {});
    } catch (const std::invalid_argument& ex) {
        refused = contains(ex.what(), "--force");
    }
    assert(refused);
    const ParsedCommand forced = parse_command_line(stored_destructive, {"-f", "--cs=1", "--legacy-id"});
    assert(forced.force);
    assert(forced.arguments.value("cs") == std::string("1"));
    assert(forced.arguments.has("legacy-id"));
    assert(find_option(stored_destructive, "frequency") != nullptr);

    std::ostringstream usage;
    print_usage(stored_destructive, usage);
    assert(contains(usage.str(), "Flash access: modify"));
    assert(contains(usage.str(), "--force, -f"));
    assert(contains(usage.str(), "Bus options:"));
    assert(contains(usage.str(), "--frequency <hz>"));

    // Sizes: decimal, hex, binary suffixes.
    assert(parse_size("4096") == 4096);
    assert(parse_size("0x1000") == 0x1000);
    assert(parse_size("4K") == 4096 && parse_size("4KiB") == 4096);
    assert(parse_size("2M") == 2u * 1024 * 1024 && parse_size("2mib") == 2u * 1024 * 1024);
    assert(throws<std::invalid_argument>([] { (void)parse_size(""); }));
    assert(throws<std::invalid_argument>([] { (void)parse_size("12Q"); }));
    assert(throws<std::invalid_argument>([] { (void)parse_size("-4"); }));
}

void flash_commands() {
    sim::ManualClock clock;
    sim::SimFlash chip("W25x", id_bytes(0xEF, 0x40, 0x14));
    int opened = 0;
    uint8_t seen_cs = 0xFF;
    DriverContext driver(false,
                         [&](const spinor::TransportConfig& config) -> std::unique_ptr<spinor::Transport> {
                             ++opened;
                             seen_cs = config.chip_select;
                             return std::make_unique<sim::SimLink>(chip);
                         },
                         clock);

    CommandRegistry registry;
    commands::register_flash_commands(registry);
    assert(registry.find("probe") == registry.find("identify"));
    assert(registry.find("uid") == registry.find("unique-id"));

    // The catalogue needs no session.
    {
        Output output;
        assert(run(registry, driver, "list-devices", {}, output) == 0);
        const std::string text = output.out.str();
        assert(text.rfind("SST25", 0) == 0);
        assert(std::count(text.begin(), text.end(), '\n') == 13);
        assert(!driver.has_transport());

        Output verbose;
        assert(run(registry, driver, "devices", {}, verbose, true) == 0);
        assert(contains(verbose.out.str(), "ef:40:16  W25Q32 4 MiB"));
    }

    {
        Output output;
        assert(throws<std::invalid_argument>([&] { run(registry, driver, "identify", {"--cs", "2"}, output); }));
        assert(opened == 0);

        assert(run(registry, driver, "identify", {"--cs", "1"}, output) == 0);
        assert(opened == 1 && seen_cs == 1);
        const std::string text = output.out.str();
        assert(contains(text, "Family: W25x (Winbond)"));
        assert(contains(text, "Capacity: 1048576 bytes"));
        assert(contains(text, "Write mode: page program"));
        assert(contains(text, "unique-id"));
    }

    // Later commands reuse the open session.
    {
        Output output;
        assert(run(registry, driver, "status", {}, output) == 0);
        assert(contains(output.out.str(), "State: ready"));
        assert(opened == 1);
    }

    {
        chip.fill(0x100, 0x110, 0x00);
        for (uint32_t i = 0; i < 16; ++i) {
            chip.memory[0x100 + i] = static_cast<uint8_t>('A' + i);
        }
        Output output;
        assert(run(registry, driver, "read", {"--address", "0x100", "--length", "16"}, output) == 0);
        assert(output.out.str() == "00000100: 41 42 43 44 45 46 47 48  49 4A 4B 4C 4D 4E 4F 50  |ABCDEFGHIJKLMNOP|\n");

        Output slow;
        assert(run(registry, driver, "dump", {"-a", "0x100", "-l", "16", "--slow"}, slow) == 0);
        assert(slow.out.str() == output.out.str());
        assert(chip.count_opcode(0x03) == 1);
    }

    const auto input = std::filesystem::temp_directory_path() / "norworks_driver_cli.bin";
    {
        std::ofstream file(input, std::ios::binary);
        file << "hello";
    }
    {
        Output output;
        assert(throws<std::invalid_argument>(
            [&] { run(registry, driver, "write", {"--address", "0x1000", "--input", input.string()}, output); }));
        assert(run(registry, driver, "write",
                   {"--address", "0x1000", "--input", input.string(), "--verify", "--force"}, output) == 0);
        assert(contains(output.out.str(), "Programmed 5 bytes at 0x001000"));
        assert(contains(output.out.str(), "Verified"));
        assert(chip.memory[0x1000] == 'h' && chip.memory[0x1004] == 'o');

        // Programming over unerased bytes only clears bits; verification reports it.
        Output mismatch;
        {
            std::ofstream file(input, std::ios::binary);
            file << "world";
        }
        assert(run(registry, driver, "program",
                   {"-a", "0x1000", "-i", input.string(), "--verify", "--force"}, mismatch) == 1);
        assert(contains(mismatch.err.str(), "Verification failed at 0x001000"));
    }
    std::filesystem::remove(input);

    {
        Output output;
        assert(run(registry, driver, "erase", {"--address", "0x1000", "--length", "4K", "--verify", "--force"},
                   output) == 0);
        assert(output.out.str() == "Erased 4096 bytes at 0x001000 (verified)\n");
        assert(chip.all_erased(0x1000, 0x2000));
        assert(throws<spinor::ValueError>(
            [&] { run(registry, driver, "erase", {"-a", "0x1100", "-l", "4K", "-f"}, output); }));
        assert(throws<std::invalid_argument>(
            [&] { run(registry, driver, "erase", {"--all", "-a", "0", "-f"}, output); }));
    }

    {
        Output output;
        const std::size_t before = chip.log.size();
        assert(run(registry, driver, "plan-erase", {"--address", "0x7000", "--length", "0x1000"}, output) == 0);
        assert(contains(output.out.str(), "1 x 4 KiB"));
        assert(contains(output.out.str(), "opcode 0x20"));
        assert(chip.log.size() == before);

        Output empty;
        assert(run(registry, driver, "plan-erase", {"-a", "0", "-l", "0"}, empty) == 0);
        assert(empty.out.str() == "Nothing to erase\n");
    }

    {
        Output output;
        assert(run(registry, driver, "lock", {"--force"}, output) == 0);
        assert(chip.status_bits == 0x1C);
        assert(throws<spinor::NotSupportedError>(
            [&] { run(registry, driver, "unlock", {"-a", "0", "-l", "64K", "-f"}, output); }));
        assert(run(registry, driver, "unlock", {"--force"}, output) == 0);
        assert(chip.status_bits == 0x00);
    }

    {
        Output output;
        assert(run(registry, driver, "unique-id", {}, output) == 0);
        assert(output.out.str() == "deadbeef01234567\n");
    }

    driver.shutdown();
    assert(!driver.has_device() && !driver.has_transport());
}

void frequency_option() {
    sim::ManualClock clock;
    sim::SimFlash chip("W25x", id_bytes(0xEF, 0x40, 0x14));
    DriverContext driver(false,
                         [&](const spinor::TransportConfig&) -> std::unique_ptr<spinor::Transport> {
                             return std::make_unique<sim::SimLink>(chip);
                         },
                         clock);
    CommandRegistry registry;
    commands::register_flash_commands(registry);

    Output output;
    assert(run(registry, driver, "identify", {"--frequency", "8M"}, output) == 0);
    assert(driver.has_device());
    assert(chip.frequency_hz == 8u * 1024 * 1024);
}

// AT45 sizes come from the geometry picked by the density code, not the family's first one.
void dataflash_identify() {
    sim::ManualClock clock;
    sim::SimFlash chip("AT45DB", id_bytes(0x1F, 0x27, 0x00));
    DriverContext driver(false,
                         [&](const spinor::TransportConfig&) -> std::unique_ptr<spinor::Transport> {
                             return std::make_unique<sim::SimLink>(chip);
                         },
                         clock);
    CommandRegistry registry;
    commands::register_flash_commands(registry);

    Output output;
    assert(run(registry, driver, "identify", {}, output) == 0);
    const std::string text = output.out.str();
    assert(contains(text, "Device: Atmel AT45DB 4 MiB"));
    assert(contains(text, "(max 85000000 Hz)"));
    assert(contains(text, "  page      512 bytes\n"));
    assert(contains(text, "  subsector 4 KiB\n"));
    assert(contains(text, "  sector    64 KiB\n"));
    assert(!contains(text, "hsector"));
    assert(contains(text, "Write mode: buffer"));
}

// The executable's path: parse, help, privilege check, handler, exit code.
void dispatch() {
    sim::ManualClock clock;
    sim::SimFlash chip("W25x", id_bytes(0xEF, 0x40, 0x14));
    DriverContext driver(false,
                         [&](const spinor::TransportConfig&) -> std::unique_ptr<spinor::Transport> {
                             return std::make_unique<sim::SimLink>(chip);
                         },
                         clock);
    CommandRegistry registry;
    commands::register_flash_commands(registry);
    Command& failing = registry.register_command({
        .name = "fail",
        .aliases = {},
        .summary = "",
        .usage = "norworks fail",
        .options = {},
        .access = FlashAccess::None,
        .handler = [](CommandContext&) -> int { throw std::runtime_error("boom"); },
    });

    {
        Output output;
        assert(run_command(registry, driver, *registry.find("devices"), {}, output.out, output.err, false) == 0);
        assert(contains(output.out.str(), "W25x"));
    }
    {
        Output output;
        assert(run_command(registry, driver, *registry.find("read"), {"--bogus"}, output.out, output.err, false) == 3);
        assert(contains(output.err.str(), "Argument error: Unknown option '--bogus'"));
        assert(contains(output.err.str(), "Usage: norworks read"));
    }
    {
        Output output;
        assert(run_command(registry, driver, *registry.find("erase"), {"--help"}, output.out, output.err, false) == 0);
        assert(contains(output.out.str(), "Flash access: modify"));
        assert(output.err.str().empty());
    }
    {
        Output output;
        assert(run_command(registry, driver, failing, {}, output.out, output.err, false) == 4);
        assert(output.err.str() == "Command 'fail' failed: boom\n");
    }
    if (::geteuid() != 0) {
        Output output;
        assert(run_command(registry, driver, *registry.find("identify"), {}, output.out, output.err, false) == 5);
        assert(!driver.has_transport());
    }

    // A lone --address or --length is rejected before any protection change.
    {
        Output output;
        assert(run(registry, driver, "lock", {"--force"}, output) == 0);
        assert(throws<std::invalid_argument>([&] { run(registry, driver, "unlock", {"-a", "0", "-f"}, output); }));
        assert(chip.status_bits == 0x1C);
    }
}

void script_command() {
    sim::ManualClock clock;
    DriverContext driver(false, nullptr, clock);
    CommandRegistry registry;
    commands::register_script_commands(registry);
    const Command* script = registry.find("lua");
    assert(script != nullptr && script == registry.find("script"));
    assert(!script->uses_bus());

    // Everything after the script path belongs to the script.
    const ParsedCommand parsed =
        parse_command_line(*script, {"--cs", "1", "run.lua", "--address", "0x10", "-f", "tail"});
    assert(parsed.arguments.value("cs") == std::string("1"));
    assert(!parsed.force);
    assert(parsed.arguments.positionals() ==
           std::vector<std::string>({"run.lua", "--address", "0x10", "-f", "tail"}));

    Output output;
    assert(throws<std::invalid_argument>([&] { run(registry, driver, "script", {}, output); }));
    assert(run(registry, driver, "script", {"/nonexistent/norworks.lua"}, output) == 1);
    assert(contains(output.err.str(), "is not a readable file"));

    const auto path = std::filesystem::temp_directory_path() / "norworks_driver_cli.lua";
    {
        std::ofstream file(path);
        file << "local answer = 42\n";
    }
    Output ran;
    const int status = run(registry, driver, "script", {path.string(), "extra"}, ran);
    std::filesystem::remove(path);
#if NORWORKS_WITH_LUAJIT
    assert(status == 0);
    assert(ran.err.str().empty());
#else
    assert(status == 64);
    assert(contains(ran.err.str(), "NORWORKS_WITH_LUAJIT"));
#endif
    assert(throws<std::runtime_error>([&] { driver.require_transport(); }));
}

} // namespace

int main() {
    parser_and_registry();
    flash_commands();
    frequency_option();
    dataflash_identify();
    dispatch();
    script_command();
    return 0;
}
