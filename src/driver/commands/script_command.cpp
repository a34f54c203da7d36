#include "norworks/commands.hpp"

#include "norworks/cli_parser.hpp"
#include "norworks/command_context.hpp"
#include "norworks/driver_context.hpp"
#include "norworks/scripting/lua_engine.hpp"

#include <exception>
#include <filesystem>
#include <ostream>
#include <string>
#include <system_error>
#include <vector>

namespace norworks::commands {
namespace {

constexpr int kScriptFailed = 6;
constexpr int kScriptingUnavailable = 64;

int script_command(CommandContext& context) {
    const auto& positionals = context.arguments.positionals();
    std::error_code ec;
    const std::filesystem::path path = std::filesystem::absolute(positionals.front(), ec);
    if (ec || !std::filesystem::is_regular_file(path, ec)) {
        context.err << "Script '" << positionals.front() << "' is not a readable file.\n";
        return 1;
    }
    const std::vector<std::string> script_args(positionals.begin() + 1, positionals.end());

#if NORWORKS_WITH_LUAJIT
    int status = 0;
    try {
        scripting::LuaEngine engine(context, context.arguments.has("allow-unsafe"));
        status = engine.run_file(path.string(), script_args);
    } catch (const std::exception& ex) {
        context.err << "Cannot run " << path.string() << ": " << ex.what() << "\n";
        status = -1;
    }
    // A script that leaves the chip open must not keep the bus after it returns.
    context.driver.shutdown();
    return status == 0 ? 0 : kScriptFailed;
#else
    (void)script_args;
    context.err << "Cannot run " << path.string()
                << ": Lua scripting is not built in. Reconfigure with -DNORWORKS_WITH_LUAJIT=ON.\n";
    return kScriptingUnavailable;
#endif
}

std::vector<OptionSpec> script_options() {
    std::vector<OptionSpec> options{
        {"allow-unsafe", '\0', "", false, "Expose Lua's os and io libraries (disabled by default)."},
    };
    // Applied when the script first touches the chip.
    options.insert(options.end(), bus_options().begin(), bus_options().end());
    return options;
}

} // namespace

void register_script_commands(CommandRegistry& registry) {
    registry.register_command({
        .name = "script",
        .aliases = {"lua"},
        .summary = "Run a Lua script with the flash commands and the norworks module bound.",
        .usage = "norworks script [--allow-unsafe] [--cs <0|1>] [--frequency <hz>] <script.lua> [args...]",
        .options = script_options(),
        .min_positionals = 1,
        .max_positionals = kUnboundedPositionals,
        .access = FlashAccess::None,
        .forwards_trailing_arguments = true,
        .handler = script_command,
    });
}

} // namespace norworks::commands
