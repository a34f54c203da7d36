#ifndef NORWORKS_SCRIPTING_LUA_ENGINE_HPP
#define NORWORKS_SCRIPTING_LUA_ENGINE_HPP

// Only built with NORWORKS_WITH_LUAJIT; the script command reports the
// missing support itself otherwise.
#if NORWORKS_WITH_LUAJIT

#include <string>
#include <vector>

extern "C" {
struct lua_State;
}

namespace norworks {
struct CommandContext;
}

namespace norworks::scripting {

// One LuaJIT state bound to the invoking script command. Scripts reach the
// registry through exec() and commands.<name>{...}, the shared SPI session
// through driver.* and with_session(), and the chip itself through the
// norworks module (identify, read, write, erase, plan_erase, lock, ...).
// Nested commands print to the host's streams and share its session.
class LuaEngine {
public:
    LuaEngine(CommandContext& host, bool allow_unsafe_libraries);
    ~LuaEngine();

    LuaEngine(const LuaEngine&) = delete;
    LuaEngine& operator=(const LuaEngine&) = delete;

    // `arg[0]` is the path, `arg[1..]` the script arguments. Returns the Lua
    // status; a failure message has already gone to the host's err stream.
    int run_file(const std::string& path, const std::vector<std::string>& args);

    CommandContext& host() noexcept { return host_; }

    // Status of a nested command, using the CLI exit codes.
    int invoke(const std::string& name, const std::vector<std::string>& args);

private:
    void install_globals();

    CommandContext& host_;
    ::lua_State* state_;
};

} // namespace norworks::scripting

#endif // NORWORKS_WITH_LUAJIT

#endif // NORWORKS_SCRIPTING_LUA_ENGINE_HPP
