#include "norworks/scripting/lua_engine.hpp"

#if NORWORKS_WITH_LUAJIT

#include "norworks/cli_parser.hpp"
#include "norworks/command_context.hpp"
#include "norworks/command_registry.hpp"
#include "norworks/driver_context.hpp"
#include "spinor/device.hpp"
#include "spinor/erase_plan.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

extern "C" {
#include "lua.hpp"
}

namespace norworks::scripting {

namespace {

using Binding = int (*)(lua_State*);

LuaEngine& engine_of(lua_State* L) {
    void* engine = lua_touserdata(L, lua_upvalueindex(1));
    if (engine == nullptr) {
        luaL_error(L, "missing scripting context");
    }
    return *static_cast<LuaEngine*>(engine);
}

DriverContext& session_of(lua_State* L) {
    return engine_of(L).host().driver;
}

// Flash access from Lua goes through the host, so the bus options given to
// the script command apply if the script is first to open the session.
spinor::FlashDevice& device_of(lua_State* L) {
    return engine_of(L).host().device();
}

// "erase-chip" -> "erase_chip" so commands.erase_chip{} works without brackets.
std::string lua_identifier(std::string_view name) {
    std::string id;
    id.reserve(name.size() + 1);
    for (char ch : name) {
        const auto uch = static_cast<unsigned char>(ch);
        id.push_back(std::isalnum(uch) ? static_cast<char>(std::tolower(uch)) : '_');
    }
    if (!id.empty() && std::isdigit(static_cast<unsigned char>(id.front()))) {
        id.insert(id.begin(), '_');
    }
    return id;
}

// Table keys use underscores; option names use dashes.
std::string option_name(std::string_view key) {
    std::string name;
    name.reserve(key.size());
    for (char ch : key) {
        name.push_back(ch == '_' ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return name;
}

std::string scalar_string(lua_State* L, int index, const char* what) {
    switch (lua_type(L, index)) {
    case LUA_TSTRING:
    case LUA_TNUMBER: {
        size_t len = 0;
        const char* value = lua_tolstring(L, index, &len);
        return std::string(value, len);
    }
    case LUA_TBOOLEAN:
        return lua_toboolean(L, index) ? "true" : "false";
    default:
        luaL_error(L, "%s must be a string, number, or boolean", what);
    }
    return {};
}

bool flag_value(lua_State* L, const char* name) {
    if (!lua_isboolean(L, -1) && !lua_isnil(L, -1)) {
        luaL_error(L, "option %s expects a boolean", name);
    }
    return lua_toboolean(L, -1) != 0;
}

uint32_t check_u32(lua_State* L, int index, const char* what) {
    const lua_Number value = luaL_checknumber(L, index);
    if (value < 0 || value > 4294967295.0 || value != static_cast<lua_Number>(static_cast<uint64_t>(value))) {
        luaL_error(L, "%s must be an integer in [0, 2^32)", what);
    }
    return static_cast<uint32_t>(value);
}

// Optional (address, length) pair at 1, 2; nothing means the whole device.
std::optional<FlashRange> range_args(lua_State* L) {
    if (lua_isnoneornil(L, 1)) {
        return std::nullopt;
    }
    return FlashRange{check_u32(L, 1, "address"), check_u32(L, 2, "length")};
}

void set_string(lua_State* L, const char* key, const std::string& value) {
    lua_pushlstring(L, value.data(), value.size());
    lua_setfield(L, -2, key);
}

void set_number(lua_State* L, const char* key, double value) {
    lua_pushnumber(L, value);
    lua_setfield(L, -2, key);
}

// Runs a flash operation; a C++ exception becomes a Lua error once its
// message is copied off the C++ stack (luaL_error longjmps).
template <typename Fn>
int flash_call(lua_State* L, const char* what, Fn&& fn) {
    std::string failure;
    try {
        return fn();
    } catch (const std::exception& ex) {
        failure = ex.what();
    }
    return luaL_error(L, "%s failed: %s", what, failure.c_str());
}

int push_true(lua_State* L) {
    lua_pushboolean(L, 1);
    return 1;
}

// --- registry ----------------------------------------------------------------

// exec("read", "--address", "0", "--length", "16") -> exit status
int l_exec(lua_State* L) {
    LuaEngine& engine = engine_of(L);
    const std::string name = luaL_checkstring(L, 1);
    std::vector<std::string> args;
    for (int i = 2, top = lua_gettop(L); i <= top; ++i) {
        if (!lua_isnil(L, i)) {
            args.push_back(scalar_string(L, i, "exec argument"));
        }
    }
    lua_pushinteger(L, engine.invoke(name, args));
    return 1;
}

// commands.<name>{ address = 0x1000, length = "4K", force = true, args = {...} }
// Returns true, or false plus the status when allow_failure is set.
int l_command(lua_State* L) {
    LuaEngine& engine = engine_of(L);
    const auto* command = static_cast<const Command*>(lua_touserdata(L, lua_upvalueindex(2)));

    std::vector<std::string> argv;
    std::vector<std::string> positionals;
    bool force = false;
    bool help = false;
    bool allow_failure = false;
    int first_positional = 1;

    if (lua_istable(L, 1)) {
        first_positional = 2;
        lua_pushnil(L);
        while (lua_next(L, 1) != 0) {
            if (lua_type(L, -2) != LUA_TSTRING) {
                return luaL_error(L, "option keys must be strings");
            }
            const std::string key = lua_tostring(L, -2);
            const std::string name = option_name(key);
            if (name == "args") {
                luaL_checktype(L, -1, LUA_TTABLE);
                const int table = lua_gettop(L);
                for (size_t i = 1, n = lua_objlen(L, table); i <= n; ++i) {
                    lua_rawgeti(L, table, static_cast<int>(i));
                    positionals.push_back(scalar_string(L, -1, "args entry"));
                    lua_pop(L, 1);
                }
            } else if (name == "force") {
                force = flag_value(L, "force");
            } else if (name == "allow-failure") {
                allow_failure = flag_value(L, "allow_failure");
            } else if (name == "help") {
                help = flag_value(L, "help");
            } else {
                const OptionSpec* spec = find_option(*command, name);
                if (spec == nullptr) {
                    return luaL_error(L, "%s has no option '%s'", command->name.c_str(), key.c_str());
                }
                if (!spec->takes_value()) {
                    if (flag_value(L, key.c_str())) argv.push_back("--" + spec->long_name);
                } else {
                    argv.push_back("--" + spec->long_name);
                    argv.push_back(scalar_string(L, -1, key.c_str()));
                }
            }
            lua_pop(L, 1);
        }
    }
    for (int i = first_positional, top = lua_gettop(L); i <= top; ++i) {
        if (!lua_isnil(L, i)) {
            positionals.push_back(scalar_string(L, i, "positional argument"));
        }
    }
    if (command->needs_force() && !force && !help) {
        return luaL_error(L, "%s modifies flash; pass force = true", command->name.c_str());
    }
    if (force) argv.emplace_back("--force");
    if (help) argv.emplace_back("--help");
    if (!positionals.empty()) {
        argv.emplace_back("--");
        argv.insert(argv.end(), positionals.begin(), positionals.end());
    }

    const int status = engine.invoke(command->name, argv);
    if (status == 0) {
        return push_true(L);
    }
    if (!allow_failure) {
        return luaL_error(L, "%s exited with status %d", command->name.c_str(), status);
    }
    lua_pushboolean(L, 0);
    lua_pushinteger(L, status);
    return 2;
}

// --- session -----------------------------------------------------------------

int l_start_session(lua_State* L) {
    return flash_call(L, "identify", [&] {
        device_of(L);
        return push_true(L);
    });
}

int l_shutdown(lua_State* L) {
    session_of(L).shutdown();
    return push_true(L);
}

int l_is_active(lua_State* L) {
    lua_pushboolean(L, session_of(L).has_device() ? 1 : 0);
    return 1;
}

// with_session(fn): identifies the chip, calls fn(commands, norworks), then
// closes the session again if this call opened it.
int l_with_session(lua_State* L) {
    luaL_checktype(L, 1, LUA_TFUNCTION);
    lua_settop(L, 1);
    DriverContext& driver = session_of(L);
    const bool opened_here = !driver.has_device();

    std::string failure;
    try {
        device_of(L);
    } catch (const std::exception& ex) {
        failure = ex.what();
    }
    if (!failure.empty()) {
        driver.shutdown();
        return luaL_error(L, "cannot open flash session: %s", failure.c_str());
    }

    lua_getglobal(L, "commands");
    lua_getglobal(L, "norworks");
    const int status = lua_pcall(L, 2, LUA_MULTRET, 0);
    if (opened_here) {
        driver.shutdown();
    }
    if (status != 0) {
        return lua_error(L);
    }
    return lua_gettop(L);
}

// --- chip --------------------------------------------------------------------

// norworks.identify() -> { name, description, family, vendor, capacity, page_size, erase_size, max_hz }
int l_identify(lua_State* L) {
    return flash_call(L, "identify", [&] {
        spinor::FlashDevice& device = device_of(L);
        lua_newtable(L);
        set_string(L, "name", device.name());
        set_string(L, "description", device.description());
        set_string(L, "family", device.descriptor().family);
        set_string(L, "vendor", device.descriptor().vendor);
        set_number(L, "capacity", device.capacity());
        set_number(L, "page_size", device.block_size(spinor::BlockKind::Page));
        set_number(L, "erase_size", device.erase_size());
        set_number(L, "max_hz", device.geometry().max_frequency_hz);
        return 1;
    });
}

int l_status(lua_State* L) {
    return flash_call(L, "status", [&] {
        const spinor::StatusSnapshot status = device_of(L).read_status();
        lua_pushinteger(L, status.raw);
        lua_pushboolean(L, status.busy() ? 1 : 0);
        return 2;
    });
}

// norworks.read(address, length) -> raw bytes
int l_read(lua_State* L) {
    const uint32_t address = check_u32(L, 1, "address");
    const uint32_t length = check_u32(L, 2, "length");
    return flash_call(L, "read", [&] {
        const auto data = device_of(L).read(address, length);
        lua_pushlstring(L, reinterpret_cast<const char*>(data.data()), data.size());
        return 1;
    });
}

int l_write(lua_State* L) {
    const uint32_t address = check_u32(L, 1, "address");
    size_t length = 0;
    const char* bytes = luaL_checklstring(L, 2, &length);
    return flash_call(L, "write", [&] {
        device_of(L).write(address, reinterpret_cast<const uint8_t*>(bytes), length);
        return push_true(L);
    });
}

// norworks.erase([address, length [, verify]])
int l_erase(lua_State* L) {
    const auto range = range_args(L);
    const bool verify = lua_toboolean(L, 3) != 0;
    return flash_call(L, "erase", [&] {
        if (range) {
            device_of(L).erase(range->address, range->length, verify);
        } else {
            device_of(L).erase(0, spinor::FlashDevice::kWholeDevice, verify);
        }
        return push_true(L);
    });
}

// norworks.plan_erase(address, length) -> { {kind, start, stop, block_size, count, opcode}, ... }
int l_plan_erase(lua_State* L) {
    const uint32_t address = check_u32(L, 1, "address");
    const uint32_t length = check_u32(L, 2, "length");
    return flash_call(L, "plan_erase", [&] {
        const auto regions = device_of(L).plan_erase(address, length);
        lua_createtable(L, static_cast<int>(regions.size()), 0);
        for (std::size_t i = 0; i < regions.size(); ++i) {
            const spinor::EraseRegion& region = regions[i];
            lua_newtable(L);
            set_string(L, "kind", spinor::to_string(region.kind));
            set_number(L, "start", region.start);
            set_number(L, "stop", region.end);
            set_number(L, "block_size", region.block_size);
            set_number(L, "count", static_cast<double>(region.commands()));
            set_number(L, "opcode", region.opcode);
            lua_rawseti(L, -2, static_cast<int>(i + 1));
        }
        return 1;
    });
}

int l_protect(lua_State* L, bool protect) {
    const auto range = range_args(L);
    return flash_call(L, protect ? "lock" : "unlock", [&] {
        spinor::FlashDevice& device = device_of(L);
        if (range) {
            protect ? device.lock(range->address, range->length) : device.unlock(range->address, range->length);
        } else {
            protect ? device.lock() : device.unlock();
        }
        return push_true(L);
    });
}

int l_lock(lua_State* L) {
    return l_protect(L, true);
}

int l_unlock(lua_State* L) {
    return l_protect(L, false);
}

// norworks.unique_id() -> lowercase hex string
int l_unique_id(lua_State* L) {
    return flash_call(L, "unique_id", [&] {
        std::string hex;
        for (uint8_t byte : device_of(L).unique_id()) {
            char digits[3];
            std::snprintf(digits, sizeof(digits), "%02x", byte);
            hex += digits;
        }
        lua_pushlstring(L, hex.data(), hex.size());
        return 1;
    });
}

} // namespace

LuaEngine::LuaEngine(CommandContext& host, bool allow_unsafe_libraries)
    : host_(host), state_(luaL_newstate()) {
    if (state_ == nullptr) {
        throw std::runtime_error("Failed to initialise LuaJIT state");
    }
    luaL_openlibs(state_);
    if (!allow_unsafe_libraries) {
        lua_pushnil(state_);
        lua_setglobal(state_, LUA_OSLIBNAME);
        lua_pushnil(state_);
        lua_setglobal(state_, LUA_IOLIBNAME);
    }
    install_globals();
}

LuaEngine::~LuaEngine() {
    lua_close(state_);
}

void LuaEngine::install_globals() {
    auto push_binding = [this](Binding fn) {
        lua_pushlightuserdata(state_, this);
        lua_pushcclosure(state_, fn, 1);
    };
    auto set_bindings = [&](std::initializer_list<std::pair<const char*, Binding>> entries) {
        for (const auto& [name, fn] : entries) {
            push_binding(fn);
            lua_setfield(state_, -2, name);
        }
    };

    push_binding(l_exec);
    lua_setglobal(state_, "exec");
    push_binding(l_with_session);
    lua_setglobal(state_, "with_session");

    lua_newtable(state_);
    set_bindings({{"start_session", l_start_session}, {"shutdown", l_shutdown}, {"is_active", l_is_active}});
    lua_setglobal(state_, "driver");

    // Every name and alias, plus its identifier spelling.
    lua_newtable(state_);
    for (const Command& command : host_.registry.commands()) {
        std::vector<std::string> keys{command.name};
        keys.insert(keys.end(), command.aliases.begin(), command.aliases.end());
        for (const auto& key : keys) {
            for (const std::string& spelling : {key, lua_identifier(key)}) {
                lua_pushlightuserdata(state_, this);
                lua_pushlightuserdata(state_, const_cast<Command*>(&command));
                lua_pushcclosure(state_, l_command, 2);
                lua_setfield(state_, -2, spelling.c_str());
            }
        }
    }
    lua_setglobal(state_, "commands");

    lua_newtable(state_);
    set_bindings({
        {"exec", l_exec},
        {"with_session", l_with_session},
        {"identify", l_identify},
        {"status", l_status},
        {"read", l_read},
        {"write", l_write},
        {"erase", l_erase},
        {"plan_erase", l_plan_erase},
        {"lock", l_lock},
        {"unlock", l_unlock},
        {"unique_id", l_unique_id},
    });
    lua_getglobal(state_, "driver");
    lua_setfield(state_, -2, "driver");
    lua_getglobal(state_, "commands");
    lua_setfield(state_, -2, "commands");
    lua_setglobal(state_, "norworks");
}

int LuaEngine::run_file(const std::string& path, const std::vector<std::string>& args) {
    lua_createtable(state_, static_cast<int>(args.size()), 1);
    lua_pushlstring(state_, path.data(), path.size());
    lua_rawseti(state_, -2, 0);
    for (std::size_t i = 0; i < args.size(); ++i) {
        lua_pushlstring(state_, args[i].data(), args[i].size());
        lua_rawseti(state_, -2, static_cast<int>(i + 1));
    }
    lua_setglobal(state_, "arg");

    int status = luaL_loadfile(state_, path.c_str());
    if (status == 0) {
        status = lua_pcall(state_, 0, 0, 0);
    }
    if (status != 0) {
        const char* message = lua_tostring(state_, -1);
        host_.err << "Script '" << path << "' failed: " << (message ? message : "unknown error") << "\n";
        lua_pop(state_, 1);
    }
    return status;
}

int LuaEngine::invoke(const std::string& name, const std::vector<std::string>& args) {
    const Command* command = host_.registry.find(name);
    if (command == nullptr) {
        host_.err << "exec: unknown command '" << name << "'\n";
        return 2;
    }
    return run_command(host_.registry, host_.driver, *command, args, host_.out, host_.err, host_.verbose);
}

} // namespace norworks::scripting

#endif // NORWORKS_WITH_LUAJIT
