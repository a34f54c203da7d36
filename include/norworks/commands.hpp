#ifndef NORWORKS_COMMANDS_HPP
#define NORWORKS_COMMANDS_HPP

#include "norworks/command_registry.hpp"

namespace norworks::commands {

// identify, status, read, write, erase, erase-chip, plan-erase, unlock,
// lock, unique-id and list-devices, in that order.
void register_flash_commands(CommandRegistry& registry);

// script (alias lua). Without LuaJIT the command still registers and exits with 64.
void register_script_commands(CommandRegistry& registry);

} // namespace norworks::commands

#endif // NORWORKS_COMMANDS_HPP
