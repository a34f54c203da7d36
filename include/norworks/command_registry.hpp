#ifndef NORWORKS_COMMAND_REGISTRY_HPP
#define NORWORKS_COMMAND_REGISTRY_HPP

#include "norworks/command.hpp"

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace norworks {

// Commands in registration order, looked up case-insensitively by name or alias.
class CommandRegistry {
public:
    Command& register_command(Command command);

    const Command* find(std::string_view name) const;
    Command* find_mutable(std::string_view name);

    const std::deque<Command>& commands() const noexcept { return commands_; }

private:
    void add_key(const std::string& key, std::size_t index);

    // deque: references handed out by register_command stay valid.
    std::deque<Command> commands_;
    std::unordered_map<std::string, std::size_t> lookup_;
};

} // namespace norworks

#endif // NORWORKS_COMMAND_REGISTRY_HPP
