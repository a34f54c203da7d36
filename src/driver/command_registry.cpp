#include "norworks/command_registry.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>
#include <vector>

namespace norworks {

namespace {
std::string fold(std::string_view name) {
    std::string key{name};
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return key;
}
} // namespace

void CommandRegistry::add_key(const std::string& key, std::size_t index) {
    lookup_.emplace(fold(key), index);
}

Command& CommandRegistry::register_command(Command command) {
    if (command.name.empty()) {
        throw std::invalid_argument("command name must not be empty");
    }
    if (!command.handler) {
        throw std::invalid_argument("command '" + command.name + "' has no handler");
    }
    std::vector<std::string> keys{command.name};
    keys.insert(keys.end(), command.aliases.begin(), command.aliases.end());
    for (std::size_t i = 0; i < keys.size(); ++i) {
        const std::string key = fold(keys[i]);
        const bool repeated = std::any_of(keys.begin(), keys.begin() + static_cast<std::ptrdiff_t>(i),
                                          [&](const std::string& earlier) { return fold(earlier) == key; });
        if (repeated || lookup_.count(key) != 0U) {
            throw std::invalid_argument("duplicate command name or alias: " + keys[i]);
        }
    }
    const std::size_t index = commands_.size();
    add_key(command.name, index);
    for (const auto& alias : command.aliases) {
        add_key(alias, index);
    }
    commands_.push_back(std::move(command));
    return commands_.back();
}

const Command* CommandRegistry::find(std::string_view name) const {
    const auto it = lookup_.find(fold(name));
    return it == lookup_.end() ? nullptr : &commands_[it->second];
}

Command* CommandRegistry::find_mutable(std::string_view name) {
    const auto it = lookup_.find(fold(name));
    return it == lookup_.end() ? nullptr : &commands_[it->second];
}

} // namespace norworks
