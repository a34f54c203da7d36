#ifndef NORWORKS_COMMAND_HPP
#define NORWORKS_COMMAND_HPP

#include <cstddef>
#include <functional>
#include <stdint.h>
#include <string>
#include <vector>

namespace norworks {

struct CommandContext;

// What a command does to the attached chip. Anything above None needs
// root for /dev/mem and accepts the bus options (--cs, --frequency, --legacy-id).
enum class FlashAccess : uint8_t {
    None,    // catalogue, help, scripting host
    Read,    // identify, status, read, plan-erase
    Modify,  // program, erase, protection; refused without --force
};

const char* to_string(FlashAccess access);

struct OptionSpec {
    std::string long_name;
    char short_name = '\0';
    std::string value_name;  // empty for a flag
    bool required = false;
    std::string help;

    bool takes_value() const noexcept { return !value_name.empty(); }
};

inline constexpr std::size_t kUnboundedPositionals = static_cast<std::size_t>(-1);

using CommandHandler = std::function<int(CommandContext&)>;

struct Command {
    std::string name;
    std::vector<std::string> aliases;
    std::string summary;
    std::string usage;
    std::vector<OptionSpec> options;
    std::size_t min_positionals = 0;
    std::size_t max_positionals = 0;
    FlashAccess access = FlashAccess::Read;
    // Tokens after the first positional go to the handler untouched (script arguments).
    bool forwards_trailing_arguments = false;
    CommandHandler handler;

    bool uses_bus() const noexcept { return access != FlashAccess::None; }
    bool needs_force() const noexcept { return access == FlashAccess::Modify; }
};

} // namespace norworks

#endif // NORWORKS_COMMAND_HPP
