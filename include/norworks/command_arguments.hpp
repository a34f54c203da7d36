#ifndef NORWORKS_COMMAND_ARGUMENTS_HPP
#define NORWORKS_COMMAND_ARGUMENTS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace norworks {

// Parses "4096", "0x1000", "4K", "4KiB", "2M", "2MiB".
uint64_t parse_size(std::string_view token);

class CommandArguments {
public:
    using OptionMap = std::unordered_map<std::string, std::vector<std::string>>;

    CommandArguments() = default;
    CommandArguments(OptionMap options, std::vector<std::string> positionals);

    bool has(std::string_view long_name) const;
    const std::vector<std::string>& values(std::string_view long_name) const;
    std::optional<std::string> value(std::string_view long_name) const;
    std::string value_or(std::string_view long_name, std::string_view fallback) const;

    int64_t value_as_int(std::string_view long_name, int64_t fallback) const;
    int64_t require_int(std::string_view long_name) const;

    // Addresses and lengths, with size suffixes; must fit in 32 bits.
    uint32_t value_as_size(std::string_view long_name, uint32_t fallback) const;
    uint32_t require_size(std::string_view long_name) const;

    std::size_t positional_count() const noexcept { return positionals_.size(); }
    const std::string& positional(std::size_t index) const;
    const std::vector<std::string>& positionals() const noexcept { return positionals_; }

private:
    OptionMap options_;
    std::vector<std::string> positionals_;
};

} // namespace norworks

#endif // NORWORKS_COMMAND_ARGUMENTS_HPP
