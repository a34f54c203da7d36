#include "norworks/command_arguments.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>
#include <utility>

namespace norworks {

namespace {
const std::vector<std::string> kNoValues;

std::string upper(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}
} // namespace

uint64_t parse_size(std::string_view token) {
    if (token.empty()) {
        throw std::invalid_argument("empty size");
    }
    std::size_t digits = 0;
    unsigned long long base = 0;
    const std::string text(token);
    try {
        base = std::stoull(text, &digits, 0);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid size '" + text + "'");
    }
    if (text[0] == '-') {
        throw std::invalid_argument("invalid size '" + text + "'");
    }
    const std::string suffix = upper(token.substr(digits));
    unsigned shift = 0;
    if (suffix.empty()) {
        shift = 0;
    } else if (suffix == "K" || suffix == "KB" || suffix == "KIB") {
        shift = 10;
    } else if (suffix == "M" || suffix == "MB" || suffix == "MIB") {
        shift = 20;
    } else {
        throw std::invalid_argument("invalid size suffix in '" + text + "'");
    }
    if (base > (std::numeric_limits<uint64_t>::max() >> shift)) {
        throw std::invalid_argument("size '" + text + "' overflows");
    }
    return static_cast<uint64_t>(base) << shift;
}

CommandArguments::CommandArguments(OptionMap options, std::vector<std::string> positionals)
    : options_(std::move(options)), positionals_(std::move(positionals)) {}

bool CommandArguments::has(std::string_view long_name) const {
    return options_.count(std::string(long_name)) != 0U;
}

const std::vector<std::string>& CommandArguments::values(std::string_view long_name) const {
    const auto it = options_.find(std::string(long_name));
    return it == options_.end() ? kNoValues : it->second;
}

std::optional<std::string> CommandArguments::value(std::string_view long_name) const {
    const auto& all = values(long_name);
    if (all.empty()) {
        return std::nullopt;
    }
    return all.front();
}

std::string CommandArguments::value_or(std::string_view long_name, std::string_view fallback) const {
    return value(long_name).value_or(std::string(fallback));
}

int64_t CommandArguments::value_as_int(std::string_view long_name, int64_t fallback) const {
    const auto token = value(long_name);
    if (!token) {
        return fallback;
    }
    std::size_t used = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(*token, &used, 0);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != token->size()) {
        throw std::invalid_argument("Option '--" + std::string(long_name) + "' expects an integer value");
    }
    return static_cast<int64_t>(parsed);
}

int64_t CommandArguments::require_int(std::string_view long_name) const {
    if (!has(long_name)) {
        throw std::invalid_argument("Missing required option '--" + std::string(long_name) + "'");
    }
    return value_as_int(long_name, 0);
}

uint32_t CommandArguments::value_as_size(std::string_view long_name, uint32_t fallback) const {
    const auto token = value(long_name);
    if (!token) {
        return fallback;
    }
    uint64_t parsed = 0;
    try {
        parsed = parse_size(*token);
    } catch (const std::invalid_argument& ex) {
        throw std::invalid_argument("Option '--" + std::string(long_name) + "': " + ex.what());
    }
    if (parsed > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("Option '--" + std::string(long_name) + "' exceeds the 24-bit address space");
    }
    return static_cast<uint32_t>(parsed);
}

uint32_t CommandArguments::require_size(std::string_view long_name) const {
    if (!has(long_name)) {
        throw std::invalid_argument("Missing required option '--" + std::string(long_name) + "'");
    }
    return value_as_size(long_name, 0);
}

const std::string& CommandArguments::positional(std::size_t index) const {
    if (index >= positionals_.size()) {
        throw std::out_of_range("positional argument index out of range");
    }
    return positionals_[index];
}

} // namespace norworks
