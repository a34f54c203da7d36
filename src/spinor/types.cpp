#include "spinor/types.hpp"

#include <cstdio>

namespace spinor {

std::string JedecId::to_string() const {
    char text[9];
    std::snprintf(text, sizeof(text), "%02x:%02x:%02x", bytes[0], bytes[1], bytes[2]);
    return text;
}

const char* to_string(BlockKind kind) noexcept {
    switch (kind) {
    case BlockKind::Page: return "page";
    case BlockKind::Subsector: return "subsector";
    case BlockKind::HalfSector: return "hsector";
    case BlockKind::Sector: return "sector";
    case BlockKind::Chip: return "chip";
    }
    return "unknown";
}

const char* to_string(TimingKind kind) noexcept {
    switch (kind) {
    case TimingKind::Page: return "page";
    case TimingKind::Byte: return "byte";
    case TimingKind::Subsector: return "subsector";
    case TimingKind::HalfSector: return "hsector";
    case TimingKind::Sector: return "sector";
    case TimingKind::Chip: return "chip";
    case TimingKind::Lock: return "lock";
    }
    return "unknown";
}

TimingKind erase_timing_for(BlockKind kind) noexcept {
    switch (kind) {
    case BlockKind::Subsector: return TimingKind::Subsector;
    case BlockKind::HalfSector: return TimingKind::HalfSector;
    case BlockKind::Sector: return TimingKind::Sector;
    case BlockKind::Chip: return TimingKind::Chip;
    case BlockKind::Page: break;
    }
    return TimingKind::Page;
}

std::string format_size(uint64_t bytes) {
    constexpr uint64_t kMiB = 1ULL << 20;
    constexpr uint64_t kKiB = 1ULL << 10;
    if (bytes >= kMiB && bytes % kMiB == 0) {
        return std::to_string(bytes / kMiB) + " MiB";
    }
    if (bytes >= kKiB && bytes % kKiB == 0) {
        return std::to_string(bytes / kKiB) + " KiB";
    }
    return std::to_string(bytes) + " bytes";
}

} // namespace spinor
