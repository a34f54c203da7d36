#include "spinor/erase_plan.hpp"

#include "spinor/errors.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace spinor {

namespace {

constexpr uint32_t align_down(uint32_t value, uint32_t size) { return value & ~(size - 1); }
constexpr uint32_t align_up(uint32_t value, uint32_t size) { return align_down(value + size - 1, size); }
constexpr bool aligned(uint32_t value, uint32_t size) { return (value & (size - 1)) == 0; }

struct Span {
    uint32_t start;
    uint32_t end;
};

const EraseGranularity* find_granularity(const EraseMap& map, BlockKind kind) {
    for (const auto& g : map.granularities) {
        if (g.kind == kind) return &g;
    }
    return nullptr;
}

void require_aligned(uint32_t start, uint32_t end, uint32_t size, const char* what) {
    if (!aligned(start, size) || !aligned(end, size)) {
        char message[128];
        std::snprintf(message, sizeof(message), "Range [0x%06x, 0x%06x) not aligned on a %s boundary (%u bytes)",
                      start, end, what, size);
        throw ValueError(message);
    }
}

// Carve the largest aligned middle of every span, granularity by granularity.
// What is left after the finest granularity is a planner bug.
std::vector<EraseRegion> carve(const std::vector<EraseGranularity>& granularities, uint32_t start, uint32_t end) {
    std::vector<EraseRegion> regions;
    std::vector<Span> pending{{start, end}};
    for (const auto& g : granularities) {
        std::vector<Span> next;
        for (const auto& span : pending) {
            const uint32_t lo = align_up(span.start, g.size);
            const uint32_t hi = align_down(span.end, g.size);
            if (lo >= hi || lo < span.start) {
                next.push_back(span);
                continue;
            }
            regions.push_back(EraseRegion{lo, hi, g.size, g.opcode, g.kind});
            if (span.start < lo) next.push_back({span.start, lo});
            if (hi < span.end) next.push_back({hi, span.end});
        }
        pending = std::move(next);
    }
    for (const auto& span : pending) {
        if (span.start != span.end) {
            char message[96];
            std::snprintf(message, sizeof(message), "erase planner left [0x%06x, 0x%06x) uncovered", span.start,
                          span.end);
            throw std::logic_error(message);
        }
    }
    return regions;
}

// A sector erase inside the parameter zone leaves the 4 KiB parameter
// sectors untouched; they need their own subsector erases.
void add_parameter_zone_erases(const EraseMap& map, std::vector<EraseRegion>& regions) {
    const EraseGranularity* sub = find_granularity(map, BlockKind::Subsector);
    if (!sub) {
        throw std::logic_error("parameter zone without subsector erase");
    }
    std::vector<EraseRegion> extra;
    for (const auto& region : regions) {
        if (region.kind != BlockKind::Sector) continue;
        const uint32_t lo = std::max(region.start, map.zone_start);
        const uint32_t hi = std::min(region.end, map.zone_end);
        if (lo < hi) {
            extra.push_back(EraseRegion{lo, hi, sub->size, sub->opcode, BlockKind::Subsector});
        }
    }
    regions.insert(regions.end(), extra.begin(), extra.end());
}

// Sector 0 is addressed as 0a (one subsector) and 0b (the rest), both with the sector opcode.
void split_first_sector(const EraseMap& map, std::vector<EraseRegion>& regions) {
    const EraseGranularity* sub = find_granularity(map, BlockKind::Subsector);
    if (!sub) {
        throw std::logic_error("split first sector without subsector size");
    }
    std::vector<EraseRegion> out;
    out.reserve(regions.size() + 2);
    for (const auto& region : regions) {
        if (region.kind != BlockKind::Sector || region.start != 0) {
            out.push_back(region);
            continue;
        }
        const uint32_t sector = region.block_size;
        out.push_back(EraseRegion{0, sub->size, sub->size, region.opcode, BlockKind::Sector});
        out.push_back(EraseRegion{sub->size, sector, sector - sub->size, region.opcode, BlockKind::Sector});
        if (region.end > sector) {
            out.push_back(EraseRegion{sector, region.end, sector, region.opcode, BlockKind::Sector});
        }
    }
    regions = std::move(out);
}

} // namespace

EraseMap make_erase_map(const DeviceDescriptor& descriptor, const Geometry& geometry, uint32_t capacity) {
    static constexpr std::pair<FeatureMask, BlockKind> kOrder[] = {
        {features::kSectorErase, BlockKind::Sector},
        {features::kHalfSectorErase, BlockKind::HalfSector},
        {features::kSubsectorErase, BlockKind::Subsector},
    };
    EraseMap map;
    map.capacity = capacity;
    map.chip_erase = descriptor.has_feature(features::kChipErase);
    map.layout = descriptor.erase_layout;
    for (const auto& [flag, kind] : kOrder) {
        if (!descriptor.has_feature(flag)) continue;
        const auto index = static_cast<std::size_t>(kind);
        map.granularities.push_back(
            EraseGranularity{kind, 1u << geometry.block_shift[index], descriptor.opcodes.erase[index]});
    }
    return map;
}

void place_parameter_zone(EraseMap& map, bool top) {
    const EraseGranularity* sector = find_granularity(map, BlockKind::Sector);
    if (!sector) {
        throw std::logic_error("parameter zone without sector erase");
    }
    const uint32_t zone = 2 * sector->size;
    if (top) {
        map.zone_start = map.capacity - zone;
        map.zone_end = map.capacity;
    } else {
        map.zone_start = 0;
        map.zone_end = zone;
    }
}

void check_erase_range(const EraseMap& map, uint32_t address, uint32_t length) {
    if (static_cast<uint64_t>(address) + length > map.capacity) {
        char message[96];
        std::snprintf(message, sizeof(message), "Erase range [0x%06x, +0x%x) exceeds capacity 0x%x", address, length,
                      map.capacity);
        throw OutOfRangeError(message);
    }
    if (map.granularities.empty()) {
        throw NotSupportedError("Device has no erase granularity");
    }
    const uint32_t end = address + length;
    if (map.layout != EraseLayout::ParameterZone) {
        const auto& finest = map.granularities.back();
        require_aligned(address, end, finest.size, to_string(finest.kind));
        return;
    }

    const EraseGranularity* sector = find_granularity(map, BlockKind::Sector);
    const EraseGranularity* sub = find_granularity(map, BlockKind::Subsector);
    if (!sector || !sub) {
        throw std::logic_error("parameter zone needs sector and subsector erase");
    }
    // Inside the zone subsector alignment suffices; outside, whole sectors only.
    const uint32_t in_lo = std::max(address, map.zone_start);
    const uint32_t in_hi = std::min(end, map.zone_end);
    if (in_lo < in_hi) {
        require_aligned(in_lo, in_hi, sub->size, "subsector");
    }
    if (address < map.zone_start) {
        require_aligned(address, std::min(end, map.zone_start), sector->size, "sector");
    }
    if (end > map.zone_end) {
        require_aligned(std::max(address, map.zone_end), end, sector->size, "sector");
    }
}

std::vector<EraseRegion> plan_erase(const EraseMap& map, uint32_t address, uint32_t length) {
    check_erase_range(map, address, length);
    if (length == 0) {
        return {};
    }
    if (map.chip_erase && address == 0 && length == map.capacity) {
        LOG_SPINOR_DEBUG("erase plan: chip, %u bytes", map.capacity);
        return {EraseRegion{0, map.capacity, map.capacity, 0, BlockKind::Chip}};
    }

    std::vector<EraseRegion> regions = carve(map.granularities, address, address + length);
    if (map.layout == EraseLayout::ParameterZone) {
        add_parameter_zone_erases(map, regions);
    } else if (map.layout == EraseLayout::SplitFirstSector) {
        split_first_sector(map, regions);
    }
    std::stable_sort(regions.begin(), regions.end(),
                     [](const EraseRegion& a, const EraseRegion& b) { return a.start < b.start; });

    for ([[maybe_unused]] const auto& region : regions) {
        LOG_SPINOR_DEBUG("erase plan: %s [0x%06x, 0x%06x) x%u opcode 0x%02x", to_string(region.kind), region.start,
                         region.end, region.commands(), region.opcode);
    }
    return regions;
}

} // namespace spinor
