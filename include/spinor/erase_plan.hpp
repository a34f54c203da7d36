// Erase planning: turns a byte range into aligned erase commands.
#ifndef SPINOR_ERASE_PLAN_HPP
#define SPINOR_ERASE_PLAN_HPP

#include "spinor/descriptor.hpp"
#include "spinor/types.hpp"

#include <stdint.h>
#include <vector>

namespace spinor {

struct EraseGranularity {
    BlockKind kind = BlockKind::Sector;
    uint32_t size = 0;
    uint8_t opcode = 0;
};

// Everything the planner needs to know about one resolved device.
struct EraseMap {
    uint32_t capacity = 0;
    std::vector<EraseGranularity> granularities;  // largest first
    bool chip_erase = false;
    EraseLayout layout = EraseLayout::Uniform;
    // ParameterZone: span erased with subsector granularity only.
    uint32_t zone_start = 0;
    uint32_t zone_end = 0;
};

// One run of same-sized erase commands over [start, end).
// Chip regions carry opcode 0: the chip-erase sequence comes from the opcodes table.
struct EraseRegion {
    uint32_t start = 0;
    uint32_t end = 0;
    uint32_t block_size = 0;
    uint8_t opcode = 0;
    BlockKind kind = BlockKind::Sector;

    uint32_t commands() const noexcept { return block_size ? (end - start) / block_size : 0; }
};

// Builds the map for a resolved geometry; the zone is left empty.
EraseMap make_erase_map(const DeviceDescriptor& descriptor, const Geometry& geometry, uint32_t capacity);

// Places the parameter zone in the two top (or bottom) sectors.
void place_parameter_zone(EraseMap& map, bool top);

// Throws OutOfRangeError past capacity, ValueError on misalignment.
void check_erase_range(const EraseMap& map, uint32_t address, uint32_t length);

// Validates, then returns regions sorted by start address covering exactly
// [address, address + length), largest blocks first.
std::vector<EraseRegion> plan_erase(const EraseMap& map, uint32_t address, uint32_t length);

} // namespace spinor

#endif // SPINOR_ERASE_PLAN_HPP
