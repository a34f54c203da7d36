#include "spinor/descriptor.hpp"
#include "spinor/erase_plan.hpp"
#include "spinor/errors.hpp"

#include <cassert>
#include <stdint.h>
#include <vector>

using namespace spinor;

namespace {

constexpr uint32_t kSub = 0x1000;
constexpr uint32_t kSector = 0x10000;

EraseMap map_for(const char* family, uint32_t capacity, std::size_t geometry_index = 0) {
    const DeviceDescriptor* descriptor = find_descriptor(family);
    assert(descriptor != nullptr);
    return make_erase_map(*descriptor, descriptor->geometries[geometry_index], capacity);
}

template <typename Error, typename Fn>
bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}

// Sector 0b on DataFlash: one erase unit spanning the sector minus its first subsector.
bool is_sector_0b(const EraseRegion& region) {
    return region.start == kSub && region.end == kSector && region.block_size == kSector - kSub;
}

// Regions must tile [address, address + length) exactly, in order, with aligned blocks.
void check_tiles(const std::vector<EraseRegion>& regions, uint32_t address, uint32_t length) {
    uint32_t cursor = address;
    for (const auto& region : regions) {
        assert(region.start == cursor);
        assert(region.end > region.start);
        assert((region.end - region.start) % region.block_size == 0);
        assert(region.start % kSub == 0);
        assert(region.start % region.block_size == 0 || is_sector_0b(region));
        cursor = region.end;
    }
    assert(cursor == address + length);
}

uint32_t total_commands(const std::vector<EraseRegion>& regions) {
    uint32_t count = 0;
    for (const auto& region : regions) count += region.commands();
    return count;
}

} // namespace

int main() {
    // Granularities come largest first, with the family's opcodes.
    const EraseMap en25 = map_for("EN25Q", 0x100000);
    assert(en25.granularities.size() == 2);
    assert(en25.granularities[0].kind == BlockKind::Sector && en25.granularities[0].size == kSector);
    assert(en25.granularities[0].opcode == 0xD8);
    assert(en25.granularities[1].kind == BlockKind::Subsector && en25.granularities[1].opcode == 0x20);
    assert(en25.chip_erase);

    const EraseMap sst = map_for("SST25VFxxxA", 0x10000);
    assert(sst.granularities.size() == 1);
    assert(sst.granularities[0].size == 0x1000 && sst.granularities[0].opcode == 0x20);

    // One 4 KiB block below the first sector boundary.
    {
        const auto regions = plan_erase(en25, 0x7000, 0x1000);
        assert(regions.size() == 1);
        assert(regions[0].start == 0x7000 && regions[0].end == 0x8000);
        assert(regions[0].kind == BlockKind::Subsector);
        assert(regions[0].block_size == kSub && regions[0].opcode == 0x20);
        assert(regions[0].commands() == 1);
    }

    // Exact cover with the fewest blocks for every aligned range in the first few sectors.
    for (uint32_t address = 0; address < 3 * kSector; address += kSub) {
        for (uint32_t length = kSub; address + length <= 3 * kSector; length += kSub) {
            const auto regions = plan_erase(en25, address, length);
            check_tiles(regions, address, length);
            const uint32_t end = address + length;
            const uint32_t first_sector = (address + kSector - 1) & ~(kSector - 1);
            const uint32_t last_sector = end & ~(kSector - 1);
            const uint32_t sectors = first_sector < last_sector ? (last_sector - first_sector) / kSector : 0;
            const uint32_t subsectors = (length - sectors * kSector) / kSub;
            assert(total_commands(regions) == sectors + subsectors);
        }
    }

    // Three granularities.
    {
        const EraseMap mx25 = map_for("MX25L", 0x400000);
        const auto regions = plan_erase(mx25, 0x1000, 0x2F000);
        assert(regions.size() == 3);
        assert(regions[0].kind == BlockKind::Subsector && regions[0].commands() == 7);
        assert(regions[1].kind == BlockKind::HalfSector && regions[1].start == 0x8000);
        assert(regions[1].opcode == 0x52 && regions[1].commands() == 1);
        assert(regions[2].kind == BlockKind::Sector && regions[2].start == kSector && regions[2].commands() == 2);
        check_tiles(regions, 0x1000, 0x2F000);
    }

    // Validation happens before planning.
    assert(plan_erase(en25, 0x5000, 0).empty());
    assert(throws<ValueError>([&] { plan_erase(en25, 0x7100, 0x1000); }));
    assert(throws<ValueError>([&] { plan_erase(en25, 0x7000, 0x800); }));
    assert(throws<OutOfRangeError>([&] { plan_erase(en25, 0xFF000, 0x2000); }));
    assert(throws<OutOfRangeError>([&] { check_erase_range(en25, 0x100000, 0x1000); }));
    check_erase_range(en25, 0xFF000, 0x1000);

    // Whole device uses chip erase when the family has it, sectors otherwise.
    {
        const auto regions = plan_erase(en25, 0, 0x100000);
        assert(regions.size() == 1);
        assert(regions[0].kind == BlockKind::Chip && regions[0].end == 0x100000);

        EraseMap no_chip = en25;
        no_chip.chip_erase = false;
        const auto sectors = plan_erase(no_chip, 0, 0x100000);
        assert(sectors.size() == 1 && sectors[0].kind == BlockKind::Sector && sectors[0].commands() == 16);
    }

    // Parameter zone at the bottom: 4 KiB erases inside, whole sectors outside.
    {
        EraseMap s25 = map_for("S25FL", 0x400000);
        place_parameter_zone(s25, false);
        assert(s25.zone_start == 0 && s25.zone_end == 2 * kSector);

        const auto one = plan_erase(s25, 0x1000, 0x1000);
        assert(one.size() == 1 && one[0].kind == BlockKind::Subsector);
        assert(throws<ValueError>([&] { plan_erase(s25, 0x21000, 0x1000); }));
        assert(throws<ValueError>([&] { plan_erase(s25, 0x1F000, 0x2000); }));

        // A sector erase in the zone does not reach the parameter sectors.
        const auto regions = plan_erase(s25, 0, 0x30000);
        assert(regions.size() == 2);
        assert(regions[0].kind == BlockKind::Sector && regions[0].commands() == 3);
        assert(regions[1].kind == BlockKind::Subsector && regions[1].start == 0);
        assert(regions[1].end == 2 * kSector && regions[1].commands() == 32);

        EraseMap top = map_for("S25FL", 0x400000);
        place_parameter_zone(top, true);
        assert(top.zone_start == 0x400000 - 2 * kSector && top.zone_end == 0x400000);
        assert(throws<ValueError>([&] { plan_erase(top, 0x1000, 0x1000); }));
        const auto tail = plan_erase(top, 0x3FF000, 0x1000);
        assert(tail.size() == 1 && tail[0].kind == BlockKind::Subsector);
    }

    // DataFlash sector 0 is two erase units with the same opcode.
    {
        const EraseMap at45 = map_for("AT45DB", 0x400000, 5);
        assert(at45.layout == EraseLayout::SplitFirstSector);
        const auto regions = plan_erase(at45, 0, 2 * kSector);
        assert(regions.size() == 3);
        assert(regions[0].start == 0 && regions[0].end == kSub && regions[0].opcode == 0x7C);
        assert(regions[1].start == kSub && regions[1].end == kSector && regions[1].commands() == 1);
        assert(regions[2].start == kSector && regions[2].commands() == 1);
        check_tiles(regions, 0, 2 * kSector);

        const auto block = plan_erase(at45, 0, kSub);
        assert(block.size() == 1 && block[0].kind == BlockKind::Subsector && block[0].opcode == 0x50);
    }

    return 0;
}
