#include "spinor/descriptor.hpp"

#include <initializer_list>
#include <iterator>
#include <utility>

namespace spinor {

namespace {

using features::kChipErase;
using features::kHalfSectorErase;
using features::kLock;
using features::kSectorErase;
using features::kSectorLock;
using features::kSubsectorErase;
using features::kUniqueId;

constexpr uint32_t MiB(uint32_t n) { return n << 20; }
constexpr uint32_t KiB(uint32_t n) { return n << 10; }
constexpr uint32_t MHz(uint32_t n) { return n * 1000000u; }

// Shifts in BlockKind order; chip is derived from the capacity code unless given.
BlockShifts shifts(uint8_t page, uint8_t subsector, uint8_t half_sector, uint8_t sector, uint8_t chip = 0) {
    return BlockShifts{page, subsector, half_sector, sector, chip};
}

TimingTable timings(std::initializer_list<std::pair<TimingKind, Timing>> entries) {
    TimingTable table{};
    for (const auto& [kind, timing] : entries) {
        table[static_cast<std::size_t>(kind)] = timing;
    }
    return table;
}

Geometry geometry(BlockShifts block_shift, TimingTable table, uint32_t max_frequency_hz) {
    return Geometry{.block_shift = block_shift, .timings = std::move(table), .max_frequency_hz = max_frequency_hz};
}

// Capacity codes 0x11..0x18 map to 128 KiB..16 MiB on most 25-series parts.
std::map<uint8_t, uint32_t> power_of_two_capacities(uint8_t first, uint8_t last) {
    std::map<uint8_t, uint32_t> sizes;
    for (unsigned code = first; code <= last; ++code) {
        sizes[static_cast<uint8_t>(code)] = 1u << code;
    }
    return sizes;
}

std::vector<Geometry> at45_geometries() {
    static constexpr uint8_t kPage[] = {8, 8, 8, 8, 9, 9, 8};
    static constexpr uint8_t kSubsector[] = {11, 11, 11, 11, 12, 12, 11};
    static constexpr uint8_t kSector[] = {15, 15, 16, 16, 17, 16, 18};
    static constexpr uint8_t kChip[] = {17, 18, 19, 20, 21, 22, 23};
    static constexpr uint32_t kFrequency[] = {66, 85, 85, 133, 85, 85, 85};
    static constexpr Timing kPageTiming[] = {seconds(0.002, 0.004), seconds(0.0015, 0.003),
                                             seconds(0.0015, 0.003), seconds(0.002, 0.004),
                                             seconds(0.003, 0.004), seconds(0.003, 0.004),
                                             seconds(0.0015, 0.005)};
    static constexpr Timing kSubsectorTiming[] = {seconds(0.018, 0.035), seconds(0.025, 0.035),
                                                  seconds(0.030, 0.035), seconds(0.030, 0.075),
                                                  seconds(0.045, 0.100), seconds(0.045, 0.100),
                                                  seconds(0.025, 0.050)};
    static constexpr Timing kSectorTiming[] = {seconds(0.4, 0.7), seconds(0.35, 0.55), seconds(0.7, 1.1),
                                               seconds(0.7, 1.3), seconds(1.4, 2.0), seconds(0.7, 1.4),
                                               seconds(2.5, 6.5)};
    static constexpr Timing kChipTiming[] = {seconds(1.2, 3.0), seconds(3.0, 4.0), seconds(5.0, 17.0),
                                             seconds(10.0, 20.0), seconds(22.0, 40.0), seconds(45.0, 80.0),
                                             seconds(80.0, 208.0)};

    std::vector<Geometry> out;
    for (std::size_t i = 0; i < std::size(kPage); ++i) {
        out.push_back(geometry(shifts(kPage[i], kSubsector[i], 0, kSector[i], kChip[i]),
                               timings({{TimingKind::Page, kPageTiming[i]},
                                        {TimingKind::Subsector, kSubsectorTiming[i]},
                                        {TimingKind::Sector, kSectorTiming[i]},
                                        {TimingKind::Chip, kChipTiming[i]},
                                        {TimingKind::Lock, seconds(1.0, 2.0)}}),
                               MHz(kFrequency[i])));
    }
    return out;
}

std::vector<DeviceDescriptor> build_table() {
    std::vector<DeviceDescriptor> table;

    table.push_back(DeviceDescriptor{
        .family = "SST25",
        .vendor = "SST",
        .manufacturer = 0xBF,
        .devices = {{0x25, "SST25"}},
        .capacities = {{0x41, MiB(2)}, {0x4A, MiB(4)}},
        .geometries = {geometry(shifts(0, 12, 15, 16),
                                timings({{TimingKind::Subsector, seconds(0.025, 0.025)},
                                         {TimingKind::HalfSector, seconds(0.025, 0.025)},
                                         {TimingKind::Sector, seconds(0.025, 0.025)},
                                         {TimingKind::Lock, seconds(0.0, 0.0)},
                                         {TimingKind::Byte, seconds(0.00001, 0.01)},
                                         {TimingKind::Chip, seconds(0.035, 0.05)}}),
                                MHz(66))},
        .features = kSectorErase | kHalfSectorErase | kSubsectorErase | kChipErase | kLock,
        .write_mode = WriteMode::AutoIncrementWord,
        .name_style = NameStyle::Plain,
        .opcodes = Opcodes{.program = 0xAD},
    });

    // No JEDEC READ ID: answers the legacy 0x90 command with manufacturer, device, manufacturer.
    table.push_back(DeviceDescriptor{
        .family = "SST25VFxxxA",
        .vendor = "Microchip",
        .manufacturer = 0xBF,
        .layout = JedecLayout::ManufacturerEcho,
        .devices = {{0x48, "SST25VF512A"}, {0x49, "SST25VF010A"}},
        .capacities = {{0x48, KiB(64)}, {0x49, KiB(128)}},
        .geometries = {geometry(shifts(0, 0, 0, 12),
                                timings({{TimingKind::Sector, seconds(0.025, 0.026)},
                                         {TimingKind::Byte, seconds(0.00002, 0.02)},
                                         {TimingKind::Lock, seconds(0.0, 0.0)},
                                         {TimingKind::Chip, seconds(0.1, 0.1)}}),
                                MHz(20))},
        .features = kSectorErase | kChipErase | kLock,
        .write_mode = WriteMode::AutoIncrementByte,
        .lock_scheme = LockScheme::StatusRegisterEwsr,
        .name_style = NameStyle::Plain,
        .strict_max_frequency = true,
        .opcodes = Opcodes{.program = 0xAF, .erase = {0x00, 0x00, 0x00, 0x20, 0x00}},
        .status = StatusLayout{.protect_mask = 0x0C, .protect_all = 0x0C},
    });

    table.push_back(DeviceDescriptor{
        .family = "S25FL",
        .vendor = "Spansion",
        .manufacturer = 0x01,
        .devices = {{0x02, "S25FL"}},
        .capacities = {{0x15, MiB(4)}, {0x16, MiB(8)}},
        .geometries = {geometry(shifts(8, 12, 0, 16),
                                timings({{TimingKind::Page, seconds(0.0015, 0.003)},
                                         {TimingKind::Subsector, seconds(0.2, 0.8)},
                                         {TimingKind::Sector, seconds(0.5, 2.0)},
                                         {TimingKind::Chip, seconds(32, 64)},
                                         {TimingKind::Lock, seconds(0.0015, 0.1)}}),
                                MHz(104))},
        .features = kSectorErase | kSubsectorErase | kChipErase | kLock,
        .erase_layout = EraseLayout::ParameterZone,
        .name_style = NameStyle::Plain,
    });

    table.push_back(DeviceDescriptor{
        .family = "M25Px",
        .vendor = "Numonix",
        .manufacturer = 0x20,
        .devices = {{0x71, "M25P"}, {0x20, "M25PX"}},
        .capacities = power_of_two_capacities(0x15, 0x18),
        .geometries = {geometry(shifts(8, 12, 0, 16),
                                timings({{TimingKind::Page, seconds(0.0015, 0.003)},
                                         {TimingKind::Subsector, seconds(0.15, 0.15)},
                                         {TimingKind::Sector, seconds(3.0, 3.0)},
                                         {TimingKind::Chip, seconds(32, 64)},
                                         {TimingKind::Lock, seconds(0.0015, 0.003)}}),
                                MHz(75))},
        .features = kSectorErase | kSubsectorErase | kChipErase | kLock,
    });

    table.push_back(DeviceDescriptor{
        .family = "W25x",
        .vendor = "Winbond",
        .manufacturer = 0xEF,
        .devices = {{0x30, "W25X"}, {0x40, "W25Q"}},
        .capacities = power_of_two_capacities(0x11, 0x18),
        .geometries = {geometry(shifts(8, 12, 0, 16),
                                timings({{TimingKind::Page, seconds(0.0015, 0.003)},
                                         {TimingKind::Subsector, seconds(0.2, 0.2)},
                                         {TimingKind::Sector, seconds(1.0, 1.0)},
                                         {TimingKind::Chip, seconds(32, 64)},
                                         {TimingKind::Lock, seconds(0.05, 0.1)}}),
                                MHz(104))},
        .features = kSectorErase | kSubsectorErase | kChipErase | kLock | kUniqueId,
        .unique_id = UniqueIdLayout{.dummy_bytes = 4, .length = 8},
    });

    table.push_back(DeviceDescriptor{
        .family = "MX25L",
        .vendor = "Macronix",
        .manufacturer = 0xC2,
        .devices = {{0x9E, "MX25D"}, {0x26, "MX25E"}, {0x20, "MX25E06"}},
        .capacities = power_of_two_capacities(0x15, 0x18),
        .geometries = {geometry(shifts(8, 12, 15, 16),
                                timings({{TimingKind::Page, seconds(0.0015, 0.003)},
                                         {TimingKind::Subsector, seconds(0.3, 0.3)},
                                         {TimingKind::HalfSector, seconds(2.0, 2.0)},
                                         {TimingKind::Sector, seconds(2.0, 2.0)},
                                         {TimingKind::Chip, seconds(32, 64)},
                                         {TimingKind::Lock, seconds(0.0015, 0.003)}}),
                                MHz(104))},
        .features = kSectorErase | kHalfSectorErase | kSubsectorErase | kChipErase | kLock,
        .lock_scheme = LockScheme::GlobalUnlock,
    });

    table.push_back(DeviceDescriptor{
        .family = "EN25Q",
        .vendor = "Eon",
        .manufacturer = 0x1C,
        .devices = {{0x30, "EN25Q"}},
        .capacities = power_of_two_capacities(0x15, 0x17),
        .geometries = {geometry(shifts(8, 12, 0, 16),
                                timings({{TimingKind::Page, seconds(0.0015, 0.003)},
                                         {TimingKind::Subsector, seconds(0.3, 0.3)},
                                         {TimingKind::Sector, seconds(2.0, 2.0)},
                                         {TimingKind::Chip, seconds(32, 64)},
                                         {TimingKind::Lock, seconds(0.0015, 0.003)}}),
                                MHz(100))},
        .features = kSectorErase | kSubsectorErase | kChipErase | kLock,
    });

    // Revision 1 is also claimed by AT25DFxA below; this entry is registered first and wins.
    table.push_back(DeviceDescriptor{
        .family = "AT25DF",
        .vendor = "Atmel",
        .manufacturer = 0x1F,
        .layout = JedecLayout::CapacityRevision,
        .devices = {{0x00, "AT25DF"}},
        .capacities = {{0x46, MiB(2)}, {0x47, MiB(4)}, {0x48, MiB(8)}},
        .revision_min = 0x00,
        .revision_max = 0x01,
        .geometries = {geometry(shifts(8, 12, 0, 16),
                                timings({{TimingKind::Page, seconds(0.0015, 0.003)},
                                         {TimingKind::Subsector, seconds(0.2, 0.2)},
                                         {TimingKind::Sector, seconds(0.95, 0.95)},
                                         {TimingKind::Chip, seconds(32, 64)},
                                         {TimingKind::Lock, seconds(0.0015, 0.003)}}),
                                MHz(85))},
        .features = kSectorErase | kSubsectorErase | kChipErase | kSectorLock,
        .lock_scheme = LockScheme::SectorProtect,
    });

    table.push_back(DeviceDescriptor{
        .family = "AT25DFxA",
        .vendor = "Atmel",
        .manufacturer = 0x1F,
        .layout = JedecLayout::CapacityRevision,
        .devices = {{0x00, "AT25DF"}},
        .capacities = {{0x46, MiB(2)}, {0x47, MiB(4)}, {0x48, MiB(8)}},
        .revision_min = 0x01,
        .revision_max = 0x1F,
        .geometries = {geometry(shifts(8, 12, 15, 16),
                                timings({{TimingKind::Page, seconds(0.001, 0.003)},
                                         {TimingKind::Subsector, seconds(0.05, 0.2)},
                                         {TimingKind::HalfSector, seconds(0.25, 0.6)},
                                         {TimingKind::Sector, seconds(0.4, 0.95)},
                                         {TimingKind::Chip, seconds(32, 64)},
                                         {TimingKind::Lock, seconds(0.0015, 0.003)}}),
                                MHz(100))},
        .features = kSectorErase | kHalfSectorErase | kSubsectorErase | kChipErase | kLock,
        .name_suffix = "A",
        .status = StatusLayout{.protect_mask = 0x0C, .protect_all = 0x3C},
    });

    // DataFlash: own command set, no write-enable latch, READY bit instead of WIP.
    table.push_back(DeviceDescriptor{
        .family = "AT45DB",
        .vendor = "Atmel",
        .manufacturer = 0x1F,
        .layout = JedecLayout::PackedDensity,
        .devices = {{0x01, "AT45DB"}},
        .capacities = {},  // sized by the density field of the device code
        .density_base = 2,
        .geometries = at45_geometries(),
        .features = kSectorErase | kSubsectorErase | kChipErase | kLock,
        .write_mode = WriteMode::BufferCommit,
        .lock_scheme = LockScheme::ProtectionRegister,
        .erase_layout = EraseLayout::SplitFirstSector,
        .name_style = NameStyle::Plain,
        .opcodes = Opcodes{.read_status = 0xD7,
                           .write_enable = 0x00,
                           .erase = {0x81, 0x50, 0x00, 0x7C, 0x00},
                           .chip_erase = {0xC7, 0x94, 0x80, 0x9A}},
        .status = StatusLayout{.busy_mask = 0x80,
                               .busy_when_set = false,
                               .protect_mask = 0x02,
                               .protect_all = 0x02,
                               .page_size_flag = 0x01},
    });

    table.push_back(DeviceDescriptor{
        .family = "N25Q",
        .vendor = "Micron",
        .manufacturer = 0x20,
        .devices = {{0xBA, "N25Q"}},
        .capacities = power_of_two_capacities(0x15, 0x18),
        .geometries = {geometry(shifts(8, 12, 0, 16),
                                timings({{TimingKind::Page, seconds(0.0005, 0.005)},
                                         {TimingKind::Subsector, seconds(0.3, 3.0)},
                                         {TimingKind::Sector, seconds(0.7, 3.0)},
                                         {TimingKind::Chip, seconds(60, 120)},
                                         {TimingKind::Lock, seconds(0.0005, 0.005)}}),
                                MHz(105))},
        .features = kSectorErase | kSubsectorErase | kChipErase | kSectorLock,
        .lock_scheme = LockScheme::LockRegister,
        .name_style = NameStyle::MegabitsPadded,
    });

    table.push_back(DeviceDescriptor{
        .family = "GD25Q",
        .vendor = "GigaDevice",
        .manufacturer = 0xC8,
        .devices = {{0x40, "GD25Q"}},
        .capacities = power_of_two_capacities(0x14, 0x18),
        .geometries = {geometry(shifts(8, 12, 15, 16),
                                timings({{TimingKind::Page, seconds(0.0006, 0.0024)},
                                         {TimingKind::Subsector, seconds(0.045, 0.3)},
                                         {TimingKind::HalfSector, seconds(0.15, 0.8)},
                                         {TimingKind::Sector, seconds(0.25, 1.2)},
                                         {TimingKind::Chip, seconds(10, 30)},
                                         {TimingKind::Lock, seconds(0.005, 0.03)}}),
                                MHz(120))},
        .features = kSectorErase | kHalfSectorErase | kSubsectorErase | kChipErase | kLock,
        .status = StatusLayout{.protect_mask = 0x7C, .protect_all = 0x1C},
    });

    table.push_back(DeviceDescriptor{
        .family = "IS25LP",
        .vendor = "ISSI",
        .manufacturer = 0x9D,
        .devices = {{0x60, "IS25LP"}},
        .capacities = power_of_two_capacities(0x16, 0x18),
        .geometries = {geometry(shifts(8, 12, 15, 16),
                                timings({{TimingKind::Page, seconds(0.0002, 0.0008)},
                                         {TimingKind::Subsector, seconds(0.045, 0.3)},
                                         {TimingKind::HalfSector, seconds(0.14, 0.5)},
                                         {TimingKind::Sector, seconds(0.17, 1.0)},
                                         {TimingKind::Chip, seconds(35, 110)},
                                         {TimingKind::Lock, seconds(0.002, 0.015)}}),
                                MHz(133))},
        .features = kSectorErase | kHalfSectorErase | kSubsectorErase | kChipErase | kLock | kUniqueId,
        .status = StatusLayout{.protect_mask = 0x3C, .protect_all = 0x3C},
        .unique_id = UniqueIdLayout{.dummy_bytes = 4, .length = 16},
    });

    for (const auto& descriptor : table) {
        validate_descriptor(descriptor);
    }
    return table;
}

} // namespace

const std::vector<DeviceDescriptor>& registered_descriptors() {
    static const std::vector<DeviceDescriptor> table = build_table();
    return table;
}

} // namespace spinor
