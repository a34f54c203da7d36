// Static description of one SPI NOR chip family.
#ifndef SPINOR_DESCRIPTOR_HPP
#define SPINOR_DESCRIPTOR_HPP

#include "spinor/types.hpp"

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <stdint.h>
#include <string>
#include <string_view>
#include <vector>

namespace spinor {

// How the three JEDEC bytes are laid out for a family.
enum class JedecLayout : uint8_t {
    DeviceCapacity,    // manufacturer, device code, capacity code
    ManufacturerEcho,  // manufacturer, device code, manufacturer (legacy 0x90 READ ID)
    CapacityRevision,  // manufacturer, capacity code, revision
    PackedDensity,     // manufacturer, family[7:5] | density[4:0], revision
};

enum class WriteMode : uint8_t {
    PageProgram,        // opcode + address + up to one page
    AutoIncrementWord,  // SST AAI, two bytes per command
    AutoIncrementByte,  // SST AAI, one byte per command
    BufferCommit,       // AT45: fill SRAM buffer, then commit to the array
};

enum class LockScheme : uint8_t {
    StatusRegister,      // WREN + WRSR block-protect bits
    StatusRegisterEwsr,  // EWSR + WRSR
    GlobalUnlock,        // WREN + single global unlock opcode
    SectorProtect,       // per-sector protect/unprotect opcodes
    LockRegister,        // per-sector lock register write
    ProtectionRegister,  // AT45 four-byte enable/disable sequence
};

enum class EraseLayout : uint8_t {
    Uniform,
    ParameterZone,     // 4 KiB parameter sectors in the two top or bottom sectors
    SplitFirstSector,  // sector 0 is erased as two commands (0a + 0b)
};

enum class NameStyle : uint8_t {
    Plain,           // "AT45DB"
    Megabits,        // "W25Q32"
    MegabitsPadded,  // "N25Q032"
};

struct Opcodes {
    uint8_t read = 0x03;
    uint8_t fast_read = 0x0B;
    uint8_t read_status = 0x05;
    uint8_t read_config = 0x35;
    uint8_t write_enable = 0x06;   // 0: the family has no write-enable latch
    uint8_t write_disable = 0x04;
    uint8_t write_status = 0x01;
    uint8_t enable_write_status = 0x50;
    uint8_t program = 0x02;        // page program or auto-increment program
    uint8_t buffer_fill = 0x84;
    uint8_t buffer_commit = 0x88;
    std::array<uint8_t, kBlockKindCount> erase{0x00, 0x20, 0x52, 0xD8, 0x00};
    std::vector<uint8_t> chip_erase{0xC7};
    uint8_t protect_sector = 0x36;
    uint8_t unprotect_sector = 0x39;
    uint8_t write_lock_register = 0xE5;
    uint8_t global_unlock = 0x98;
    uint8_t global_unlock_d = 0xF3; // device names ending in 'D'
    std::vector<uint8_t> protect_enable{0x3D, 0x2A, 0x7F, 0xA9};
    std::vector<uint8_t> protect_disable{0x3D, 0x2A, 0x7F, 0x9A};
    std::vector<uint8_t> binary_page_size{0x3D, 0x2A, 0x80, 0xA6};
    uint8_t unique_id = 0x4B;
};

struct StatusLayout {
    uint8_t busy_mask = 0x01;       // WIP
    bool busy_when_set = true;      // false: bit reports READY
    uint8_t protect_mask = 0x1C;    // bits that must read zero once unprotected
    uint8_t protect_all = 0x1C;     // value written to protect the whole array
    uint8_t page_size_flag = 0x00;  // set once pages are 2^N bytes (AT45)
};

struct UniqueIdLayout {
    uint8_t dummy_bytes = 4;
    uint8_t length = 0;
};

// Block sizes, timings and bus limit. Families with one layout carry a
// single entry; AT45 carries one per density code.
struct Geometry {
    BlockShifts block_shift{};
    TimingTable timings{};
    uint32_t max_frequency_hz = 0;
};

struct DeviceDescriptor {
    const char* family = "";
    const char* vendor = "";
    uint8_t manufacturer = 0;
    JedecLayout layout = JedecLayout::DeviceCapacity;
    std::map<uint8_t, const char*> devices;
    std::map<uint8_t, uint32_t> capacities;  // bytes, keyed by capacity (or device) code
    uint8_t revision_min = 0;
    uint8_t revision_max = 0xFF;
    uint8_t density_base = 0;                // PackedDensity: density code of geometries[0]
    std::vector<Geometry> geometries;
    FeatureMask features = 0;
    WriteMode write_mode = WriteMode::PageProgram;
    LockScheme lock_scheme = LockScheme::StatusRegister;
    EraseLayout erase_layout = EraseLayout::Uniform;
    NameStyle name_style = NameStyle::Megabits;
    const char* name_suffix = "";
    bool strict_max_frequency = false;
    Opcodes opcodes{};
    StatusLayout status{};
    UniqueIdLayout unique_id{};

    bool has_feature(FeatureMask feature) const noexcept { return (features & feature) == feature; }
};

// What a JEDEC identifier resolves to within one descriptor.
struct Resolution {
    std::string device;  // composed name, "W25Q32"
    std::string part;    // table entry, "W25Q"
    uint32_t capacity = 0;
    std::size_t geometry_index = 0;
};

std::optional<Resolution> resolve(const DeviceDescriptor& descriptor, const JedecId& jedec);

inline bool matches(const DeviceDescriptor& descriptor, const JedecId& jedec) {
    return resolve(descriptor, jedec).has_value();
}

// Throws std::logic_error when a claimed feature lacks its block size, timing or opcode.
void validate_descriptor(const DeviceDescriptor& descriptor);

// Dispatch order; the first matching entry wins.
const std::vector<DeviceDescriptor>& registered_descriptors();

const DeviceDescriptor* find_descriptor(std::string_view family);

// Capacity codes / device codes a family accepts, for listings.
std::vector<JedecId> example_ids(const DeviceDescriptor& descriptor);

} // namespace spinor

#endif // SPINOR_DESCRIPTOR_HPP
