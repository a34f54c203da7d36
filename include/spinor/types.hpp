// Basic SPI NOR types shared by the descriptor table and the device engine
#ifndef SPINOR_TYPES_HPP
#define SPINOR_TYPES_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <stdint.h>
#include <string>

namespace spinor {

// Value of every byte after an erase.
constexpr uint8_t kErasedByte = 0xFF;

// Three bytes returned by the JEDEC READ ID command (0x9F).
struct JedecId {
    std::array<uint8_t, 3> bytes{0, 0, 0};

    uint8_t manufacturer() const noexcept { return bytes[0]; }
    uint8_t code_a() const noexcept { return bytes[1]; }
    uint8_t code_b() const noexcept { return bytes[2]; }
    bool all_zero() const noexcept { return bytes[0] == 0 && bytes[1] == 0 && bytes[2] == 0; }

    // "ef:40:16"
    std::string to_string() const;
};

// Erase/program block granularities, smallest first.
enum class BlockKind : uint8_t {
    Page = 0,
    Subsector,   // typically 4 KiB
    HalfSector,  // typically 32 KiB
    Sector,      // typically 64 KiB
    Chip,
};
constexpr std::size_t kBlockKindCount = 5;

enum class TimingKind : uint8_t {
    Page = 0,    // page program / buffer fill / buffer commit
    Byte,        // one auto-increment step
    Subsector,
    HalfSector,
    Sector,
    Chip,
    Lock,        // status register or lock register update
};
constexpr std::size_t kTimingKindCount = 7;

const char* to_string(BlockKind kind) noexcept;
const char* to_string(TimingKind kind) noexcept;

// Erase timing for a block kind.
TimingKind erase_timing_for(BlockKind kind) noexcept;

// (typical, maximum) duration of an internal operation.
struct Timing {
    uint64_t typical_ns = 0;
    uint64_t max_ns = 0;

    // The operation completes before the next command can be clocked in.
    bool immediate() const noexcept { return typical_ns == 0 && max_ns == 0; }
};

constexpr Timing seconds(double typical, double maximum) {
    return Timing{static_cast<uint64_t>(typical * 1e9 + 0.5), static_cast<uint64_t>(maximum * 1e9 + 0.5)};
}

using TimingTable = std::array<std::optional<Timing>, kTimingKindCount>;
// Size exponents per BlockKind; 0 means the granularity does not exist.
using BlockShifts = std::array<uint8_t, kBlockKindCount>;

using FeatureMask = uint32_t;

namespace features {
constexpr FeatureMask kLock           = 0x001; // basic, revertible locking
constexpr FeatureMask kInvertedLock   = 0x002; // lock bits are inverted
constexpr FeatureMask kSectorLock     = 0x004; // per-sector locking
constexpr FeatureMask kOtpLock        = 0x008; // one-time programmable lock
constexpr FeatureMask kUniqueId       = 0x010; // factory unique identifier
constexpr FeatureMask kSectorErase    = 0x100;
constexpr FeatureMask kHalfSectorErase = 0x200;
constexpr FeatureMask kSubsectorErase = 0x400;
constexpr FeatureMask kChipErase      = 0x800;
} // namespace features

// Outcome of one status poll.
enum class DeviceState : uint8_t {
    Ready,
    Busy,
};

// One status register read. Never cached: the chip updates it asynchronously.
struct StatusSnapshot {
    uint8_t raw = 0;
    DeviceState state = DeviceState::Ready;

    bool busy() const noexcept { return state == DeviceState::Busy; }
};

// Result of waiting on an internal operation.
struct CompletionReport {
    unsigned polls = 0;
    uint64_t elapsed_ns = 0;
};

// "4 MiB", "64 KiB", "512 bytes"
std::string format_size(uint64_t bytes);

} // namespace spinor

#endif // SPINOR_TYPES_HPP
