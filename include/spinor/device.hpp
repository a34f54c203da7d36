#ifndef SPINOR_DEVICE_HPP
#define SPINOR_DEVICE_HPP

#include "spinor/clock.hpp"
#include "spinor/data_sink.hpp"
#include "spinor/descriptor.hpp"
#include "spinor/erase_plan.hpp"
#include "spinor/transport.hpp"
#include "spinor/types.hpp"

#include <cstddef>
#include <stdint.h>
#include <string>
#include <vector>

namespace spinor {

// One identified chip on one chip-select line. The caller owns the transport
// and the clock and must keep both alive for the lifetime of the device.
// Operations are synchronous; a TimeoutError leaves the chip state undefined.
class FlashDevice {
public:
    // Length sentinel for erase(): the whole device, only valid at address 0.
    static constexpr int64_t kWholeDevice = -1;

    // Runs the family's construction checks (AT45 page-size flag).
    FlashDevice(const DeviceDescriptor& descriptor, Resolution resolution, Transport& transport,
                Clock& clock = SystemClock::instance());

    FlashDevice(const FlashDevice&) = delete;
    FlashDevice& operator=(const FlashDevice&) = delete;

    const DeviceDescriptor& descriptor() const noexcept { return descriptor_; }
    const std::string& name() const noexcept { return name_; }
    uint32_t capacity() const noexcept { return capacity_; }
    // "Winbond W25Q32 4 MiB"
    std::string description() const;

    // Throws NotSupportedError for a granularity or timing the family lacks.
    uint32_t block_size(BlockKind kind) const;
    Timing timing(TimingKind kind) const;
    bool has_feature(FeatureMask feature) const noexcept { return descriptor_.has_feature(feature); }
    // Finest erase granularity.
    uint32_t erase_size() const;

    // hz == 0 selects the device maximum; larger requests are clamped, or
    // rejected with RequestError when the family declares its limit strict.
    void set_spi_frequency(uint32_t hz = 0);
    uint32_t spi_frequency() const { return transport_.frequency(); }

    StatusSnapshot read_status() const;
    bool is_busy() const { return read_status().busy(); }

    // Polls until ready. Sleeps the typical duration between polls and gives
    // up once typical + maximum has elapsed, never before the first poll.
    CompletionReport wait_for_completion(TimingKind kind) const;

    // Fast read (opcode, address, one dummy byte), chunked by the transport payload limit.
    std::vector<uint8_t> read(uint32_t address, uint32_t length) const;
    void read(uint32_t address, uint32_t length, DataSink& sink) const;
    // Plain 0x03 read, no dummy byte, for buses too slow or noisy for fast read.
    std::vector<uint8_t> read_slow(uint32_t address, uint32_t length) const;

    // Target range must have been erased; NOR programming only clears bits.
    void write(uint32_t address, const std::vector<uint8_t>& data);
    void write(uint32_t address, const uint8_t* data, std::size_t length);

    // Validation only; throws ValueError / OutOfRangeError.
    void can_erase(uint32_t address, uint32_t length) const;
    std::vector<EraseRegion> plan_erase(uint32_t address, uint32_t length) const;
    void erase(uint32_t address, int64_t length, bool verify = false);
    void erase_chip(bool verify = false);

    void unlock();
    void lock();
    // Per-sector schemes only; others raise NotSupportedError.
    void unlock(uint32_t address, uint32_t length);
    void lock(uint32_t address, uint32_t length);

    std::vector<uint8_t> unique_id() const;

    // Geometry the JEDEC ID selected; AT45 parts pick one per density code.
    const Geometry& geometry() const { return descriptor_.geometries[geometry_index_]; }

private:
    EraseMap erase_map() const;

    uint8_t exchange_byte(uint8_t opcode) const;
    void issue(const std::vector<uint8_t>& command) const;
    void write_enable() const;
    void write_disable() const;
    void check_range(uint32_t address, std::size_t length, const char* what) const;
    void check_page_size_mode() const;

    std::vector<uint8_t> read_with(uint8_t opcode, std::size_t dummy_bytes, uint32_t address, uint32_t length) const;
    void verify_erased(uint32_t address, uint32_t length) const;

    void program_pages(uint32_t address, const uint8_t* data, std::size_t length);
    void program_auto_increment(uint32_t address, const uint8_t* data, std::size_t length, std::size_t step);
    void program_buffered(uint32_t address, const uint8_t* data, std::size_t length);

    void erase_region(const EraseRegion& region);
    void issue_chip_erase();

    void write_status_register(uint8_t value, bool verify_clear);
    void clear_write_protection();
    void protect_sectors(bool protect, uint32_t address, uint32_t length);
    void set_protection(bool protect, uint32_t address, uint32_t length);

    const DeviceDescriptor& descriptor_;
    Transport& transport_;
    Clock& clock_;
    std::string name_;
    std::string part_;
    uint32_t capacity_;
    std::size_t geometry_index_;
};

} // namespace spinor

#endif // SPINOR_DEVICE_HPP
