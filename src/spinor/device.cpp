#include "spinor/device.hpp"

#include "spinor/errors.hpp"
#include "logging.hpp"

#include <cstdio>
#include <stdexcept>
#include <utility>

namespace spinor {

FlashDevice::FlashDevice(const DeviceDescriptor& descriptor, Resolution resolution, Transport& transport,
                         Clock& clock)
    : descriptor_(descriptor),
      transport_(transport),
      clock_(clock),
      name_(std::move(resolution.device)),
      part_(std::move(resolution.part)),
      capacity_(resolution.capacity),
      geometry_index_(resolution.geometry_index) {
    if (geometry_index_ >= descriptor_.geometries.size()) {
        throw std::logic_error(std::string("geometry index out of range for ") + descriptor_.family);
    }
    check_page_size_mode();
}

// DataFlash parts ship with 264/528-byte pages; linear addressing needs the
// binary page size, which only takes effect after a power cycle.
void FlashDevice::check_page_size_mode() const {
    const uint8_t flag = descriptor_.status.page_size_flag;
    if (flag == 0) {
        return;
    }
    if (read_status().raw & flag) {
        return;
    }
    LOG_SPINOR_WARN("%s uses non power-of-two pages, reconfiguring", name_.c_str());
    issue(descriptor_.opcodes.binary_page_size);
    throw RequestError(name_ + " page size reconfigured to 2^N bytes, power-cycle required");
}

std::string FlashDevice::description() const {
    return std::string(descriptor_.vendor) + " " + name_ + " " + format_size(capacity_);
}

uint32_t FlashDevice::block_size(BlockKind kind) const {
    if (kind == BlockKind::Chip) {
        return capacity_;
    }
    const uint8_t shift = geometry().block_shift[static_cast<std::size_t>(kind)];
    if (shift == 0) {
        throw NotSupportedError(std::string("Block kind '") + to_string(kind) + "' not supported by " + name_);
    }
    return 1u << shift;
}

Timing FlashDevice::timing(TimingKind kind) const {
    const auto& entry = geometry().timings[static_cast<std::size_t>(kind)];
    if (!entry) {
        throw NotSupportedError(std::string("No '") + to_string(kind) + "' timing for " + name_);
    }
    return *entry;
}

uint32_t FlashDevice::erase_size() const {
    const EraseMap map = make_erase_map(descriptor_, geometry(), capacity_);
    if (map.granularities.empty()) {
        throw NotSupportedError(name_ + " has no erase granularity");
    }
    return map.granularities.back().size;
}

void FlashDevice::set_spi_frequency(uint32_t hz) {
    const uint32_t limit = geometry().max_frequency_hz;
    uint32_t frequency = hz ? hz : limit;
    if (frequency > limit) {
        if (descriptor_.strict_max_frequency) {
            throw RequestError(name_ + ": SPI frequency " + std::to_string(hz) + " Hz above device maximum " +
                               std::to_string(limit) + " Hz");
        }
        LOG_SPINOR_DEBUG("Clamping SPI frequency %u Hz to %u Hz", frequency, limit);
        frequency = limit;
    }
    transport_.set_frequency(frequency);
}

uint8_t FlashDevice::exchange_byte(uint8_t opcode) const {
    const std::vector<uint8_t> reply = transport_.exchange({opcode}, 1);
    if (reply.size() != 1) {
        char message[48];
        std::snprintf(message, sizeof(message), "Short reply to command 0x%02x", opcode);
        throw FlashError(message);
    }
    return reply[0];
}

void FlashDevice::issue(const std::vector<uint8_t>& command) const {
    transport_.exchange(command, 0);
}

void FlashDevice::write_enable() const {
    if (descriptor_.opcodes.write_enable) {
        issue({descriptor_.opcodes.write_enable});
    }
}

void FlashDevice::write_disable() const {
    if (descriptor_.opcodes.write_disable) {
        issue({descriptor_.opcodes.write_disable});
    }
}

StatusSnapshot FlashDevice::read_status() const {
    StatusSnapshot snapshot;
    snapshot.raw = exchange_byte(descriptor_.opcodes.read_status);
    const bool bit = (snapshot.raw & descriptor_.status.busy_mask) != 0;
    const bool busy = descriptor_.status.busy_when_set ? bit : !bit;
    snapshot.state = busy ? DeviceState::Busy : DeviceState::Ready;
    return snapshot;
}

CompletionReport FlashDevice::wait_for_completion(TimingKind kind) const {
    const Timing t = timing(kind);
    CompletionReport report;
    if (t.immediate()) {
        return report;
    }
    const uint64_t start = clock_.now_ns();
    const uint64_t deadline = start + t.typical_ns + t.max_ns;
    while (read_status().busy()) {
        const uint64_t now = clock_.now_ns();
        if (report.polls > 0 && now > deadline) {
            LOG_SPINOR_ERROR("%s: %s still busy after %u polls", name_.c_str(), to_string(kind), report.polls);
            throw TimeoutError(kind, report.polls, now - start);
        }
        clock_.sleep_ns(t.typical_ns);
        ++report.polls;
    }
    report.elapsed_ns = clock_.now_ns() - start;
    LOG_SPINOR_TRACE("%s ready after %u polls, %llu us", to_string(kind), report.polls,
                     (unsigned long long)(report.elapsed_ns / 1000));
    return report;
}

void FlashDevice::check_range(uint32_t address, std::size_t length, const char* what) const {
    if (static_cast<uint64_t>(address) + length > capacity_) {
        char message[112];
        std::snprintf(message, sizeof(message), "%s of %zu bytes at 0x%06x exceeds capacity 0x%x", what, length,
                      address, capacity_);
        throw OutOfRangeError(message);
    }
}

std::vector<uint8_t> FlashDevice::unique_id() const {
    if (!has_feature(features::kUniqueId)) {
        throw NotSupportedError(name_ + " has no unique ID");
    }
    std::vector<uint8_t> command{descriptor_.opcodes.unique_id};
    command.insert(command.end(), descriptor_.unique_id.dummy_bytes, 0x00);
    std::vector<uint8_t> id = transport_.exchange(command, descriptor_.unique_id.length);
    if (id.size() != descriptor_.unique_id.length) {
        char message[64];
        std::snprintf(message, sizeof(message), "Short unique ID read: %zu of %zu bytes", id.size(),
                      static_cast<std::size_t>(descriptor_.unique_id.length));
        throw FlashError(message);
    }
    return id;
}

} // namespace spinor
