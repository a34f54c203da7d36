#include "spinor/device.hpp"

#include "spinor/address.hpp"
#include "spinor/errors.hpp"
#include "logging.hpp"

namespace spinor {

namespace {
constexpr uint8_t kTopParameterZone = 0x04; // TBPARM in the configuration register
}

EraseMap FlashDevice::erase_map() const {
    EraseMap map = make_erase_map(descriptor_, geometry(), capacity_);
    if (map.layout == EraseLayout::ParameterZone) {
        // A previous configuration decides where the 4 KiB parameter sectors live.
        const uint8_t config = exchange_byte(descriptor_.opcodes.read_config);
        place_parameter_zone(map, (config & kTopParameterZone) != 0);
    }
    return map;
}

void FlashDevice::can_erase(uint32_t address, uint32_t length) const {
    check_erase_range(erase_map(), address, length);
}

std::vector<EraseRegion> FlashDevice::plan_erase(uint32_t address, uint32_t length) const {
    return spinor::plan_erase(erase_map(), address, length);
}

void FlashDevice::erase(uint32_t address, int64_t length, bool verify) {
    if (length == kWholeDevice) {
        if (address != 0) {
            throw ValueError("Whole-device erase must start at address 0");
        }
        length = capacity_;
    }
    if (length < 0 || length > static_cast<int64_t>(capacity_)) {
        throw OutOfRangeError("Invalid erase length " + std::to_string(length));
    }
    const auto bytes = static_cast<uint32_t>(length);
    for (const EraseRegion& region : plan_erase(address, bytes)) {
        erase_region(region);
    }
    if (verify && bytes) {
        verify_erased(address, bytes);
    }
}

void FlashDevice::erase_region(const EraseRegion& region) {
    if (region.kind == BlockKind::Chip) {
        issue_chip_erase();
        return;
    }
    const TimingKind timing_kind = erase_timing_for(region.kind);
    for (uint32_t at = region.start; at < region.end; at += region.block_size) {
        write_enable();
        LOG_SPINOR_TRACE("erase %s at 0x%06x", to_string(region.kind), at);
        issue(addressed_command(region.opcode, at));
        wait_for_completion(timing_kind);
    }
}

void FlashDevice::issue_chip_erase() {
    write_enable();
    LOG_SPINOR_TRACE("chip erase");
    issue(descriptor_.opcodes.chip_erase);
    wait_for_completion(TimingKind::Chip);
}

void FlashDevice::erase_chip(bool verify) {
    if (!has_feature(features::kChipErase)) {
        throw NotSupportedError(name_ + " has no chip erase command");
    }
    // A previous command may still be running.
    wait_for_completion(TimingKind::Chip);
    issue_chip_erase();
    if (verify) {
        verify_erased(0, capacity_);
    }
}

} // namespace spinor
