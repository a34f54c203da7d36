#include "spinor/device.hpp"

#include "spinor/address.hpp"
#include "spinor/errors.hpp"
#include "logging.hpp"

namespace spinor {

namespace {
constexpr uint8_t kLockRegisterWriteLock = 0x01;
}

void FlashDevice::unlock() {
    set_protection(false, 0, capacity_);
}

void FlashDevice::lock() {
    set_protection(true, 0, capacity_);
}

void FlashDevice::unlock(uint32_t address, uint32_t length) {
    protect_sectors(false, address, length);
}

void FlashDevice::lock(uint32_t address, uint32_t length) {
    protect_sectors(true, address, length);
}

void FlashDevice::protect_sectors(bool protect, uint32_t address, uint32_t length) {
    const LockScheme scheme = descriptor_.lock_scheme;
    const bool per_sector = scheme == LockScheme::SectorProtect || scheme == LockScheme::LockRegister;
    if (!per_sector && !(address == 0 && length == capacity_)) {
        throw NotSupportedError(name_ + " cannot " + (protect ? "lock" : "unlock") + " a partial range");
    }
    set_protection(protect, address, length);
}

// WRSR with the block-protect bits, then read back: the register may be
// frozen by the hardware-protect pin or a status-register lock bit.
void FlashDevice::write_status_register(uint8_t value, bool verify_clear) {
    if (descriptor_.lock_scheme == LockScheme::StatusRegisterEwsr) {
        issue({descriptor_.opcodes.enable_write_status});
    } else {
        write_enable();
    }
    issue({descriptor_.opcodes.write_status, value});
    wait_for_completion(TimingKind::Lock);
    if (verify_clear && (read_status().raw & descriptor_.status.protect_mask)) {
        throw RequestError("Cannot unprotect flash device");
    }
}

// Auto-increment programming refuses to run with any block protected.
void FlashDevice::clear_write_protection() {
    write_status_register(0x00, false);
}

void FlashDevice::set_protection(bool protect, uint32_t address, uint32_t length) {
    if (!has_feature(features::kLock) && !has_feature(features::kSectorLock)) {
        throw NotSupportedError(name_ + " has no lock support");
    }
    check_range(address, length, protect ? "Lock" : "Unlock");
    LOG_SPINOR_DEBUG("%s [0x%06x, +0x%x)", protect ? "lock" : "unlock", address, length);

    switch (descriptor_.lock_scheme) {
    case LockScheme::StatusRegister:
    case LockScheme::StatusRegisterEwsr:
        write_status_register(protect ? descriptor_.status.protect_all : 0x00, !protect);
        break;
    case LockScheme::GlobalUnlock:
        if (protect) {
            write_status_register(descriptor_.status.protect_all, false);
            break;
        }
        write_enable();
        issue({part_.back() == 'D' ? descriptor_.opcodes.global_unlock_d : descriptor_.opcodes.global_unlock});
        wait_for_completion(TimingKind::Page);
        break;
    case LockScheme::SectorProtect:
    case LockScheme::LockRegister: {
        const uint32_t sector = block_size(BlockKind::Sector);
        if ((address & (sector - 1)) || (length & (sector - 1))) {
            throw ValueError("Lock range must be aligned on sector boundaries");
        }
        const bool lock_register = descriptor_.lock_scheme == LockScheme::LockRegister;
        for (uint32_t at = address; at < address + length; at += sector) {
            write_enable();
            if (lock_register) {
                std::vector<uint8_t> command = addressed_command(descriptor_.opcodes.write_lock_register, at);
                command.push_back(protect ? kLockRegisterWriteLock : 0x00);
                issue(command);
                wait_for_completion(TimingKind::Lock);
            } else {
                issue(addressed_command(
                    protect ? descriptor_.opcodes.protect_sector : descriptor_.opcodes.unprotect_sector, at));
                wait_for_completion(TimingKind::Page);
            }
        }
        break;
    }
    case LockScheme::ProtectionRegister:
        issue(protect ? descriptor_.opcodes.protect_enable : descriptor_.opcodes.protect_disable);
        wait_for_completion(TimingKind::Lock);
        if (!protect && (read_status().raw & descriptor_.status.protect_mask)) {
            throw RequestError("Cannot unprotect flash device");
        }
        break;
    }
}

} // namespace spinor
