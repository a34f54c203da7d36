#include "spinor/device.hpp"

#include "spinor/address.hpp"
#include "spinor/errors.hpp"
#include "spinor/write_plan.hpp"
#include "logging.hpp"

#include <algorithm>
#include <exception>

namespace spinor {

void FlashDevice::write(uint32_t address, const std::vector<uint8_t>& data) {
    write(address, data.data(), data.size());
}

void FlashDevice::write(uint32_t address, const uint8_t* data, std::size_t length) {
    check_range(address, length, "Write");
    switch (descriptor_.write_mode) {
    case WriteMode::PageProgram:
        program_pages(address, data, length);
        break;
    case WriteMode::AutoIncrementWord:
        if ((address & 0x1) || (length & 0x1) || length == 0) {
            throw ValueError("Auto-increment word write needs an even address and a non-empty even length");
        }
        program_auto_increment(address, data, length, 2);
        break;
    case WriteMode::AutoIncrementByte:
        program_auto_increment(address, data, length, 1);
        break;
    case WriteMode::BufferCommit:
        program_buffered(address, data, length);
        break;
    }
}

void FlashDevice::program_pages(uint32_t address, const uint8_t* data, std::size_t length) {
    const uint32_t page = block_size(BlockKind::Page);
    for (const PageChunk& chunk : plan_page_writes(address, length, page)) {
        write_enable();
        std::vector<uint8_t> command = addressed_command(descriptor_.opcodes.program, chunk.address);
        command.insert(command.end(), data + chunk.offset, data + chunk.offset + chunk.length);
        LOG_SPINOR_TRACE("program [0x%06x, +%zu)", chunk.address, chunk.length);
        issue(command);
        wait_for_completion(TimingKind::Page);
    }
}

// SST auto address increment: the first command carries the address, the
// following ones only data. The chip leaves AAI mode on WRDI.
void FlashDevice::program_auto_increment(uint32_t address, const uint8_t* data, std::size_t length,
                                         std::size_t step) {
    if (length == 0) {
        return;
    }
    clear_write_protection();
    write_enable();
    const uint8_t opcode = descriptor_.opcodes.program;
    try {
        for (std::size_t offset = 0; offset < length; offset += step) {
            std::vector<uint8_t> command;
            if (offset == 0) {
                command = addressed_command(opcode, address);
            } else {
                command.push_back(opcode);
            }
            command.insert(command.end(), data + offset, data + offset + step);
            issue(command);
            wait_for_completion(TimingKind::Byte);
        }
    } catch (const std::exception&) {
        // A chip left in AAI mode ignores every other command.
        write_disable();
        throw;
    }
    write_disable();
    LOG_SPINOR_TRACE("auto-increment program [0x%06x, +%zu)", address, length);
}

// DataFlash: fill SRAM buffer 1 with a whole page, then commit it to the
// array. Bytes outside the request keep the erased value.
void FlashDevice::program_buffered(uint32_t address, const uint8_t* data, std::size_t length) {
    const uint32_t page = block_size(BlockKind::Page);
    for (const PageChunk& chunk : plan_page_writes(address, length, page)) {
        const uint32_t page_start = chunk.address & ~(page - 1);
        const uint32_t in_page = chunk.address - page_start;

        std::vector<uint8_t> fill = addressed_command(descriptor_.opcodes.buffer_fill, 0);
        const std::size_t header = fill.size();
        fill.resize(header + page, kErasedByte);
        std::copy(data + chunk.offset, data + chunk.offset + chunk.length, fill.begin() + header + in_page);
        issue(fill);
        wait_for_completion(TimingKind::Page);

        issue(addressed_command(descriptor_.opcodes.buffer_commit, page_start));
        wait_for_completion(TimingKind::Page);
        LOG_SPINOR_TRACE("buffer commit page 0x%06x (%zu bytes)", page_start, chunk.length);
    }
}

} // namespace spinor
