#include "spinor/device.hpp"

#include "spinor/address.hpp"
#include "spinor/errors.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cstdio>

namespace spinor {

namespace {
constexpr std::size_t kFastReadDummyBytes = 1;
}

std::vector<uint8_t> FlashDevice::read_with(uint8_t opcode, std::size_t dummy_bytes, uint32_t address,
                                            uint32_t length) const {
    check_range(address, length, "Read");
    std::vector<uint8_t> data;
    data.reserve(length);
    const std::size_t chunk_limit = transport_.max_payload() ? transport_.max_payload() : length;
    while (data.size() < length) {
        const std::size_t count = std::min<std::size_t>(chunk_limit, length - data.size());
        const uint32_t at = address + static_cast<uint32_t>(data.size());
        std::vector<uint8_t> chunk = transport_.exchange(addressed_command(opcode, at, dummy_bytes), count);
        if (chunk.size() != count) {
            char message[80];
            std::snprintf(message, sizeof(message), "Short read at 0x%06x: %zu of %zu bytes", at, chunk.size(), count);
            throw FlashError(message);
        }
        data.insert(data.end(), chunk.begin(), chunk.end());
    }
    LOG_SPINOR_TRACE("read 0x%02x [0x%06x, +%u)", opcode, address, length);
    return data;
}

std::vector<uint8_t> FlashDevice::read(uint32_t address, uint32_t length) const {
    return read_with(descriptor_.opcodes.fast_read, kFastReadDummyBytes, address, length);
}

std::vector<uint8_t> FlashDevice::read_slow(uint32_t address, uint32_t length) const {
    return read_with(descriptor_.opcodes.read, 0, address, length);
}

void FlashDevice::read(uint32_t address, uint32_t length, DataSink& sink) const {
    check_range(address, length, "Read");
    const std::size_t step = transport_.max_payload() ? transport_.max_payload() : length;
    uint32_t done = 0;
    while (done < length) {
        const auto count = static_cast<uint32_t>(std::min<std::size_t>(step, length - done));
        const std::vector<uint8_t> chunk = read(address + done, count);
        sink.write(chunk.data(), chunk.size());
        done += count;
    }
    sink.flush();
}

void FlashDevice::verify_erased(uint32_t address, uint32_t length) const {
    const std::vector<uint8_t> data = read(address, length);
    const auto bad = static_cast<uint32_t>(
        std::count_if(data.begin(), data.end(), [](uint8_t b) { return b != kErasedByte; }));
    if (bad) {
        LOG_SPINOR_ERROR("Erase verification failed: %u bytes not erased", bad);
        throw IntegrityError(address, length, bad);
    }
}

} // namespace spinor
