#include "spinor/device.hpp"
#include "spinor/errors.hpp"
#include "spinor/identify.hpp"

#include "manual_clock.hpp"
#include "sim_flash.hpp"

#include <algorithm>
#include <cassert>
#include <memory>
#include <string>
#include <vector>

using namespace spinor;

namespace {

sim::ManualClock g_clock;

JedecId id(uint8_t a, uint8_t b, uint8_t c) {
    return JedecId{{a, b, c}};
}

std::unique_ptr<FlashDevice> open(sim::SimFlash& chip, bool legacy = false) {
    IdentifyOptions options;
    if (legacy) {
        options.jedec_command = kLegacyIdCommand;
    }
    return identify(chip, options, g_clock);
}

std::vector<uint8_t> pattern(std::size_t length, uint8_t seed) {
    std::vector<uint8_t> data(length);
    for (std::size_t i = 0; i < length; ++i) {
        data[i] = static_cast<uint8_t>(seed + i * 7);
    }
    return data;
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

class VectorSink : public DataSink {
public:
    void write(const uint8_t* data, std::size_t n) override { bytes.insert(bytes.end(), data, data + n); }
    void flush() override { ++flushes; }

    std::vector<uint8_t> bytes;
    int flushes = 0;
};

// Passes everything through but cuts unique ID replies short.
class ShortUidLink : public sim::SimLink {
public:
    using sim::SimLink::SimLink;

    std::vector<uint8_t> exchange(const std::vector<uint8_t>& command, std::size_t read_length = 0) override {
        std::vector<uint8_t> reply = sim::SimLink::exchange(command, read_length);
        if (command[0] == 0x4B && !reply.empty()) {
            reply.pop_back();
        }
        return reply;
    }
};

void page_program_family() {
    sim::SimFlash chip("W25x", id(0xEF, 0x40, 0x14));
    chip.busy_polls = 2;
    auto device = open(chip);
    assert(device->capacity() == 0x100000);

    // Round trip across page boundaries.
    const auto data = pattern(600, 3);
    device->write(0x1F0, data);
    assert(chip.count_opcode(0x02) == 4);
    assert(device->read(0x1F0, 600) == data);
    assert(device->read_slow(0x1F0, 600) == data);
    assert(chip.count_opcode(0x03) == 3);

    // Reads are chunked at the transport payload limit.
    const std::size_t fast_reads = chip.count_opcode(0x0B);
    VectorSink sink;
    device->read(0x1F0, 600, sink);
    assert(sink.bytes == data);
    assert(sink.flushes == 1);
    assert(chip.count_opcode(0x0B) - fast_reads == 3);

    assert(throws<OutOfRangeError>([&] { device->read(0xFFF00, 0x200); }));
    assert(throws<OutOfRangeError>([&] { device->write(0xFFFFF, std::vector<uint8_t>(2, 0)); }));

    // Erase is idempotent and verifiable.
    chip.fill(0x0, 0x30000, 0x00);
    device->erase(0x7000, 0x1000);
    assert(chip.all_erased(0x7000, 0x8000));
    assert(chip.memory[0x6FFF] == 0x00 && chip.memory[0x8000] == 0x00);
    device->erase(0x7000, 0x1000, true);
    device->erase(0x0, 0x30000, true);
    assert(chip.all_erased(0x0, 0x30000));
    assert(chip.count_opcode(0xD8) == 3);

    // Validation failures issue nothing.
    const std::size_t before = chip.log.size();
    assert(throws<ValueError>([&] { device->erase(0x7100, 0x1000); }));
    assert(throws<ValueError>([&] { device->erase(0x1000, FlashDevice::kWholeDevice); }));
    assert(throws<OutOfRangeError>([&] { device->erase(0x0, -5); }));
    assert(throws<OutOfRangeError>([&] { device->erase(0x0, 0x200000); }));
    assert(chip.log.size() == before);

    // Whole device goes through chip erase.
    device->write(0x12345, pattern(10, 1));
    device->erase(0, FlashDevice::kWholeDevice, true);
    assert(chip.count_opcode(0xC7) == 1);
    device->erase_chip(true);
    assert(chip.count_opcode(0xC7) == 2);

    // Erase on a protected chip is ignored by the part and caught by verification.
    device->write(0x2000, pattern(16, 9));
    device->lock();
    assert(chip.status_bits == 0x1C);
    bool caught = false;
    try {
        device->erase(0x2000, 0x1000, true);
    } catch (const IntegrityError& ex) {
        caught = true;
        assert(ex.bad_bytes() > 0);
    }
    assert(caught);
    device->unlock();
    assert(chip.status_bits == 0x00);
    device->erase(0x2000, 0x1000, true);

    // Whole-device lock only; the part ignores WRSR while WP# is low.
    assert(throws<NotSupportedError>([&] { device->lock(0x0, 0x10000); }));
    device->lock();
    chip.status_register_frozen = true;
    assert(throws<RequestError>([&] { device->unlock(); }));
    chip.status_register_frozen = false;
    device->unlock();

    // Unique ID: opcode, four dummy bytes, eight bytes back.
    const auto uid = device->unique_id();
    assert(uid.size() == 8);
    assert(std::equal(uid.begin(), uid.end(), chip.unique_id.begin()));
    assert(chip.log.back() == std::vector<uint8_t>({0x4B, 0x00, 0x00, 0x00, 0x00}));

    assert(chip.commands_while_busy == 0);

    ShortUidLink short_link(chip);
    auto truncated = identify(short_link, {}, g_clock);
    assert(throws<FlashError>([&] { (void)truncated->unique_id(); }));
}

void missing_capabilities() {
    sim::SimFlash chip("EN25Q", id(0x1C, 0x30, 0x15));
    auto device = open(chip);
    assert(throws<NotSupportedError>([&] { device->unique_id(); }));
    assert(throws<NotSupportedError>([&] { (void)device->timing(TimingKind::Byte); }));

    DeviceDescriptor no_chip_erase = device->descriptor();
    no_chip_erase.features &= ~features::kChipErase;
    FlashDevice limited(no_chip_erase, Resolution{"EN25Q16", "EN25Q", 0x200000, 0}, chip, g_clock);
    assert(throws<NotSupportedError>([&] { limited.erase_chip(); }));
    // Without chip erase the whole device is erased sector by sector.
    const std::size_t sectors = chip.count_opcode(0xD8);
    limited.erase(0, FlashDevice::kWholeDevice);
    assert(chip.count_opcode(0xD8) - sectors == 32);
}

void auto_increment_word() {
    sim::SimFlash chip("SST25", id(0xBF, 0x25, 0x41));
    auto device = open(chip);
    assert(device->name() == "SST25");
    assert(device->capacity() == 2u * 1024 * 1024);

    // Block protection is cleared before streaming.
    chip.status_bits = 0x1C;
    const auto data = pattern(6, 0x40);
    device->write(0x100, data);
    assert(chip.status_bits == 0x00);
    // The stream ends with WRDI.
    assert(chip.log.back() == std::vector<uint8_t>({0x04}));
    assert(device->read(0x100, 6) == data);

    std::vector<std::vector<uint8_t>> aai;
    for (const auto& command : chip.log) {
        if (command[0] == 0xAD) aai.push_back(command);
    }
    assert(aai.size() == 3);
    assert(aai[0].size() == 6 && aai[0][3] == 0x00 && aai[0][2] == 0x01);
    assert(aai[1].size() == 3 && aai[2].size() == 3);

    assert(throws<ValueError>([&] { device->write(0x101, pattern(4, 0)); }));
    assert(throws<ValueError>([&] { device->write(0x100, pattern(3, 0)); }));
    assert(throws<ValueError>([&] { device->write(0x100, std::vector<uint8_t>{}); }));

    device->erase(0x8000, 0x8000, true);
    assert(chip.count_opcode(0x52) == 1);
    assert(chip.commands_while_busy == 0);

    // A byte that never completes still takes the chip out of AAI mode.
    sim::SimFlash hung("SST25", id(0xBF, 0x25, 0x41));
    auto stalled = open(hung);
    hung.stuck_busy = true;
    assert(throws<TimeoutError>([&] { stalled->write(0x200, pattern(4, 0x10)); }));
    assert(hung.count_opcode(0xAD) == 1);
    assert(hung.log.back() == std::vector<uint8_t>({0x04}));
}

void auto_increment_byte_legacy() {
    sim::SimFlash chip("SST25VFxxxA", id(0xBF, 0x49, 0xBF));
    auto device = open(chip, true);
    assert(device->capacity() == 128u * 1024);
    assert(device->erase_size() == 0x1000);

    const auto data = pattern(5, 0x11);
    device->write(0x11, data);
    assert(device->read(0x11, 5) == data);
    assert(chip.count_opcode(0xAF) == 5);

    device->erase(0x0, 0x1000, true);
    assert(chip.count_opcode(0x20) == 1);

    // Status register writes are enabled with EWSR on this part.
    device->lock();
    assert(chip.status_bits == 0x0C);
    assert(chip.count_opcode(0x50) >= 1);
    device->unlock();
    assert(chip.status_bits == 0x00);
}

void buffer_commit() {
    sim::SimFlash chip("AT45DB", id(0x1F, 0x27, 0x00));
    auto device = open(chip);
    const uint32_t page = device->block_size(BlockKind::Page);
    assert(page == 512);

    // Bytes outside the request are padded with 0xFF and keep their content.
    chip.fill(0x000, 0x400, 0x00);
    device->erase(0x0, 0x1000);
    chip.fill(0x100, 0x110, 0x5A);
    const auto data = pattern(100, 0x21);
    device->write(0x1F0, data);
    assert(device->read(0x1F0, 100) == data);
    assert(chip.memory[0x100] == 0x5A && chip.memory[0x10F] == 0x5A);
    assert(chip.memory[0x1EF] == 0xFF && chip.memory[0x254] == 0xFF);
    assert(chip.count_opcode(0x84) == 2);
    assert(chip.count_opcode(0x88) == 2);
    for (const auto& command : chip.log) {
        if (command[0] == 0x84) assert(command.size() == 4 + page);
        if (command[0] == 0x88) assert((command[3] | (command[2] << 8)) % page == 0);
    }

    // Sector 0 takes two commands.
    chip.fill(0x0, 0x20000, 0x00);
    const std::size_t before = chip.count_opcode(0x7C);
    device->erase(0x0, 0x20000, true);
    assert(chip.count_opcode(0x7C) - before == 3);

    device->lock();
    assert(chip.status_bits & 0x02);
    device->unlock();
    assert((chip.status_bits & 0x02) == 0);

    assert(chip.commands_while_busy == 0);
}

void lock_register() {
    sim::SimFlash chip("N25Q", id(0x20, 0xBA, 0x16));
    auto device = open(chip);

    device->lock(0x10000, 0x20000);
    assert(chip.count_opcode(0xE5) == 2);
    assert(chip.sector_flags[0] == 0 && chip.sector_flags[1] == 1 && chip.sector_flags[2] == 1);

    // Locked sectors ignore programming.
    device->write(0x10000, pattern(4, 0));
    assert(chip.all_erased(0x10000, 0x10004));

    device->unlock(0x10000, 0x10000);
    assert(chip.sector_flags[1] == 0 && chip.sector_flags[2] == 1);
    device->unlock();
    assert(chip.sector_flags[2] == 0);

    assert(throws<ValueError>([&] { device->lock(0x1000, 0x10000); }));
    assert(throws<OutOfRangeError>([&] { device->lock(0x3F0000, 0x20000); }));
}

void sector_protect() {
    sim::SimFlash chip("AT25DF", id(0x1F, 0x47, 0x00));
    auto device = open(chip);
    device->lock(0x0, 0x20000);
    assert(chip.count_opcode(0x36) == 2 && chip.sector_flags[0] == 1 && chip.sector_flags[1] == 1);
    device->unlock(0x10000, 0x10000);
    assert(chip.count_opcode(0x39) == 1 && chip.sector_flags[1] == 0);
}

void global_unlock() {
    sim::SimFlash d_part("MX25L", id(0xC2, 0x9E, 0x16));
    auto device = open(d_part);
    assert(device->name() == "MX25D32");
    device->lock();
    assert(d_part.status_bits == 0x1C);
    device->unlock();
    assert(d_part.last_global_unlock == 0xF3 && d_part.status_bits == 0x00);

    sim::SimFlash e_part("MX25L", id(0xC2, 0x26, 0x16));
    open(e_part)->unlock();
    assert(e_part.last_global_unlock == 0x98);
}

void parameter_zone() {
    // Bottom zone: the first two sectors also need their 4 KiB parameter sectors erased.
    sim::SimFlash bottom("S25FL", id(0x01, 0x02, 0x15));
    auto device = open(bottom);
    bottom.fill(0x0, 0x30000, 0x00);
    device->erase(0x0, 0x30000, true);
    assert(bottom.all_erased(0x0, 0x30000));
    assert(bottom.count_opcode(0x35) >= 1);
    assert(bottom.count_opcode(0x20) == 32);

    sim::SimFlash top("S25FL", id(0x01, 0x02, 0x15));
    top.config = 0x04;
    auto top_device = open(top);
    top.fill(0x0, 0x10000, 0x00);
    top_device->erase(0x0, 0x10000, true);
    assert(top.count_opcode(0x20) == 0);
    assert(throws<ValueError>([&] { top_device->erase(0x1000, 0x1000); }));
    top_device->erase(0x3FF000, 0x1000);
}

} // namespace

int main() {
    page_program_family();
    missing_capabilities();
    auto_increment_word();
    auto_increment_byte_legacy();
    buffer_commit();
    lock_register();
    sector_protect();
    global_unlock();
    parameter_zone();
    return 0;
}
