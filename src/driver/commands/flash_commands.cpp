#include "norworks/commands.hpp"

#include "norworks/command_context.hpp"
#include "norworks/driver_context.hpp"
#include "spinor/data_sink.hpp"
#include "spinor/descriptor.hpp"
#include "spinor/device.hpp"
#include "spinor/erase_plan.hpp"
#include "spinor/identify.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace norworks::commands {
namespace {

std::string hex_bytes(const std::vector<uint8_t>& bytes, char separator) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i && separator) oss << separator;
        oss << std::setw(2) << static_cast<unsigned>(bytes[i]);
    }
    return oss.str();
}

std::string hex32(uint32_t value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setw(6) << std::setfill('0') << value;
    return oss.str();
}

std::string feature_list(const spinor::DeviceDescriptor& descriptor) {
    static constexpr std::pair<spinor::FeatureMask, const char*> kNames[] = {
        {spinor::features::kSectorErase, "sector-erase"},
        {spinor::features::kHalfSectorErase, "hsector-erase"},
        {spinor::features::kSubsectorErase, "subsector-erase"},
        {spinor::features::kChipErase, "chip-erase"},
        {spinor::features::kLock, "lock"},
        {spinor::features::kInvertedLock, "inverted-lock"},
        {spinor::features::kSectorLock, "sector-lock"},
        {spinor::features::kOtpLock, "otp-lock"},
        {spinor::features::kUniqueId, "unique-id"},
    };
    std::string out;
    for (const auto& [flag, name] : kNames) {
        if (!descriptor.has_feature(flag)) continue;
        if (!out.empty()) out += ", ";
        out += name;
    }
    return out;
}

const char* write_mode_name(spinor::WriteMode mode) {
    switch (mode) {
    case spinor::WriteMode::PageProgram: return "page program";
    case spinor::WriteMode::AutoIncrementWord: return "AAI word";
    case spinor::WriteMode::AutoIncrementByte: return "AAI byte";
    case spinor::WriteMode::BufferCommit: return "buffer commit";
    }
    return "?";
}

const char* lock_scheme_name(spinor::LockScheme scheme) {
    switch (scheme) {
    case spinor::LockScheme::StatusRegister: return "status register";
    case spinor::LockScheme::StatusRegisterEwsr: return "EWSR + status register";
    case spinor::LockScheme::GlobalUnlock: return "global unlock";
    case spinor::LockScheme::SectorProtect: return "sector protect";
    case spinor::LockScheme::LockRegister: return "sector lock register";
    case spinor::LockScheme::ProtectionRegister: return "protection register";
    }
    return "?";
}

std::vector<uint8_t> read_input_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open '" + path + "'");
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

int identify_command(CommandContext& context) {
    spinor::FlashDevice& device = context.device();
    const auto& descriptor = device.descriptor();
    context.out << "Device: " << device.description() << "\n";
    context.out << "Family: " << descriptor.family << " (" << descriptor.vendor << ")\n";
    context.out << "Capacity: " << device.capacity() << " bytes\n";
    context.out << "SPI clock: " << device.spi_frequency() << " Hz (max " << device.geometry().max_frequency_hz
                << " Hz)\n";
    context.out << "Granularities:\n";
    for (auto kind : {spinor::BlockKind::Page, spinor::BlockKind::Subsector, spinor::BlockKind::HalfSector,
                      spinor::BlockKind::Sector}) {
        const auto index = static_cast<std::size_t>(kind);
        if (device.geometry().block_shift[index] == 0) continue;
        context.out << "  " << std::left << std::setw(10) << spinor::to_string(kind) << std::right
                    << spinor::format_size(device.block_size(kind)) << "\n";
    }
    context.out << "Write mode: " << write_mode_name(descriptor.write_mode) << "\n";
    context.out << "Lock scheme: " << lock_scheme_name(descriptor.lock_scheme) << "\n";
    context.out << "Features: " << feature_list(descriptor) << "\n";
    return 0;
}

int status_command(CommandContext& context) {
    spinor::FlashDevice& device = context.device();
    const spinor::StatusSnapshot status = device.read_status();
    const auto& layout = device.descriptor().status;
    context.out << "Status: 0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<unsigned>(status.raw)
                << std::dec << std::setfill(' ') << "\n";
    context.out << "  State: " << (status.busy() ? "busy" : "ready") << "\n";
    context.out << "  Protection bits: " << ((status.raw & layout.protect_mask) ? "set" : "clear") << "\n";
    return 0;
}

int read_command(CommandContext& context) {
    spinor::FlashDevice& device = context.device();
    const auto [address, length] = context.require_range();
    const bool slow = context.arguments.has("slow");

    if (const auto path = context.arguments.value("output")) {
        spinor::FileDataSink sink(*path);
        if (slow) {
            const auto data = device.read_slow(address, length);
            sink.write(data.data(), data.size());
            sink.flush();
        } else {
            device.read(address, length, sink);
        }
        context.out << "Wrote " << length << " bytes from " << hex32(address) << " to " << *path << "\n";
        return 0;
    }
    spinor::HexOstreamDataSink sink(context.out, address);
    if (slow) {
        const auto data = device.read_slow(address, length);
        sink.write(data.data(), data.size());
        sink.flush();
    } else {
        device.read(address, length, sink);
    }
    return 0;
}

int write_command(CommandContext& context) {
    spinor::FlashDevice& device = context.device();
    const uint32_t address = context.arguments.require_size("address");
    const std::vector<uint8_t> data = read_input_file(context.arguments.value_or("input", ""));
    device.write(address, data);
    context.out << "Programmed " << data.size() << " bytes at " << hex32(address) << "\n";

    if (context.arguments.has("verify") && !data.empty()) {
        const auto readback = device.read(address, static_cast<uint32_t>(data.size()));
        const auto mismatch = std::mismatch(data.begin(), data.end(), readback.begin());
        if (mismatch.first != data.end()) {
            const auto offset = static_cast<uint32_t>(std::distance(data.begin(), mismatch.first));
            context.err << "Verification failed at " << hex32(address + offset) << "\n";
            return 1;
        }
        context.out << "Verified\n";
    }
    return 0;
}

int erase_command(CommandContext& context) {
    spinor::FlashDevice& device = context.device();
    const bool verify = context.arguments.has("verify");
    if (context.arguments.has("all")) {
        if (context.arguments.has("address") || context.arguments.has("length")) {
            throw std::invalid_argument("--all excludes --address and --length");
        }
        device.erase(0, spinor::FlashDevice::kWholeDevice, verify);
        context.out << "Erased " << device.description() << "\n";
        return 0;
    }
    const auto [address, length] = context.require_range();
    device.erase(address, length, verify);
    context.out << "Erased " << length << " bytes at " << hex32(address) << (verify ? " (verified)" : "") << "\n";
    return 0;
}

int erase_chip_command(CommandContext& context) {
    spinor::FlashDevice& device = context.device();
    device.erase_chip(context.arguments.has("verify"));
    context.out << "Chip erase complete\n";
    return 0;
}

int plan_erase_command(CommandContext& context) {
    spinor::FlashDevice& device = context.device();
    const FlashRange range = context.require_range();
    const auto regions = device.plan_erase(range.address, range.length);
    if (regions.empty()) {
        context.out << "Nothing to erase\n";
        return 0;
    }
    for (const auto& region : regions) {
        context.out << std::left << std::setw(10) << spinor::to_string(region.kind) << std::right
                    << hex32(region.start) << " - " << hex32(region.end) << "  " << region.commands() << " x "
                    << spinor::format_size(region.block_size);
        if (region.kind != spinor::BlockKind::Chip) {
            context.out << "  opcode 0x" << std::hex << std::setw(2) << std::setfill('0')
                        << static_cast<unsigned>(region.opcode) << std::dec << std::setfill(' ');
        }
        context.out << "\n";
    }
    return 0;
}

int protection_command(CommandContext& context, bool protect) {
    spinor::FlashDevice& device = context.device();
    if (const auto range = context.optional_range()) {
        protect ? device.lock(range->address, range->length) : device.unlock(range->address, range->length);
        context.out << (protect ? "Locked " : "Unlocked ") << hex32(range->address) << " - "
                    << hex32(static_cast<uint32_t>(range->end())) << "\n";
    } else {
        protect ? device.lock() : device.unlock();
        context.out << (protect ? "Locked " : "Unlocked ") << device.name() << "\n";
    }
    return 0;
}

int unique_id_command(CommandContext& context) {
    spinor::FlashDevice& device = context.device();
    context.out << hex_bytes(device.unique_id(), '\0') << "\n";
    return 0;
}

int list_devices_command(CommandContext& context) {
    for (const auto& descriptor : spinor::registered_descriptors()) {
        context.out << std::left << std::setw(13) << descriptor.family << std::setw(11) << descriptor.vendor
                    << std::right << "mfr 0x" << std::hex << std::setw(2) << std::setfill('0')
                    << static_cast<unsigned>(descriptor.manufacturer) << std::dec << std::setfill(' ') << "  "
                    << write_mode_name(descriptor.write_mode) << ", " << lock_scheme_name(descriptor.lock_scheme)
                    << "\n";
        if (context.verbose) {
            for (const auto& jedec : spinor::example_ids(descriptor)) {
                const auto resolved = spinor::resolve(descriptor, jedec);
                context.out << "    " << jedec.to_string() << "  " << resolved->device << " "
                            << spinor::format_size(resolved->capacity) << "\n";
            }
        }
    }
    return 0;
}

const OptionSpec kAddressOption{"address", 'a', "addr", true, "Start address (hex, decimal, K/M suffix)."};
const OptionSpec kLengthOption{"length", 'l', "bytes", true, "Byte count (hex, decimal, K/M suffix)."};
const OptionSpec kRangeAddress{"address", 'a', "addr", false, "Start address of a sector range."};
const OptionSpec kRangeLength{"length", 'l', "bytes", false, "Length of a sector range."};
const OptionSpec kVerifyOption{"verify", '\0', "", false, "Read back and check the result."};

} // namespace

void register_flash_commands(CommandRegistry& registry) {
    registry.register_command({
        .name = "identify",
        .aliases = {"probe", "id"},
        .summary = "Read the JEDEC ID and describe the attached flash.",
        .usage = "norworks identify [--cs <0|1>] [--frequency <hz>] [--legacy-id]",
        .options = {},
        .access = FlashAccess::Read,
        .handler = identify_command,
    });

    registry.register_command({
        .name = "status",
        .aliases = {},
        .summary = "Read the status register once and decode busy and protection bits.",
        .usage = "norworks status",
        .options = {},
        .access = FlashAccess::Read,
        .handler = status_command,
    });

    registry.register_command({
        .name = "read",
        .aliases = {"dump"},
        .summary = "Fast-read a range as a hex dump or into a file (--slow: plain 0x03 read).",
        .usage = "norworks read --address <addr> --length <bytes> [--output <file>] [--slow]",
        .options = {
            kAddressOption,
            kLengthOption,
            {"output", 'o', "file", false, "Write raw bytes to a file instead of a hex dump."},
            {"slow", '\0', "", false, "Use the plain read command without dummy byte."},
        },
        .access = FlashAccess::Read,
        .handler = read_command,
    });

    registry.register_command({
        .name = "write",
        .aliases = {"program"},
        .summary = "Program a file into an erased range, one page at a time.",
        .usage = "norworks write --address <addr> --input <file> [--verify] --force",
        .options = {
            kAddressOption,
            {"input", 'i', "file", true, "Binary file to program."},
            kVerifyOption,
        },
        .access = FlashAccess::Modify,
        .handler = write_command,
    });

    registry.register_command({
        .name = "erase",
        .aliases = {},
        .summary = "Erase an aligned range with the fewest, largest blocks, or the whole device.",
        .usage = "norworks erase (--address <addr> --length <bytes> | --all) [--verify] --force",
        .options = {
            {"address", 'a', "addr", false, "Start address, aligned to the finest granularity."},
            {"length", 'l', "bytes", false, "Length, a multiple of the finest granularity."},
            {"all", '\0', "", false, "Erase the whole device."},
            kVerifyOption,
        },
        .access = FlashAccess::Modify,
        .handler = erase_command,
    });

    registry.register_command({
        .name = "erase-chip",
        .aliases = {},
        .summary = "Wait for the chip, then issue the family's chip erase sequence.",
        .usage = "norworks erase-chip [--verify] --force",
        .options = {kVerifyOption},
        .access = FlashAccess::Modify,
        .handler = erase_chip_command,
    });

    registry.register_command({
        .name = "plan-erase",
        .aliases = {},
        .summary = "List the erase commands a range would need without touching the array.",
        .usage = "norworks plan-erase --address <addr> --length <bytes>",
        .options = {kAddressOption, kLengthOption},
        .access = FlashAccess::Read,
        .handler = plan_erase_command,
    });

    registry.register_command({
        .name = "unlock",
        .aliases = {},
        .summary = "Remove write protection from the device or, per-sector families only, a range.",
        .usage = "norworks unlock [--address <addr> --length <bytes>] --force",
        .options = {kRangeAddress, kRangeLength},
        .access = FlashAccess::Modify,
        .handler = [](CommandContext& context) { return protection_command(context, false); },
    });

    registry.register_command({
        .name = "lock",
        .aliases = {},
        .summary = "Enable write protection on the device or, per-sector families only, a range.",
        .usage = "norworks lock [--address <addr> --length <bytes>] --force",
        .options = {kRangeAddress, kRangeLength},
        .access = FlashAccess::Modify,
        .handler = [](CommandContext& context) { return protection_command(context, true); },
    });

    registry.register_command({
        .name = "unique-id",
        .aliases = {"uid"},
        .summary = "Print the factory unique identifier (W25, IS25LP).",
        .usage = "norworks unique-id",
        .options = {},
        .access = FlashAccess::Read,
        .handler = unique_id_command,
    });

    registry.register_command({
        .name = "list-devices",
        .aliases = {"devices"},
        .summary = "List supported families in dispatch order; --verbose adds every accepted JEDEC ID.",
        .usage = "norworks [--verbose] list-devices",
        .options = {},
        .access = FlashAccess::None,
        .handler = list_devices_command,
    });
}

} // namespace norworks::commands
