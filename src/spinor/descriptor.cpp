#include "spinor/descriptor.hpp"

#include <cstdio>
#include <stdexcept>

namespace spinor {

namespace {

std::string compose_name(const DeviceDescriptor& descriptor, const char* device, uint32_t capacity) {
    std::string name = device;
    const unsigned megabits = capacity >> 17;
    switch (descriptor.name_style) {
    case NameStyle::Plain:
        break;
    case NameStyle::Megabits:
        name += std::to_string(megabits);
        break;
    case NameStyle::MegabitsPadded: {
        char digits[12];
        std::snprintf(digits, sizeof(digits), "%03u", megabits);
        name += digits;
        break;
    }
    }
    name += descriptor.name_suffix;
    return name;
}

void require(bool condition, const DeviceDescriptor& descriptor, const std::string& what) {
    if (!condition) {
        throw std::logic_error(std::string("descriptor ") + descriptor.family + ": " + what);
    }
}

struct EraseFeature {
    FeatureMask flag;
    BlockKind kind;
};

// Largest first.
constexpr EraseFeature kEraseFeatures[] = {
    {features::kSectorErase, BlockKind::Sector},
    {features::kHalfSectorErase, BlockKind::HalfSector},
    {features::kSubsectorErase, BlockKind::Subsector},
};

} // namespace

std::optional<Resolution> resolve(const DeviceDescriptor& descriptor, const JedecId& jedec) {
    switch (descriptor.layout) {
    case JedecLayout::DeviceCapacity: {
        if (jedec.manufacturer() != descriptor.manufacturer) return std::nullopt;
        const auto device = descriptor.devices.find(jedec.code_a());
        const auto capacity = descriptor.capacities.find(jedec.code_b());
        if (device == descriptor.devices.end() || capacity == descriptor.capacities.end()) return std::nullopt;
        return Resolution{compose_name(descriptor, device->second, capacity->second), device->second,
                          capacity->second, 0};
    }
    case JedecLayout::ManufacturerEcho: {
        if (jedec.manufacturer() != descriptor.manufacturer && jedec.code_b() != descriptor.manufacturer) {
            return std::nullopt;
        }
        const auto device = descriptor.devices.find(jedec.code_a());
        const auto capacity = descriptor.capacities.find(jedec.code_a());
        if (device == descriptor.devices.end() || capacity == descriptor.capacities.end()) return std::nullopt;
        return Resolution{compose_name(descriptor, device->second, capacity->second), device->second,
                          capacity->second, 0};
    }
    case JedecLayout::CapacityRevision: {
        if (jedec.manufacturer() != descriptor.manufacturer) return std::nullopt;
        const auto capacity = descriptor.capacities.find(jedec.code_a());
        if (capacity == descriptor.capacities.end() || descriptor.devices.empty()) return std::nullopt;
        const uint8_t revision = jedec.code_b();
        if (revision < descriptor.revision_min || revision > descriptor.revision_max) return std::nullopt;
        const char* part = descriptor.devices.begin()->second;
        return Resolution{compose_name(descriptor, part, capacity->second), part, capacity->second, 0};
    }
    case JedecLayout::PackedDensity: {
        if (jedec.manufacturer() != descriptor.manufacturer) return std::nullopt;
        const auto device = descriptor.devices.find(static_cast<uint8_t>((jedec.code_a() >> 5) & 0x07));
        if (device == descriptor.devices.end()) return std::nullopt;
        const uint8_t density = jedec.code_a() & 0x1F;
        if (density < descriptor.density_base) return std::nullopt;
        const std::size_t index = density - descriptor.density_base;
        if (index >= descriptor.geometries.size()) return std::nullopt;
        const uint8_t chip_shift = descriptor.geometries[index].block_shift[static_cast<std::size_t>(BlockKind::Chip)];
        if (chip_shift == 0) return std::nullopt;
        const uint32_t capacity = 1u << chip_shift;
        return Resolution{compose_name(descriptor, device->second, capacity), device->second, capacity, index};
    }
    }
    return std::nullopt;
}

void validate_descriptor(const DeviceDescriptor& d) {
    require(!d.geometries.empty(), d, "no geometry");
    require(!d.devices.empty(), d, "no device codes");
    if (d.layout == JedecLayout::PackedDensity) {
        for (const auto& g : d.geometries) {
            require(g.block_shift[static_cast<std::size_t>(BlockKind::Chip)] != 0, d, "density entry without chip size");
        }
    } else {
        require(!d.capacities.empty(), d, "no capacity codes");
        require(d.geometries.size() == 1, d, "fixed layout with several geometries");
    }

    bool any_erase = false;
    for (const auto& g : d.geometries) {
        require(g.max_frequency_hz > 0, d, "no bus frequency limit");
        uint8_t previous_shift = 0xFF;
        uint8_t largest_shift = 0;
        for (const auto& erase : kEraseFeatures) {
            if (!d.has_feature(erase.flag)) continue;
            const auto index = static_cast<std::size_t>(erase.kind);
            const uint8_t shift = g.block_shift[index];
            require(shift != 0, d, std::string("no size for ") + to_string(erase.kind));
            require(shift < previous_shift, d, "erase granularities not strictly nested");
            require(g.timings[static_cast<std::size_t>(erase_timing_for(erase.kind))].has_value(), d,
                    std::string("no timing for ") + to_string(erase.kind) + " erase");
            require(d.opcodes.erase[index] != 0, d, std::string("no opcode for ") + to_string(erase.kind) + " erase");
            if (largest_shift == 0) largest_shift = shift;
            previous_shift = shift;
            any_erase = true;
        }
        if (d.has_feature(features::kChipErase)) {
            require(g.timings[static_cast<std::size_t>(TimingKind::Chip)].has_value(), d, "no timing for chip erase");
            require(!d.opcodes.chip_erase.empty(), d, "no chip erase sequence");
        }
        if (d.has_feature(features::kLock) || d.has_feature(features::kSectorLock)) {
            require(g.timings[static_cast<std::size_t>(TimingKind::Lock)].has_value(), d, "no timing for lock");
        }
        switch (d.write_mode) {
        case WriteMode::PageProgram:
        case WriteMode::BufferCommit:
            require(g.block_shift[static_cast<std::size_t>(BlockKind::Page)] != 0, d, "no page size");
            require(g.timings[static_cast<std::size_t>(TimingKind::Page)].has_value(), d, "no timing for page program");
            break;
        case WriteMode::AutoIncrementWord:
        case WriteMode::AutoIncrementByte:
            require(g.timings[static_cast<std::size_t>(TimingKind::Byte)].has_value(), d, "no timing for auto-increment");
            break;
        }
        if (largest_shift != 0 && d.layout != JedecLayout::PackedDensity) {
            for (const auto& [code, bytes] : d.capacities) {
                (void)code;
                require(bytes % (1u << largest_shift) == 0, d, "capacity not a multiple of the largest erase block");
            }
        }
    }
    require(any_erase, d, "no erase granularity");
    if (d.has_feature(features::kUniqueId)) {
        require(d.unique_id.length > 0, d, "unique ID feature without length");
    }
    if (d.erase_layout != EraseLayout::Uniform) {
        require(d.has_feature(features::kSectorErase) && d.has_feature(features::kSubsectorErase), d,
                "split erase layout needs sector and subsector erase");
    }
}

const DeviceDescriptor* find_descriptor(std::string_view family) {
    for (const auto& descriptor : registered_descriptors()) {
        if (family == descriptor.family) {
            return &descriptor;
        }
    }
    return nullptr;
}

std::vector<JedecId> example_ids(const DeviceDescriptor& d) {
    std::vector<JedecId> ids;
    switch (d.layout) {
    case JedecLayout::DeviceCapacity:
        for (const auto& [device, name] : d.devices) {
            (void)name;
            for (const auto& [capacity, bytes] : d.capacities) {
                (void)bytes;
                ids.push_back(JedecId{{d.manufacturer, device, capacity}});
            }
        }
        break;
    case JedecLayout::ManufacturerEcho:
        for (const auto& [device, name] : d.devices) {
            (void)name;
            ids.push_back(JedecId{{d.manufacturer, device, d.manufacturer}});
        }
        break;
    case JedecLayout::CapacityRevision:
        for (const auto& [capacity, bytes] : d.capacities) {
            (void)bytes;
            ids.push_back(JedecId{{d.manufacturer, capacity, d.revision_min}});
        }
        break;
    case JedecLayout::PackedDensity:
        for (const auto& [family_code, name] : d.devices) {
            (void)name;
            for (std::size_t i = 0; i < d.geometries.size(); ++i) {
                const auto code = static_cast<uint8_t>((family_code << 5) | (d.density_base + i));
                ids.push_back(JedecId{{d.manufacturer, code, 0x00}});
            }
        }
        break;
    }
    return ids;
}

} // namespace spinor
