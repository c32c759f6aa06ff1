// VoxelForge World Generation
// generation_settings.cpp - Generation parameters, validation and presets

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <voxelforge/core/config.hpp>
#include <voxelforge/core/logger.hpp>
#include <voxelforge/world/generation_settings.hpp>
#include <voxelforge/world/types.hpp>

namespace voxelforge::world {

namespace {

bool in_unit_range(double value) {
    return value >= 0.0 && value <= 1.0;
}

constexpr char32_t REPLACEMENT_CHARACTER = 0xFFFD;

// Decode one UTF-8 sequence at text[pos], advancing pos; malformed bytes yield U+FFFD
char32_t next_code_point(std::string_view text, size_t& pos) {
    const auto lead = static_cast<unsigned char>(text[pos++]);
    if (lead < 0x80) {
        return lead;
    }

    size_t extra = 0;
    char32_t code_point = 0;
    char32_t min_value = 0;
    if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        code_point = lead & 0x1F;
        min_value = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        code_point = lead & 0x0F;
        min_value = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        code_point = lead & 0x07;
        min_value = 0x10000;
    } else {
        return REPLACEMENT_CHARACTER;
    }

    if (pos + extra > text.size()) {
        return REPLACEMENT_CHARACTER;
    }
    for (size_t i = 0; i < extra; ++i) {
        const auto byte = static_cast<unsigned char>(text[pos + i]);
        if ((byte & 0xC0) != 0x80) {
            return REPLACEMENT_CHARACTER;
        }
        code_point = (code_point << 6) | (byte & 0x3F);
    }

    if (code_point < min_value || code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        return REPLACEMENT_CHARACTER;
    }
    pos += extra;
    return code_point;
}

}  // namespace

std::vector<std::string> validate_settings(const GenerationSettings& settings) {
    std::vector<std::string> problems;

    if (settings.width < 1) {
        problems.push_back(fmt::format("width must be at least 1 (got {})", settings.width));
    }
    if (settings.length < 1) {
        problems.push_back(fmt::format("length must be at least 1 (got {})", settings.length));
    }
    if (settings.max_height < 8) {
        problems.push_back(fmt::format("max_height must be at least 8 (got {})", settings.max_height));
    }

    // Every voxel coordinate, including canopy overhang at the borders, must fit a packed key
    if (settings.width > KEY_AXIS_MAX || settings.length > KEY_AXIS_MAX || settings.max_height > KEY_AXIS_MAX) {
        problems.push_back(fmt::format("world dimensions {}x{}x{} exceed the voxel key range of {}", settings.width,
                                       settings.length, settings.max_height, KEY_AXIS_MAX));
    }

    if (!(settings.scale > 0.0 && settings.scale <= MAX_NOISE_SCALE)) {
        problems.push_back(fmt::format("scale must be within (0, {}] (got {})", MAX_NOISE_SCALE, settings.scale));
    }
    if (!(settings.roughness > 0.0) || !std::isfinite(settings.roughness)) {
        problems.push_back(fmt::format("roughness must be positive (got {})", settings.roughness));
    }
    if (!in_unit_range(settings.smoothing)) {
        problems.push_back(fmt::format("smoothing must be within [0, 1] (got {})", settings.smoothing));
    }
    if (!in_unit_range(settings.flatness_factor)) {
        problems.push_back(fmt::format("flatness_factor must be within [0, 1] (got {})", settings.flatness_factor));
    }
    if (!in_unit_range(settings.temperature)) {
        problems.push_back(fmt::format("temperature must be within [0, 1] (got {})", settings.temperature));
    }
    if (!in_unit_range(settings.ore_rarity)) {
        problems.push_back(fmt::format("ore_rarity must be within [0, 1] (got {})", settings.ore_rarity));
    }
    if (settings.sea_level < 1 || settings.sea_level >= settings.max_height) {
        problems.push_back(fmt::format("sea_level must be within [1, {}) (got {})", settings.max_height,
                                       settings.sea_level));
    }
    if (!(settings.terrain_blend >= 0.0)) {
        problems.push_back(fmt::format("terrain_blend must not be negative (got {})", settings.terrain_blend));
    }
    if (!(settings.river_frequency >= 0.0 && settings.river_frequency <= MAX_NOISE_SCALE)) {
        problems.push_back(fmt::format("river_frequency must be within [0, {}] (got {})", MAX_NOISE_SCALE,
                                       settings.river_frequency));
    }

    // Disabled ranges are never read
    const MountainRangeSettings& range = settings.mountain_range;
    if (range.enabled) {
        if (!(range.size >= 0.0) || !std::isfinite(range.size)) {
            problems.push_back(fmt::format("mountain size must be finite and not negative (got {})", range.size));
        }
        if (range.height < 0 || range.height > settings.max_height) {
            problems.push_back(fmt::format("mountain height must be within [0, {}] (got {})", settings.max_height,
                                           range.height));
        }
        if (range.snow_height < 0 || range.snow_height > settings.max_height) {
            problems.push_back(fmt::format("mountain snow_height must be within [0, {}] (got {})",
                                           settings.max_height, range.snow_height));
        }
    }

    return problems;
}

// ============================================================================
// Config binding
// ============================================================================

GenerationSettings settings_from_config(const core::Config& config) {
    namespace section = core::config_section;
    namespace key = core::config_key;

    GenerationSettings defaults;
    GenerationSettings settings;

    settings.width = config.get_int(section::WORLD, key::WIDTH, defaults.width);
    settings.length = config.get_int(section::WORLD, key::LENGTH, defaults.length);
    settings.max_height = config.get_int(section::WORLD, key::MAX_HEIGHT, defaults.max_height);

    settings.scale = config.get_double(section::TERRAIN, key::SCALE, defaults.scale);
    settings.roughness = config.get_double(section::TERRAIN, key::ROUGHNESS, defaults.roughness);
    settings.flatness_factor = config.get_double(section::TERRAIN, key::FLATNESS_FACTOR, defaults.flatness_factor);
    settings.smoothing = config.get_double(section::TERRAIN, key::SMOOTHING, defaults.smoothing);
    settings.terrain_blend = config.get_double(section::TERRAIN, key::TERRAIN_BLEND, defaults.terrain_blend);
    settings.completely_flat = config.get_bool(section::TERRAIN, key::COMPLETELY_FLAT, defaults.completely_flat);

    settings.temperature = config.get_double(section::CLIMATE, key::TEMPERATURE, defaults.temperature);

    settings.sea_level = config.get_int(section::WATER, key::SEA_LEVEL, defaults.sea_level);
    settings.river_frequency = config.get_double(section::WATER, key::RIVER_FREQUENCY, defaults.river_frequency);

    settings.generate_ores = config.get_bool(section::ORES, key::ENABLED, defaults.generate_ores);
    settings.ore_rarity = config.get_double(section::ORES, key::RARITY, defaults.ore_rarity);

    auto& mountains = settings.mountain_range;
    mountains.enabled = config.get_bool(section::MOUNTAINS, key::ENABLED, defaults.mountain_range.enabled);
    mountains.height = config.get_int(section::MOUNTAINS, key::HEIGHT, defaults.mountain_range.height);
    mountains.size = config.get_double(section::MOUNTAINS, key::SIZE, defaults.mountain_range.size);
    mountains.snow_height = config.get_int(section::MOUNTAINS, key::SNOW_HEIGHT, defaults.mountain_range.snow_height);
    mountains.snow_cap = config.get_bool(section::MOUNTAINS, key::SNOW_CAP, defaults.mountain_range.snow_cap);

    settings.deterministic_decorations =
        config.get_bool(section::GENERATION, key::DETERMINISTIC_DECORATIONS, defaults.deterministic_decorations);
    settings.desert_dunes = config.get_bool(section::GENERATION, key::DESERT_DUNES, defaults.desert_dunes);

    return settings;
}

void store_settings(const GenerationSettings& settings, core::Config& config) {
    namespace section = core::config_section;
    namespace key = core::config_key;

    config.set_int(section::WORLD, key::WIDTH, settings.width);
    config.set_int(section::WORLD, key::LENGTH, settings.length);
    config.set_int(section::WORLD, key::MAX_HEIGHT, settings.max_height);

    config.set_double(section::TERRAIN, key::SCALE, settings.scale);
    config.set_double(section::TERRAIN, key::ROUGHNESS, settings.roughness);
    config.set_double(section::TERRAIN, key::FLATNESS_FACTOR, settings.flatness_factor);
    config.set_double(section::TERRAIN, key::SMOOTHING, settings.smoothing);
    config.set_double(section::TERRAIN, key::TERRAIN_BLEND, settings.terrain_blend);
    config.set_bool(section::TERRAIN, key::COMPLETELY_FLAT, settings.completely_flat);

    config.set_double(section::CLIMATE, key::TEMPERATURE, settings.temperature);

    config.set_int(section::WATER, key::SEA_LEVEL, settings.sea_level);
    config.set_double(section::WATER, key::RIVER_FREQUENCY, settings.river_frequency);

    config.set_bool(section::ORES, key::ENABLED, settings.generate_ores);
    config.set_double(section::ORES, key::RARITY, settings.ore_rarity);

    config.set_bool(section::MOUNTAINS, key::ENABLED, settings.mountain_range.enabled);
    config.set_int(section::MOUNTAINS, key::HEIGHT, settings.mountain_range.height);
    config.set_double(section::MOUNTAINS, key::SIZE, settings.mountain_range.size);
    config.set_int(section::MOUNTAINS, key::SNOW_HEIGHT, settings.mountain_range.snow_height);
    config.set_bool(section::MOUNTAINS, key::SNOW_CAP, settings.mountain_range.snow_cap);

    config.set_bool(section::GENERATION, key::DETERMINISTIC_DECORATIONS, settings.deterministic_decorations);
    config.set_bool(section::GENERATION, key::DESERT_DUNES, settings.desert_dunes);
}

int32_t seed_from_config(const core::Config& config) {
    std::string phrase = config.get_string(core::config_section::WORLD, core::config_key::SEED, "");
    if (!phrase.empty()) {
        return seed_from_text(phrase);
    }
    return config.get_int(core::config_section::WORLD, core::config_key::SEED, 0);
}

// ============================================================================
// Presets
// ============================================================================

int32_t seed_from_text(std::string_view text) {
    uint32_t hash = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        const char32_t code_point = next_code_point(text, pos);
        if (code_point < 0x10000) {
            hash = hash * 31u + static_cast<uint32_t>(code_point);
        } else {
            // Hashed as a UTF-16 surrogate pair
            const char32_t offset = code_point - 0x10000;
            hash = hash * 31u + static_cast<uint32_t>(0xD800 + (offset >> 10));
            hash = hash * 31u + static_cast<uint32_t>(0xDC00 + (offset & 0x3FF));
        }
    }
    return static_cast<int32_t>(hash);
}

GenerationSettings settings_from_options(const WorldOptions& options) {
    GenerationSettings settings;

    settings.width = std::clamp(options.width, 10, 1000);
    settings.length = std::clamp(options.length, 10, 1000);
    settings.max_height = 64;

    settings.temperature = options.temperature / 100.0;

    const double mountain = options.mountain_height;
    if (mountain < 30) {
        settings.roughness = 0.3 + (mountain / 30.0) * 0.2;
    } else if (mountain < 70) {
        settings.roughness = 0.5 + ((mountain - 30.0) / 40.0) * 1.0;
    } else {
        settings.roughness = 1.5 + ((mountain - 70.0) / 30.0) * 2.5;
    }

    settings.sea_level = 32 + static_cast<int>(std::round((options.water_level / 100.0) * 6.0));
    settings.flatness_factor = options.terrain_flatness / 100.0;
    settings.completely_flat = options.terrain_flatness >= 98;
    settings.ore_rarity = 0.83 - (options.ore_density / 100.0) * 0.18;
    settings.generate_ores = options.generate_ores;

    settings.scale = 0.03 * (1000.0 / std::max(settings.width, settings.length));
    settings.smoothing = 0.7;
    settings.terrain_blend = 0.5;
    settings.river_frequency = 0.05;

    const double range = options.mountain_range;
    settings.mountain_range.enabled = options.mountain_range > 0;
    settings.mountain_range.size = range / 100.0;
    settings.mountain_range.height = static_cast<int>(std::round(20.0 + (range / 100.0) * 30.0));
    settings.mountain_range.snow_cap = true;
    settings.mountain_range.snow_height = static_cast<int>(std::round(40.0 + (range / 100.0) * 15.0));

    if (settings.width < 100 || settings.length < 100) {
        VOXELFORGE_LOG_DEBUG(core::log_category::CONFIG, "Small world detected, tripling noise scale");
        settings.scale *= 3.0;
    } else if (settings.width > 500 || settings.length > 500) {
        VOXELFORGE_LOG_DEBUG(core::log_category::CONFIG, "Large world detected, widening noise scale");
        settings.scale *= 1.2;
    }

    return settings;
}

}  // namespace voxelforge::world
