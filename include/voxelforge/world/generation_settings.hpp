// VoxelForge World Generation
// generation_settings.hpp - Generation parameters, validation and presets

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace voxelforge::core {
class Config;
}

namespace voxelforge::world {

// ============================================================================
// Settings
// ============================================================================

struct MountainRangeSettings {
    bool enabled = false;
    int height = 20;        // Base ridge height before the size adjustment
    double size = 0.0;      // 0-1, wider ranges for smaller values
    int snow_height = 40;   // Snow line before the 1.5x scaling
    bool snow_cap = true;
};

struct GenerationSettings {
    // World dimensions
    int width = 200;
    int length = 200;
    int max_height = 64;

    // Terrain shape
    double scale = 0.15;
    double roughness = 1.0;
    double flatness_factor = 0.15;
    double smoothing = 0.7;
    double terrain_blend = 0.5;
    bool completely_flat = false;

    // Climate and water
    double temperature = 0.5;  // 0-1, 0.5 is neutral
    int sea_level = 35;
    double river_frequency = 0.05;

    // Ores
    bool generate_ores = true;
    double ore_rarity = 0.74;  // Higher values produce fewer ores

    MountainRangeSettings mountain_range;

    // Route decoration draws through seeded streams
    bool deterministic_decorations = true;
    bool desert_dunes = false;
};

// Upper bound for scale and river_frequency, keeps noise lattice coordinates within int64
inline constexpr double MAX_NOISE_SCALE = 100.0;

// Problems found in the settings, empty when they are usable
[[nodiscard]] std::vector<std::string> validate_settings(const GenerationSettings& settings);

// World x/z origin so that coordinates are centered on 0
[[nodiscard]] inline int world_start_x(const GenerationSettings& settings) {
    return -(settings.width / 2);
}
[[nodiscard]] inline int world_start_z(const GenerationSettings& settings) {
    return -(settings.length / 2);
}

// ============================================================================
// Config binding
// ============================================================================

[[nodiscard]] GenerationSettings settings_from_config(const core::Config& config);
void store_settings(const GenerationSettings& settings, core::Config& config);

// world.seed may be an integer or a text phrase
[[nodiscard]] int32_t seed_from_config(const core::Config& config);

// ============================================================================
// Presets
// ============================================================================

// Java-style string hash over the UTF-16 code units of UTF-8 text, as a signed 32-bit seed.
// Malformed UTF-8 bytes hash as U+FFFD.
[[nodiscard]] int32_t seed_from_text(std::string_view text);

// Slider values as collected by the world generator panel (0-100 unless noted)
struct WorldOptions {
    int width = 200;   // Blocks, clamped to [10, 1000]
    int length = 200;  // Blocks, clamped to [10, 1000]
    int temperature = 50;
    int mountain_height = 50;
    int water_level = 50;
    int terrain_flatness = 15;
    int ore_density = 50;
    bool generate_ores = true;
    int mountain_range = 0;  // 0 disables the border ranges
};

[[nodiscard]] GenerationSettings settings_from_options(const WorldOptions& options);

}  // namespace voxelforge::world
