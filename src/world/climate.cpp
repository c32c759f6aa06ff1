// VoxelForge World Generation
// climate.cpp - Temperature and humidity maps with per-column biome assignment

#include <array>
#include <voxelforge/core/logger.hpp>
#include <voxelforge/world/climate.hpp>

namespace voxelforge::world {

namespace {

constexpr double CLIMATE_SCALE = 0.005;

}  // namespace

ClimateMaps generate_climate(const GenerationSettings& settings, int32_t seed) {
    const int w = settings.width;
    const int l = settings.length;
    const int64_t base = seed;

    ClimateMaps maps;
    maps.temperature = generate_perlin_noise(
        w, l, {.octaves = 1, .scale = CLIMATE_SCALE, .persistence = 0.5, .amplitude = 1.0, .seed = base + 7});
    maps.humidity = generate_perlin_noise(
        w, l, {.octaves = 1, .scale = CLIMATE_SCALE, .persistence = 0.5, .amplitude = 1.0, .seed = base + 8});
    maps.temperature_offset = settings.temperature - 0.5;
    maps.biomes = ColumnMap<BiomeType>(w, l, BiomeType::Plains);

    std::array<size_t, BIOME_COUNT> counts{};
    for (int z = 0; z < l; ++z) {
        for (int x = 0; x < w; ++x) {
            BiomeType biome = classify_biome(maps.temperature_at(x, z), maps.humidity.at(x, z));
            maps.biomes.at(x, z) = biome;
            ++counts[static_cast<size_t>(biome)];
        }
    }

    for (size_t i = 0; i < BIOME_COUNT; ++i) {
        if (counts[i] > 0) {
            VOXELFORGE_LOG_DEBUG(core::log_category::TERRAIN, "Biome {}: {} columns",
                                 biome_type_to_string(static_cast<BiomeType>(i)), counts[i]);
        }
    }
    return maps;
}

}  // namespace voxelforge::world
