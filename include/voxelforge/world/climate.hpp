// VoxelForge World Generation
// climate.hpp - Temperature and humidity maps with per-column biome assignment

#pragma once

#include "biome.hpp"
#include "generation_settings.hpp"
#include "noise.hpp"
#include "world_grid.hpp"

#include <cstdint>

namespace voxelforge::world {

// ============================================================================
// Climate Sample Result
// ============================================================================

struct ClimateSample {
    double temperature = 0.5;  // Offset applied, may leave [0, 1]
    double humidity = 0.5;
    BiomeType biome = BiomeType::Plains;
};

// ============================================================================
// Climate Maps
// ============================================================================

struct ClimateMaps {
    NoiseField2D temperature;  // 1 octave, scale 0.005, seed + 7
    NoiseField2D humidity;     // 1 octave, scale 0.005, seed + 8
    double temperature_offset = 0.0;  // settings.temperature - 0.5
    ColumnMap<BiomeType> biomes;

    [[nodiscard]] double temperature_at(int x, int z) const {
        return static_cast<double>(temperature.at(x, z)) + temperature_offset;
    }
    [[nodiscard]] BiomeType biome_at(int x, int z) const { return biomes.at(x, z); }
    [[nodiscard]] ClimateSample sample(int x, int z) const {
        return ClimateSample{temperature_at(x, z), static_cast<double>(humidity.at(x, z)), biome_at(x, z)};
    }
};

[[nodiscard]] ClimateMaps generate_climate(const GenerationSettings& settings, int32_t seed);

}  // namespace voxelforge::world
