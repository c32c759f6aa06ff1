// VoxelForge World Generation
// hydrology.hpp - Oceans, lakes, beaches, rivers and underwater smoothing

#pragma once

#include "biome.hpp"
#include "generation_settings.hpp"
#include "noise.hpp"
#include "world_grid.hpp"

#include <cstdint>

namespace voxelforge::world {

// ============================================================================
// Hydrology Noise
// ============================================================================

struct HydrologyNoise {
    NoiseField2D river;     // 1 octave, scale 0.01 + river_frequency, seed + 5
    ColumnMap<float> lake;  // 1 octave, scale 0.02, seed + 9, radius-2 weighted average
};

[[nodiscard]] HydrologyNoise generate_hydrology_noise(const GenerationSettings& settings, int32_t seed);

/// Weighted average (1 / (1 + distance)) over a square of the given radius
[[nodiscard]] ColumnMap<float> smooth_lake_noise(const NoiseField2D& lake, int radius = 2);

// ============================================================================
// Hydrology Stages
// ============================================================================

struct HydrologyStats {
    size_t ocean_columns = 0;
    size_t lake_columns = 0;    // Marked by the depression pass
    size_t grown_columns = 0;   // Added by flood growth
    size_t filled_columns = 0;  // Received a water body
    size_t beach_columns = 0;
    size_t river_columns = 0;
    size_t smoothed_voxels = 0;
};

/// Highest non-water voxel in y in [1, max_height) per column, 0 when none
[[nodiscard]] SurfaceHeightMap compute_surface_heights(const VoxelEditor& editor);

/// Ocean seeding, the lake/depression pass and three flood-growth iterations
[[nodiscard]] WaterState classify_water(const SurfaceHeightMap& surface, const ColumnMap<BiomeType>& biomes,
                                        const ColumnMap<float>& lake_noise, int sea_level,
                                        HydrologyStats* stats = nullptr);

/// Fill water columns below sea level up to sea_level over a smoothed bed and
/// sand the shores of the columns around them
void fill_water_bodies(VoxelEditor& editor, const SurfaceHeightMap& surface, WaterState& water, int sea_level,
                       DecorationRandom& bed_random, DecorationRandom& beach_random, HydrologyStats* stats = nullptr);

/// Carve shallow river channels where the river noise lies in (0.47, 0.53)
void carve_rivers(VoxelEditor& editor, const SurfaceHeightMap& surface, WaterState& water,
                  const NoiseField2D& river_noise, int sea_level, DecorationRandom& bank_random,
                  HydrologyStats* stats = nullptr);

/// Remove isolated voxels below water beds
size_t smooth_underwater_terrain(VoxelEditor& editor, const WaterState& water);

}  // namespace voxelforge::world
