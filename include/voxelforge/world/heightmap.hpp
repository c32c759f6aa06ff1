// VoxelForge World Generation
// heightmap.hpp - Composited, smoothed and eroded elevation field

#pragma once

#include "generation_settings.hpp"
#include "noise.hpp"
#include "world_grid.hpp"

#include <cstdint>

namespace voxelforge::world {

// ============================================================================
// Terrain Noise Layers
// ============================================================================

/// The 2D layers that shape the terrain. Rock is not part of the elevation;
/// the column builder reads it for cobblestone outcrops.
struct TerrainLayers {
    NoiseField2D continental;  // 1 octave, scale * 0.5, seed
    NoiseField2D hill;         // 3 octaves, scale * 2, amplitude 0.5, seed + 1
    NoiseField2D detail;       // 5 octaves, scale * 4, amplitude 0.2, seed + 2
    NoiseField2D rock;         // 4 octaves, scale * 3, persistence 0.6, amplitude 0.4, seed + 10
    NoiseField2D depth;        // 2 octaves, scale 0.02, seed + 6
};

[[nodiscard]] TerrainLayers generate_terrain_layers(const GenerationSettings& settings, int32_t seed);

// ============================================================================
// Heightmap Stages
// ============================================================================

/// Flat-mode elevation for every column
inline constexpr float FLAT_HEIGHT = 0.25f;

/// Blend the layers into a raw heightmap, or the constant FLAT_HEIGHT in flat mode
[[nodiscard]] HeightMap composite_heightmap(const TerrainLayers& layers, const GenerationSettings& settings);

/// Radial weighted blur (weight 1 / (1 + distance)) over radius floor(2 + terrain_blend * 2),
/// mixed with the raw value by settings.smoothing
[[nodiscard]] HeightMap smooth_heightmap(const HeightMap& raw, const GenerationSettings& settings);

/// Block-height erosion limiting downward steps to one level per 3x3 neighbor.
/// In flat mode the raw map is returned unchanged.
[[nodiscard]] HeightMap erode_heightmap(const HeightMap& smoothed, const HeightMap& raw,
                                        const GenerationSettings& settings);

/// Integer block height of a normalized elevation: floor(36 + h * 28 * roughness)
[[nodiscard]] int eroded_block_height(float height, double roughness);

}  // namespace voxelforge::world
