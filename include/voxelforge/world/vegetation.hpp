// VoxelForge World Generation
// vegetation.hpp - Cacti, trees and desert dunes on the finished terrain

#pragma once

#include "biome.hpp"
#include "climate.hpp"
#include "generation_settings.hpp"
#include "noise.hpp"
#include "world_grid.hpp"

namespace voxelforge::world {

// ============================================================================
// Biome Tables
// ============================================================================

/// Chance that a tree grid cell in the biome grows a tree
[[nodiscard]] double tree_probability(BiomeType biome);

/// Chance that a cactus grid cell grows a cactus at the offset temperature
[[nodiscard]] double cactus_probability(double temperature);

/// Trunk height before the 0-1 random extra block
[[nodiscard]] int tree_base_height(BiomeType biome);

/// Canopy radius at the trunk top
[[nodiscard]] int tree_leaf_radius(BiomeType biome);

// ============================================================================
// Placement
// ============================================================================

inline constexpr int TREE_GRID = 5;
inline constexpr int CACTUS_GRID = 7;
inline constexpr int STRAGGLER_LEAVES = 5;

struct VegetationStats {
    size_t cacti = 0;
    size_t trees = 0;
    size_t leaves = 0;
    size_t dunes = 0;
};

// Cacti first, then trees (and dunes when enabled) over the whole world.
// Grid offsets and all chances come from random, in placement order.
VegetationStats place_vegetation(VoxelEditor& editor, const ClimateMaps& climate, const GenerationSettings& settings,
                                 DecorationRandom& random);

}  // namespace voxelforge::world
