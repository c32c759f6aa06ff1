// VoxelForge World Generation
// column_builder.hpp - Layered block assignment for every world column

#pragma once

#include "biome.hpp"
#include "density_field.hpp"
#include "noise.hpp"
#include "world_grid.hpp"

#include <voxelforge/core/progress.hpp>

namespace voxelforge::world {

// Block for a solid voxel at y in a column whose surface is at `surface`:
// stone deeper than three below the surface, then the biome's subsurface,
// then its surface (underwater and outcrop rules applied).
[[nodiscard]] BlockRole column_block_role(BiomeType biome, int y, int surface, int sea_level, double rock_value);

struct ColumnBuildStats {
    size_t columns = 0;
    size_t voxels = 0;
};

// Lava floor at y = 0 plus every solid density voxel from y = 1 upward.
// Reports row progress from 45 to 60.
ColumnBuildStats build_columns(VoxelEditor& editor, const DensityField& density, const ColumnMap<BiomeType>& biomes,
                               const NoiseField2D& rock, int sea_level, core::ProgressReporter& progress);

}  // namespace voxelforge::world
