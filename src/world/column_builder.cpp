// VoxelForge World Generation
// column_builder.cpp - Layered block assignment for every world column

#include <fmt/format.h>

#include <cmath>
#include <voxelforge/core/logger.hpp>
#include <voxelforge/world/column_builder.hpp>

namespace voxelforge::world {

BlockRole column_block_role(BiomeType biome, int y, int surface, int sea_level, double rock_value) {
    if (y < surface - 3) {
        return BlockRole::Stone;
    }

    const BiomePalette& palette = get_biome_palette(biome);
    if (palette.underwater_surface && y < sea_level) {
        return *palette.underwater_surface;
    }
    if (palette.rock_outcrops && rock_value > ROCK_OUTCROP_THRESHOLD) {
        return BlockRole::Cobblestone;
    }
    return y < surface ? palette.subsurface : palette.surface;
}

ColumnBuildStats build_columns(VoxelEditor& editor, const DensityField& density, const ColumnMap<BiomeType>& biomes,
                               const NoiseField2D& rock, int sea_level, core::ProgressReporter& progress) {
    const WorldGrid& grid = editor.grid();
    const int row_step = static_cast<int>(std::ceil(grid.length / 10.0));

    ColumnBuildStats stats;
    for (int z = 0; z < grid.length; ++z) {
        for (int x = 0; x < grid.width; ++x) {
            const BiomeType biome = biomes.at(x, z);
            const double rock_value = rock.at(x, z);

            if (editor.place(x, 0, z, BlockRole::Lava)) {
                ++stats.voxels;
            }

            const int surface = density.surface_height(x, z);
            for (int y = 1; y < grid.max_height; ++y) {
                if (!density.is_solid(x, y, z)) {
                    continue;
                }
                if (editor.place(x, y, z, column_block_role(biome, y, surface, sea_level, rock_value))) {
                    ++stats.voxels;
                }
            }
            ++stats.columns;
        }

        if (z % row_step == 0) {
            const double fraction = static_cast<double>(z) / grid.length;
            progress.report(fmt::format("Building terrain: {}% complete", static_cast<int>(std::floor(fraction * 100))),
                            static_cast<int>(std::floor(45 + fraction * 15)));
        }
    }

    VOXELFORGE_LOG_DEBUG(core::log_category::TERRAIN, "Built {} columns with {} voxels", stats.columns, stats.voxels);
    return stats;
}

}  // namespace voxelforge::world
