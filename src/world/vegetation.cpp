// VoxelForge World Generation
// vegetation.cpp - Cacti, trees and desert dunes on the finished terrain

#include <cmath>
#include <cstdlib>
#include <voxelforge/core/logger.hpp>
#include <voxelforge/world/vegetation.hpp>

namespace voxelforge::world {

namespace {

int random_int(DecorationRandom& random, int range) {
    return static_cast<int>(std::floor(random.next() * range));
}

bool is_sandy(const VoxelEditor& editor, int x, int y, int z) {
    return editor.is(x, y, z, BlockRole::Sand) || editor.is(x, y, z, BlockRole::SandLight);
}

// Every cell from base + 1 to base + height is inside the world and empty
bool column_is_free(const VoxelEditor& editor, int x, int base, int z, int height) {
    for (int dy = 1; dy <= height; ++dy) {
        if (!editor.is_free(x, base + dy, z)) {
            return false;
        }
    }
    return true;
}

struct GridOffsets {
    int tree_x = 0;
    int tree_z = 0;
    int cactus_x = 0;
    int cactus_z = 0;
};

void place_cacti(VoxelEditor& editor, const ClimateMaps& climate, const GridOffsets& offsets,
                 DecorationRandom& random, VegetationStats& stats) {
    const WorldGrid& grid = editor.grid();
    for (int z = 0; z < grid.length; ++z) {
        for (int x = 0; x < grid.width; ++x) {
            if (climate.biome_at(x, z) != BiomeType::Desert) {
                continue;
            }
            const int surface = editor.top_non_water(x, z, 0);
            if (surface <= 0 || !is_sandy(editor, x, surface, z)) {
                continue;
            }
            if ((x + offsets.cactus_x) % CACTUS_GRID != 0 || (z + offsets.cactus_z) % CACTUS_GRID != 0) {
                continue;
            }

            const double roll = random.next();
            if (roll >= cactus_probability(climate.temperature_at(x, z))) {
                continue;
            }

            const int height = 3 + random_int(random, 2);
            if (!column_is_free(editor, x, surface, z, height)) {
                continue;
            }
            for (int dy = 1; dy <= height; ++dy) {
                editor.place(x, surface + dy, z, BlockRole::Cactus);
            }
            ++stats.cacti;
        }
    }
}

void place_leaf(VoxelEditor& editor, int x, int y, int z, BlockRole leaf, VegetationStats& stats) {
    if (editor.is_free(x, y, z) && editor.place(x, y, z, leaf)) {
        ++stats.leaves;
    }
}

void grow_tree(VoxelEditor& editor, int x, int surface, int z, BiomeType biome, int height, DecorationRandom& random,
               VegetationStats& stats) {
    const bool snowy = is_snowy(biome);
    const BlockRole log = snowy ? BlockRole::PoplarLog : BlockRole::Log;
    const BlockRole leaf = snowy ? BlockRole::ColdLeaves : BlockRole::OakLeaves;
    const int leaf_radius = tree_leaf_radius(biome);

    for (int dy = 1; dy <= height; ++dy) {
        editor.place(x, surface + dy, z, log);
    }

    for (int ly = height - 1; ly <= height + 1; ++ly) {
        const int radius = ly == height ? leaf_radius : leaf_radius - 1;
        for (int lx = -radius; lx <= radius; ++lx) {
            for (int lz = -radius; lz <= radius; ++lz) {
                if (lx == 0 && lz == 0 && ly < height) {
                    continue;
                }
                const double dy = ly - height;
                const double dist = std::sqrt(lx * lx + lz * lz + dy * dy * 0.5);
                if (dist <= radius || (dist <= radius + 0.5 && random.next() < 0.5)) {
                    place_leaf(editor, x + lx, surface + ly, z + lz, leaf, stats);
                }
            }
        }
    }

    for (int i = 0; i < STRAGGLER_LEAVES; ++i) {
        const int lx = random_int(random, 5) - 2;
        const int ly = height + random_int(random, 3) - 1;
        const int lz = random_int(random, 5) - 2;
        if (std::abs(lx) <= leaf_radius && std::abs(lz) <= leaf_radius) {
            place_leaf(editor, x + lx, surface + ly, z + lz, leaf, stats);
        }
    }
    ++stats.trees;
}

void raise_dune(VoxelEditor& editor, int x, int surface, int z, DecorationRandom& random, VegetationStats& stats) {
    if (random.next() >= 0.05 || surface <= 0) {
        return;
    }
    editor.place(x, surface + 1, z, BlockRole::Sandstone);
    if (random.next() < 0.3) {
        for (int dx = -1; dx <= 1; ++dx) {
            for (int dz = -1; dz <= 1; ++dz) {
                if ((dx == 0) != (dz == 0)) {
                    editor.place(x + dx, surface + 1, z + dz, BlockRole::Sandstone);
                }
            }
        }
    }
    ++stats.dunes;
}

void place_trees(VoxelEditor& editor, const ClimateMaps& climate, const GenerationSettings& settings,
                 const GridOffsets& offsets, DecorationRandom& random, VegetationStats& stats) {
    const WorldGrid& grid = editor.grid();
    for (int z = 0; z < grid.length; ++z) {
        for (int x = 0; x < grid.width; ++x) {
            const BiomeType biome = climate.biome_at(x, z);
            const int surface = editor.top_non_water(x, z, 0);

            if (biome == BiomeType::Desert) {
                if (settings.desert_dunes) {
                    raise_dune(editor, x, surface, z, random, stats);
                }
                continue;
            }
            if ((x + offsets.tree_x) % TREE_GRID != 0 || (z + offsets.tree_z) % TREE_GRID != 0) {
                continue;
            }
            if (is_sandy(editor, x, surface, z)) {
                continue;
            }
            if (random.next() >= tree_probability(biome)) {
                continue;
            }

            const int height = tree_base_height(biome) + random_int(random, 2);
            if (!column_is_free(editor, x, surface, z, height + 2)) {
                continue;
            }
            grow_tree(editor, x, surface, z, biome, height, random, stats);
        }
    }
}

}  // namespace

double tree_probability(BiomeType biome) {
    switch (biome) {
        case BiomeType::Forest:
        case BiomeType::Taiga:
            return 0.3;
        case BiomeType::Plains:
        case BiomeType::Savanna:
            return 0.15;
        case BiomeType::SnowyForest:
        case BiomeType::SnowyTaiga:
            return 0.25;
        default:
            return 0.1;
    }
}

double cactus_probability(double temperature) {
    if (temperature > 0.8) {
        return 0.35;
    }
    if (temperature > 0.7) {
        return 0.3;
    }
    if (temperature > 0.6) {
        return 0.25;
    }
    return 0.2;
}

int tree_base_height(BiomeType biome) {
    if (biome == BiomeType::Savanna) {
        return 5;
    }
    return is_snowy(biome) ? 3 : 4;
}

int tree_leaf_radius(BiomeType biome) {
    return biome == BiomeType::Savanna ? 3 : 2;
}

VegetationStats place_vegetation(VoxelEditor& editor, const ClimateMaps& climate, const GenerationSettings& settings,
                                 DecorationRandom& random) {
    GridOffsets offsets;
    offsets.tree_x = random_int(random, TREE_GRID);
    offsets.tree_z = random_int(random, TREE_GRID);
    offsets.cactus_x = random_int(random, CACTUS_GRID);
    offsets.cactus_z = random_int(random, CACTUS_GRID);

    VegetationStats stats;
    place_cacti(editor, climate, offsets, random, stats);
    place_trees(editor, climate, settings, offsets, random, stats);

    VOXELFORGE_LOG_DEBUG(core::log_category::VEGETATION, "Placed {} cacti, {} trees ({} leaves), {} dunes",
                         stats.cacti, stats.trees, stats.leaves, stats.dunes);
    return stats;
}

}  // namespace voxelforge::world
