// VoxelForge World Generation
// hydrology.cpp - Oceans, lakes, beaches, rivers and underwater smoothing

#include <algorithm>
#include <cmath>
#include <voxelforge/core/logger.hpp>
#include <voxelforge/world/hydrology.hpp>

namespace voxelforge::world {

namespace {

constexpr double LAKE_NOISE_THRESHOLD = 0.7;
constexpr double RIVER_BAND_MIN = 0.47;
constexpr double RIVER_BAND_MAX = 0.53;
constexpr int FLOOD_GROWTH_ITERATIONS = 3;

bool adjacent_to_water(const ColumnMap<uint8_t>& water, int x, int z) {
    for (const auto& offset : NEIGHBOR_OFFSETS_8) {
        const int nx = x + offset.x;
        const int nz = z + offset.y;
        if (water.contains(nx, nz) && water.at(nx, nz) != 0) {
            return true;
        }
    }
    return false;
}

// No in-bounds neighbor with a non-zero surface lies below height
bool is_depression(const SurfaceHeightMap& surface, int x, int z, int height) {
    for (const auto& offset : NEIGHBOR_OFFSETS_8) {
        const int nx = x + offset.x;
        const int nz = z + offset.y;
        if (!surface.contains(nx, nz) || surface.at(nx, nz) == 0) {
            continue;
        }
        if (surface.at(nx, nz) < height) {
            return false;
        }
    }
    return true;
}

int count_higher_neighbors(const SurfaceHeightMap& surface, int x, int z, int height) {
    int higher = 0;
    for (const auto& offset : NEIGHBOR_OFFSETS_8) {
        const int nx = x + offset.x;
        const int nz = z + offset.y;
        if (!surface.contains(nx, nz) || surface.at(nx, nz) == 0) {
            continue;
        }
        if (surface.at(nx, nz) >= height + 2) {
            ++higher;
        }
    }
    return higher;
}

// Floor of the mean surface over the column and its in-bounds neighbors
int mean_neighborhood_height(const SurfaceHeightMap& surface, int x, int z) {
    int total = surface.at(x, z);
    int count = 1;
    for (const auto& offset : NEIGHBOR_OFFSETS_8) {
        const int nx = x + offset.x;
        const int nz = z + offset.y;
        if (surface.contains(nx, nz)) {
            total += surface.at(nx, nz);
            ++count;
        }
    }
    return static_cast<int>(std::floor(static_cast<double>(total) / count));
}

}  // namespace

// ============================================================================
// Hydrology Noise
// ============================================================================

HydrologyNoise generate_hydrology_noise(const GenerationSettings& settings, int32_t seed) {
    const int64_t base = seed;

    HydrologyNoise noise;
    noise.river = generate_perlin_noise(settings.width, settings.length,
                                        {.octaves = 1,
                                         .scale = 0.01 + settings.river_frequency,
                                         .persistence = 0.5,
                                         .amplitude = 1.0,
                                         .seed = base + 5});
    const NoiseField2D lake = generate_perlin_noise(
        settings.width, settings.length,
        {.octaves = 1, .scale = 0.02, .persistence = 0.5, .amplitude = 1.0, .seed = base + 9});
    noise.lake = smooth_lake_noise(lake);
    return noise;
}

ColumnMap<float> smooth_lake_noise(const NoiseField2D& lake, int radius) {
    ColumnMap<float> smoothed(lake.width, lake.height, 0.0f);

    for (int z = 0; z < lake.height; ++z) {
        for (int x = 0; x < lake.width; ++x) {
            double total = 0.0;
            double count = 0.0;
            for (int dz = -radius; dz <= radius; ++dz) {
                for (int dx = -radius; dx <= radius; ++dx) {
                    const int nx = x + dx;
                    const int nz = z + dz;
                    if (nx < 0 || nx >= lake.width || nz < 0 || nz >= lake.height) {
                        continue;
                    }
                    const double weight = 1.0 / (1.0 + std::sqrt(static_cast<double>(dx * dx + dz * dz)));
                    total += lake.at(nx, nz) * weight;
                    count += weight;
                }
            }
            smoothed.at(x, z) = static_cast<float>(total / count);
        }
    }
    return smoothed;
}

// ============================================================================
// Classification
// ============================================================================

SurfaceHeightMap compute_surface_heights(const VoxelEditor& editor) {
    const WorldGrid& grid = editor.grid();
    SurfaceHeightMap surface(grid.width, grid.length, 0);
    for (int z = 0; z < grid.length; ++z) {
        for (int x = 0; x < grid.width; ++x) {
            surface.at(x, z) = editor.top_non_water(x, z);
        }
    }
    return surface;
}

WaterState classify_water(const SurfaceHeightMap& surface, const ColumnMap<BiomeType>& biomes,
                          const ColumnMap<float>& lake_noise, int sea_level, HydrologyStats* stats) {
    const int width = surface.width;
    const int length = surface.length;
    WaterState state(width, length);

    size_t ocean = 0;
    for (size_t i = 0; i < biomes.values.size(); ++i) {
        if (biomes.values[i] == BiomeType::Ocean) {
            state.water.values[i] = 1;
            ++ocean;
        }
    }

    // Lakes and depressions, interior columns only
    size_t lakes = 0;
    for (int z = 1; z < length - 1; ++z) {
        for (int x = 1; x < width - 1; ++x) {
            const int height = surface.at(x, z);
            if (state.water.at(x, z) != 0 || height > sea_level) {
                continue;
            }

            bool mark = false;
            if (lake_noise.at(x, z) > LAKE_NOISE_THRESHOLD && height < sea_level - 1) {
                mark = true;
            } else if (is_depression(surface, x, z, height) && height < sea_level) {
                mark = true;
            } else if (height < sea_level - 2) {
                mark = count_higher_neighbors(surface, x, z, height) >= 5;
            }

            if (mark) {
                state.water.at(x, z) = 1;
                ++lakes;
            }
        }
    }

    // Flood growth, each iteration reads the previous mask
    size_t grown = 0;
    for (int iteration = 0; iteration < FLOOD_GROWTH_ITERATIONS; ++iteration) {
        ColumnMap<uint8_t> next = state.water;
        for (int z = 1; z < length - 1; ++z) {
            for (int x = 1; x < width - 1; ++x) {
                const int height = surface.at(x, z);
                if (state.water.at(x, z) != 0 || height > sea_level) {
                    continue;
                }
                if (adjacent_to_water(state.water, x, z)) {
                    next.at(x, z) = 1;
                    ++grown;
                }
            }
        }
        state.water = std::move(next);
    }

    if (stats) {
        stats->ocean_columns = ocean;
        stats->lake_columns = lakes;
        stats->grown_columns = grown;
    }
    VOXELFORGE_LOG_DEBUG(core::log_category::HYDROLOGY, "Water mask: {} ocean, {} lake, {} grown columns", ocean,
                         lakes, grown);
    return state;
}

// ============================================================================
// Water Bodies and Beaches
// ============================================================================

void fill_water_bodies(VoxelEditor& editor, const SurfaceHeightMap& surface, WaterState& water, int sea_level,
                       DecorationRandom& bed_random, DecorationRandom& beach_random, HydrologyStats* stats) {
    const WorldGrid& grid = editor.grid();
    size_t filled = 0;
    size_t beaches = 0;

    for (int z = 0; z < grid.length; ++z) {
        for (int x = 0; x < grid.width; ++x) {
            const int height = surface.at(x, z);

            if (water.is_water(x, z)) {
                if (height >= sea_level) {
                    continue;
                }

                const int bed = std::max(height - 2, mean_neighborhood_height(surface, x, z));
                water.bed.at(x, z) = bed;

                for (int y = bed + 1; y <= height; ++y) {
                    editor.remove(x, y, z);
                }
                for (int y = bed + 1; y <= sea_level; ++y) {
                    editor.place(x, y, z, BlockRole::WaterStill);
                }

                if (sea_level - bed > 3) {
                    editor.place(x, bed, z, bed_random.next() < 0.6 ? BlockRole::Gravel : BlockRole::Clay);
                } else {
                    editor.place(x, bed, z, BlockRole::Sand);
                }
                ++filled;
                continue;
            }

            if (!adjacent_to_water(water.water, x, z) || height < sea_level - 2 || height > sea_level + 1) {
                continue;
            }

            editor.place(x, height, z, beach_random.next() < 0.7 ? BlockRole::Sand : BlockRole::SandLight);
            if (beach_random.next() < 0.5 && height > 1) {
                editor.place(x, height - 1, z, BlockRole::Sand);
            }
            ++beaches;
        }
    }

    if (stats) {
        stats->filled_columns = filled;
        stats->beach_columns = beaches;
    }
    VOXELFORGE_LOG_DEBUG(core::log_category::HYDROLOGY, "Filled {} water columns, {} beach columns", filled, beaches);
}

// ============================================================================
// Rivers
// ============================================================================

void carve_rivers(VoxelEditor& editor, const SurfaceHeightMap& surface, WaterState& water,
                  const NoiseField2D& river_noise, int sea_level, DecorationRandom& bank_random,
                  HydrologyStats* stats) {
    const WorldGrid& grid = editor.grid();
    size_t rivers = 0;

    for (int z = 0; z < grid.length; ++z) {
        for (int x = 0; x < grid.width; ++x) {
            if (water.is_water(x, z)) {
                continue;
            }

            const double river_value = river_noise.at(x, z);
            if (river_value <= RIVER_BAND_MIN || river_value >= RIVER_BAND_MAX) {
                continue;
            }

            const int height = surface.at(x, z);
            if (height > sea_level + 4) {
                continue;
            }

            const int depth =
                std::clamp(static_cast<int>(std::floor((height - sea_level) * 0.3)) + 1, 1, 2);
            const int water_height = std::max(height - depth, std::min(sea_level, height - 1));
            if (water_height <= 0 || water_height >= height) {
                continue;
            }

            for (int y = std::max(water_height, height - 2); y <= height; ++y) {
                editor.remove(x, y, z);
            }

            if (water_height <= sea_level) {
                editor.place(x, water_height, z, BlockRole::WaterStill);
                water.water.at(x, z) = 1;
                water.bed.at(x, z) = water_height;
                ++rivers;
            }

            // Banks, column-major over the neighborhood
            for (int dx = -1; dx <= 1; ++dx) {
                for (int dz = -1; dz <= 1; ++dz) {
                    if (dx == 0 && dz == 0) {
                        continue;
                    }
                    const int nx = x + dx;
                    const int nz = z + dz;
                    if (!surface.contains(nx, nz) || water.is_water(nx, nz)) {
                        continue;
                    }
                    const int bank = surface.at(nx, nz);
                    if (bank > 0 && bank <= water_height + 2) {
                        editor.place(nx, bank, nz, bank_random.next() < 0.6 ? BlockRole::Sand : BlockRole::Dirt);
                    }
                }
            }
        }
    }

    if (stats) {
        stats->river_columns = rivers;
    }
    VOXELFORGE_LOG_DEBUG(core::log_category::HYDROLOGY, "Carved {} river columns", rivers);
}

// ============================================================================
// Underwater Smoothing
// ============================================================================

size_t smooth_underwater_terrain(VoxelEditor& editor, const WaterState& water) {
    const WorldGrid& grid = editor.grid();
    size_t removed = 0;

    for (int z = 0; z < grid.length; ++z) {
        for (int x = 0; x < grid.width; ++x) {
            if (!water.is_water(x, z) || water.bed.at(x, z) == 0) {
                continue;
            }
            const int bed = water.bed.at(x, z);

            for (int y = bed - 1; y > 0; --y) {
                if (!editor.contains(x, y, z)) {
                    continue;
                }

                int adjacent_blocks = 0;
                int adjacent_water = 0;
                for (const auto& offset : NEIGHBOR_OFFSETS_8) {
                    const int nx = x + offset.x;
                    const int nz = z + offset.y;
                    if (editor.contains(nx, y, nz)) {
                        ++adjacent_blocks;
                    }
                    if (water.is_water(nx, nz)) {
                        ++adjacent_water;
                    }
                }

                // 2 near the floor up to 5 just under the bed
                const int threshold = static_cast<int>(std::floor(2 + 3 * (static_cast<double>(y - 1) / bed)));
                if (adjacent_blocks <= threshold && adjacent_water >= 4) {
                    editor.remove(x, y, z);
                    ++removed;
                }
            }
        }
    }

    VOXELFORGE_LOG_DEBUG(core::log_category::HYDROLOGY, "Underwater smoothing removed {} voxels", removed);
    return removed;
}

}  // namespace voxelforge::world
