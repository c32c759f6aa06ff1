// VoxelForge World Generation
// cave_carver.cpp - Cave carving and ore replacement inside stone

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <voxelforge/core/logger.hpp>
#include <voxelforge/world/cave_carver.hpp>

namespace voxelforge::world {

CaveNoise generate_cave_noise(const GenerationSettings& settings, int32_t seed) {
    const int64_t base = seed;
    const int w = settings.width;
    const int h = settings.max_height;
    const int l = settings.length;

    CaveNoise noise;
    noise.small = generate_perlin_noise_3d(
        w, h, l, {.octaves = 2, .scale = 0.03, .persistence = 0.5, .amplitude = 1.0, .seed = base + 2});
    noise.large = generate_perlin_noise_3d(
        w, h, l, {.octaves = 2, .scale = 0.06, .persistence = 0.5, .amplitude = 1.0, .seed = base + 3});
    noise.ore = generate_perlin_noise_3d(
        w, h, l, {.octaves = 1, .scale = 0.04, .persistence = 0.5, .amplitude = 1.0, .seed = base + 4});
    return noise;
}

bool is_cave_cell(double small, double large) {
    return (small > 0.6 && large > 0.5) || small > 0.7 || large > 0.65;
}

std::optional<BlockRole> select_ore(double ore_value, int y, double rarity, DecorationRandom& emerald_random) {
    if (ore_value > rarity + 0.12 && y <= 40) {
        return BlockRole::Coal;
    }
    if (ore_value > rarity + 0.07 && y <= 35) {
        return BlockRole::Iron;
    }
    if (ore_value > rarity + 0.04 && y <= 20) {
        return BlockRole::Gold;
    }
    if (ore_value > rarity + 0.02 && y <= 30 && emerald_random.next() < 0.3) {
        return BlockRole::Emerald;
    }
    if (ore_value > rarity && y <= 15) {
        return BlockRole::Diamond;
    }
    return std::nullopt;
}

CaveStats carve_caves_and_ores(VoxelEditor& editor, const SurfaceHeightMap& surface, const CaveNoise& noise,
                               const GenerationSettings& settings, DecorationRandom& emerald_random,
                               core::ProgressReporter& progress) {
    const WorldGrid& grid = editor.grid();
    const bool carve = !settings.completely_flat;
    const int row_step = static_cast<int>(std::ceil(grid.length / 10.0));

    CaveStats stats;
    for (int z = 0; z < grid.length; ++z) {
        for (int x = 0; x < grid.width; ++x) {
            const int top = std::min(surface.at(x, z) - 2, grid.max_height - 3);

            for (int y = top; y > 1; --y) {
                if (!editor.is(x, y, z, BlockRole::Stone)) {
                    continue;
                }

                if (carve && is_cave_cell(noise.small.at(x, y, z), noise.large.at(x, y, z))) {
                    editor.remove(x, y, z);
                    ++stats.carved;
                    continue;
                }
                if (!settings.generate_ores) {
                    continue;
                }

                const auto ore = select_ore(noise.ore.at(x, y, z), y, settings.ore_rarity, emerald_random);
                if (!ore || !editor.place(x, y, z, *ore)) {
                    continue;
                }
                switch (*ore) {
                    case BlockRole::Coal:
                        ++stats.coal;
                        break;
                    case BlockRole::Iron:
                        ++stats.iron;
                        break;
                    case BlockRole::Gold:
                        ++stats.gold;
                        break;
                    case BlockRole::Emerald:
                        ++stats.emerald;
                        break;
                    default:
                        ++stats.diamond;
                        break;
                }
            }
        }

        if (z % row_step == 0) {
            const double fraction = static_cast<double>(z) / grid.length;
            progress.report(
                fmt::format("Generating caves and ores: {}% complete", static_cast<int>(std::floor(fraction * 100))),
                static_cast<int>(std::floor(80 + fraction * 5)));
        }
    }

    VOXELFORGE_LOG_DEBUG(core::log_category::CAVES, "Carved {} cave voxels, placed {} ores", stats.carved,
                         stats.ore_total());
    return stats;
}

}  // namespace voxelforge::world
