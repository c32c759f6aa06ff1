// VoxelForge World Generation
// mountain_range.cpp - Snow-capped ranges raised along the world borders

#include <algorithm>
#include <cmath>
#include <numbers>
#include <voxelforge/core/logger.hpp>
#include <voxelforge/world/mountain_range.hpp>

namespace voxelforge::world {

MountainProfile MountainProfile::from_settings(const GenerationSettings& settings) {
    const MountainRangeSettings& range = settings.mountain_range;

    MountainProfile profile;
    profile.size_adjustment = std::max(0.05, 1.0 - range.size * 4.0);
    profile.base_height = range.height * 2 * (1 + profile.size_adjustment * 0.5);
    profile.snow_line = range.snow_height * 1.5;
    profile.border_width =
        std::max(5, static_cast<int>(std::floor(settings.width * 0.25 * profile.size_adjustment)));
    return profile;
}

std::optional<int> mountain_column_height(const MountainProfile& profile, const GenerationSettings& settings, int x,
                                          int z) {
    const int width_m = profile.border_width;
    const double wm = width_m;

    const int west = x;
    const int east = settings.width - x - 1;
    const int north = z;
    const int south = settings.length - z - 1;
    const int edge = std::min({west, east, north, south});
    if (edge > width_m) {
        return std::nullopt;
    }

    const bool near_west = west <= width_m;
    const bool near_east = east <= width_m;
    const bool near_north = north <= width_m;
    const bool near_south = south <= width_m;

    const double height_factor = std::cos((edge / wm) * (std::numbers::pi * 0.5));

    // Corners where two ranges meet are raised further
    double corner_boost = 0.0;
    auto corner = [&](int e1, int e2) { return 0.4 * (1.0 - e1 / wm) * (1.0 - e2 / wm); };
    if (near_west && near_north) {
        corner_boost = corner(west, north);
    } else if (near_west && near_south) {
        corner_boost = corner(west, south);
    } else if (near_east && near_north) {
        corner_boost = corner(east, north);
    } else if (near_east && near_south) {
        corner_boost = corner(east, south);
    }

    const double base = std::floor(profile.base_height * (height_factor + corner_boost));

    double variation = 0.0;
    if ((near_west && west <= north && west <= south) || (near_east && east <= north && east <= south)) {
        variation = static_cast<double>(z) / settings.length;
    } else {
        variation = static_cast<double>(x) / settings.width;
    }

    const double ridge = std::cos(x * 0.2) * std::sin(z * 0.15) * 6;
    const double edge_variation = std::sin(variation * std::numbers::pi * 4) * 5;
    const double local = std::floor(base + ridge + edge_variation);

    const double jitter = std::sin(x * 0.8) * std::cos(z * 0.8) * 2 + std::cos(x * 0.3 + z * 0.2) * 2;
    const int top = std::max(1, static_cast<int>(std::floor(local + jitter)));
    return std::min(top, settings.max_height - 1);
}

MountainStats apply_mountain_range(VoxelEditor& editor, SurfaceHeightMap& surface, const GenerationSettings& settings,
                                   DecorationRandom& snow_random) {
    MountainStats stats;
    const MountainRangeSettings& range = settings.mountain_range;
    if (!range.enabled || settings.completely_flat) {
        return stats;
    }

    const MountainProfile profile = MountainProfile::from_settings(settings);
    const double snow = profile.snow_line;
    VOXELFORGE_LOG_DEBUG(core::log_category::MOUNTAINS, "Border ranges: width {}, height {:.1f}, snow line {:.1f}",
                         profile.border_width, profile.base_height, snow);

    for (int z = 0; z < settings.length; ++z) {
        for (int x = 0; x < settings.width; ++x) {
            const auto top = mountain_column_height(profile, settings, x, z);
            if (!top) {
                continue;
            }
            const int final_height = *top;
            const int current = surface.at(x, z);
            if (current >= final_height) {
                continue;
            }

            for (int y = current + 1; y <= final_height; ++y) {
                bool snowy = false;
                if (range.snow_cap) {
                    if (y == final_height && y >= snow - 5) {
                        snowy = true;
                    } else if (y >= snow - 3 && y >= final_height - 2 && snow_random.next() < 0.7) {
                        snowy = true;
                    } else if (y >= snow - 8 && snow_random.next() < 0.3) {
                        snowy = true;
                    }
                }

                if (editor.place(x, y, z, snowy ? BlockRole::Snow : BlockRole::Stone)) {
                    ++(snowy ? stats.snow : stats.stone);
                }
            }

            surface.at(x, z) = final_height;
            ++stats.columns;
        }
    }

    VOXELFORGE_LOG_DEBUG(core::log_category::MOUNTAINS, "Raised {} columns ({} stone, {} snow)", stats.columns,
                         stats.stone, stats.snow);
    return stats;
}

}  // namespace voxelforge::world
