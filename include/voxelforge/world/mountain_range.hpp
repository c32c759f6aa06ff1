// VoxelForge World Generation
// mountain_range.hpp - Snow-capped ranges raised along the world borders

#pragma once

#include "generation_settings.hpp"
#include "noise.hpp"
#include "world_grid.hpp"

#include <optional>

namespace voxelforge::world {

// Range geometry derived from MountainRangeSettings and the world width
struct MountainProfile {
    double size_adjustment = 1.0;  // max(0.05, 1 - size * 4)
    double base_height = 0.0;
    double snow_line = 0.0;
    int border_width = 5;

    [[nodiscard]] static MountainProfile from_settings(const GenerationSettings& settings);
};

/// Target mountain top for a column, nullopt when the column lies further
/// than the border width from every edge. Clamped to [1, max_height - 1].
[[nodiscard]] std::optional<int> mountain_column_height(const MountainProfile& profile,
                                                        const GenerationSettings& settings, int x, int z);

struct MountainStats {
    size_t columns = 0;
    size_t stone = 0;
    size_t snow = 0;
};

/// Raise border columns above their current surface. The surface map is
/// updated to the new tops. No-op unless enabled and not in flat mode.
MountainStats apply_mountain_range(VoxelEditor& editor, SurfaceHeightMap& surface, const GenerationSettings& settings,
                                   DecorationRandom& snow_random);

}  // namespace voxelforge::world
