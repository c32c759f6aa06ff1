// VoxelForge World Generation
// world_grid.hpp - Grid geometry, per-column maps and the voxel editor shared by all stages

#pragma once

#include "block_types.hpp"
#include "generation_settings.hpp"
#include "types.hpp"
#include "voxel_map.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace voxelforge::world {

// ============================================================================
// World Grid
// ============================================================================

// Local grid coordinates: x in [0, width), z in [0, length), y in [0, max_height).
// World coordinates are offset by (start_x, 0, start_z).
struct WorldGrid {
    int width = 0;
    int length = 0;
    int max_height = 0;
    int start_x = 0;
    int start_z = 0;

    [[nodiscard]] static WorldGrid from_settings(const GenerationSettings& settings) {
        return WorldGrid{.width = settings.width,
                         .length = settings.length,
                         .max_height = settings.max_height,
                         .start_x = world_start_x(settings),
                         .start_z = world_start_z(settings)};
    }

    [[nodiscard]] bool in_columns(int x, int z) const { return x >= 0 && x < width && z >= 0 && z < length; }
    [[nodiscard]] bool in_bounds(int x, int y, int z) const { return in_columns(x, z) && y >= 0 && y < max_height; }

    [[nodiscard]] bool is_interior(int x, int z) const {
        return x >= 1 && x < width - 1 && z >= 1 && z < length - 1;
    }

    [[nodiscard]] size_t column_index(int x, int z) const {
        return static_cast<size_t>(z) * static_cast<size_t>(width) + static_cast<size_t>(x);
    }
    [[nodiscard]] size_t column_count() const { return static_cast<size_t>(width) * static_cast<size_t>(length); }

    [[nodiscard]] VoxelPos to_world(int x, int y, int z) const { return VoxelPos(start_x + x, y, start_z + z); }
};

// ============================================================================
// Per-column maps
// ============================================================================

// Dense per-column value, index z * width + x
template <typename T>
struct ColumnMap {
    int width = 0;
    int length = 0;
    std::vector<T> values;

    ColumnMap() = default;
    ColumnMap(int w, int l, T fill = T{})
        : width(w), length(l), values(static_cast<size_t>(w) * static_cast<size_t>(l), fill) {}

    [[nodiscard]] size_t index(int x, int z) const {
        return static_cast<size_t>(z) * static_cast<size_t>(width) + static_cast<size_t>(x);
    }
    [[nodiscard]] bool contains(int x, int z) const { return x >= 0 && x < width && z >= 0 && z < length; }

    [[nodiscard]] T& at(int x, int z) { return values[index(x, z)]; }
    [[nodiscard]] const T& at(int x, int z) const { return values[index(x, z)]; }
};

// Normalized elevation in [0, 1]
using HeightMap = ColumnMap<float>;

// Highest non-water voxel per column, 0 when the column is empty
using SurfaceHeightMap = ColumnMap<int>;

// Water classification produced by hydrology and read by the later stages
struct WaterState {
    ColumnMap<uint8_t> water;  // 1 = ocean, lake or river column
    ColumnMap<int> bed;        // Water bed height, 0 = none recorded

    WaterState() = default;
    WaterState(int width, int length) : water(width, length, 0), bed(width, length, 0) {}

    [[nodiscard]] bool is_water(int x, int z) const { return water.contains(x, z) && water.at(x, z) != 0; }
    [[nodiscard]] size_t water_column_count() const;
};

// ============================================================================
// Voxel Editor
// ============================================================================

// Role-based read/write view of the voxel map in local grid coordinates.
// Writes outside the world or of an unmapped role are dropped; positions
// outside the world read as absent but are never free.
class VoxelEditor {
public:
    VoxelEditor(VoxelMap& voxels, const BlockTypeTable& blocks, const WorldGrid& grid);

    bool place(int x, int y, int z, BlockRole role);
    bool remove(int x, int y, int z);

    [[nodiscard]] std::optional<BlockId> get(int x, int y, int z) const;
    [[nodiscard]] bool contains(int x, int y, int z) const;
    [[nodiscard]] bool is(int x, int y, int z, BlockRole role) const;

    // In bounds and empty
    [[nodiscard]] bool is_free(int x, int y, int z) const;

    // Highest voxel in [min_y, max_height) that is not water-still, 0 when none
    [[nodiscard]] int top_non_water(int x, int z, int min_y = 1) const;

    [[nodiscard]] const WorldGrid& grid() const { return grid_; }
    [[nodiscard]] const BlockTypeTable& blocks() const { return blocks_; }

    [[nodiscard]] size_t placed_count() const { return placed_count_; }
    [[nodiscard]] size_t removed_count() const { return removed_count_; }
    [[nodiscard]] size_t dropped_count() const { return dropped_count_; }

private:
    VoxelMap& voxels_;
    const BlockTypeTable& blocks_;
    WorldGrid grid_;
    size_t placed_count_ = 0;
    size_t removed_count_ = 0;
    size_t dropped_count_ = 0;
};

}  // namespace voxelforge::world
