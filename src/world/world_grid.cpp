// VoxelForge World Generation
// world_grid.cpp - Per-column maps and the voxel editor shared by all stages

#include <algorithm>
#include <voxelforge/world/world_grid.hpp>

namespace voxelforge::world {

size_t WaterState::water_column_count() const {
    return static_cast<size_t>(std::count_if(water.values.begin(), water.values.end(), [](uint8_t v) { return v != 0; }));
}

VoxelEditor::VoxelEditor(VoxelMap& voxels, const BlockTypeTable& blocks, const WorldGrid& grid)
    : voxels_(voxels), blocks_(blocks), grid_(grid) {}

bool VoxelEditor::place(int x, int y, int z, BlockRole role) {
    if (!grid_.in_bounds(x, y, z)) {
        return false;
    }
    auto id = blocks_.find(role);
    if (!id) {
        ++dropped_count_;
        return false;
    }
    voxels_.set(grid_.to_world(x, y, z), *id);
    ++placed_count_;
    return true;
}

bool VoxelEditor::remove(int x, int y, int z) {
    if (!grid_.in_bounds(x, y, z)) {
        return false;
    }
    if (voxels_.erase(grid_.to_world(x, y, z))) {
        ++removed_count_;
        return true;
    }
    return false;
}

std::optional<BlockId> VoxelEditor::get(int x, int y, int z) const {
    if (!grid_.in_bounds(x, y, z)) {
        return std::nullopt;
    }
    return voxels_.get(grid_.to_world(x, y, z));
}

bool VoxelEditor::contains(int x, int y, int z) const {
    return grid_.in_bounds(x, y, z) && voxels_.contains(grid_.to_world(x, y, z));
}

bool VoxelEditor::is(int x, int y, int z, BlockRole role) const {
    auto id = get(x, y, z);
    return id && blocks_.is(*id, role);
}

bool VoxelEditor::is_free(int x, int y, int z) const {
    return grid_.in_bounds(x, y, z) && !voxels_.contains(grid_.to_world(x, y, z));
}

int VoxelEditor::top_non_water(int x, int z, int min_y) const {
    for (int y = grid_.max_height - 1; y >= min_y; --y) {
        auto id = get(x, y, z);
        if (id && !blocks_.is(*id, BlockRole::WaterStill)) {
            return y;
        }
    }
    return 0;
}

}  // namespace voxelforge::world
