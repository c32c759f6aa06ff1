// VoxelForge World Generation
// voxel_map.cpp - Sparse voxel storage keyed by packed coordinates

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <voxelforge/core/logger.hpp>
#include <voxelforge/world/voxel_map.hpp>

namespace voxelforge::world {

std::optional<BlockId> VoxelMap::get(const VoxelPos& pos) const {
    if (!is_packable(pos)) {
        return std::nullopt;
    }
    auto it = voxels_.find(pack_voxel_key(pos));
    if (it == voxels_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool VoxelMap::contains(const VoxelPos& pos) const {
    return is_packable(pos) && voxels_.count(pack_voxel_key(pos)) > 0;
}

bool VoxelMap::set(const VoxelPos& pos, BlockId id) {
    if (!is_packable(pos)) {
        return false;
    }
    voxels_[pack_voxel_key(pos)] = id;
    return true;
}

bool VoxelMap::erase(const VoxelPos& pos) {
    if (!is_packable(pos)) {
        return false;
    }
    return voxels_.erase(pack_voxel_key(pos)) > 0;
}

size_t VoxelMap::count(BlockId id) const {
    size_t total = 0;
    for (const auto& [key, value] : voxels_) {
        if (value == id) {
            ++total;
        }
    }
    return total;
}

void VoxelMap::for_each(const std::function<void(const VoxelPos&, BlockId)>& callback) const {
    for (const auto& [key, id] : voxels_) {
        callback(unpack_voxel_key(key), id);
    }
}

std::string VoxelMap::to_json(int indent) const {
    nlohmann::json data = nlohmann::json::object();
    for (const auto& [key, id] : voxels_) {
        VoxelPos pos = unpack_voxel_key(key);
        data[fmt::format("{},{},{}", pos.x, pos.y, pos.z)] = id;
    }
    return data.dump(indent);
}

bool VoxelMap::save_json(const std::filesystem::path& path) const {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        VOXELFORGE_LOG_ERROR(core::log_category::WORLD, "Failed to open {} for writing", path.string());
        return false;
    }

    file << to_json();
    if (!file) {
        VOXELFORGE_LOG_ERROR(core::log_category::WORLD, "Failed to write voxel map to {}", path.string());
        return false;
    }

    VOXELFORGE_LOG_INFO(core::log_category::WORLD, "Wrote {} voxels to {}", voxels_.size(), path.string());
    return true;
}

}  // namespace voxelforge::world
