// VoxelForge World Generation
// voxel_map.hpp - Sparse voxel storage keyed by packed coordinates

#pragma once

#include "types.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace voxelforge::world {

// Sparse map from world voxel position to block ID.
// Absent entries are air. Positions outside the packable key range are
// rejected by set() and reported as absent by the queries.
class VoxelMap {
public:
    VoxelMap() = default;

    [[nodiscard]] std::optional<BlockId> get(const VoxelPos& pos) const;
    [[nodiscard]] bool contains(const VoxelPos& pos) const;

    // Returns false when the position cannot be packed into a key
    bool set(const VoxelPos& pos, BlockId id);

    // Returns true when an entry was removed
    bool erase(const VoxelPos& pos);

    void clear() { voxels_.clear(); }
    void reserve(size_t count) { voxels_.reserve(count); }

    [[nodiscard]] size_t size() const { return voxels_.size(); }
    [[nodiscard]] bool empty() const { return voxels_.empty(); }

    // Number of voxels holding the given ID
    [[nodiscard]] size_t count(BlockId id) const;

    void for_each(const std::function<void(const VoxelPos&, BlockId)>& callback) const;

    // Export as the editor's {"x,y,z": id} object
    [[nodiscard]] std::string to_json(int indent = -1) const;
    bool save_json(const std::filesystem::path& path) const;

    // Raw packed-key access
    [[nodiscard]] const std::unordered_map<VoxelKey, BlockId>& entries() const { return voxels_; }

private:
    std::unordered_map<VoxelKey, BlockId> voxels_;
};

}  // namespace voxelforge::world
