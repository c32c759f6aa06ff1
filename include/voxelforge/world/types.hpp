// VoxelForge World Generation
// types.hpp - Core types, coordinates and packed voxel keys

#pragma once

#include <glm/glm.hpp>

#include <cstdint>

namespace voxelforge::world {

// ============================================================================
// Block Identification
// ============================================================================

// External block type ID supplied by the caller's block registry
using BlockId = uint16_t;

inline constexpr BlockId BLOCK_INVALID = 0xFFFF;

// ============================================================================
// Coordinate Types (using GLM)
// ============================================================================

// World-centered voxel position
using VoxelPos = glm::ivec3;

// Grid column position (x, z) in local [0, width) x [0, length) space
using ColumnPos = glm::ivec2;

// ============================================================================
// Packed Voxel Keys
// ============================================================================
//
// 64-bit key layout: [x:21][y:21][z:21], each axis stored in two's complement.

inline constexpr int32_t KEY_AXIS_BITS = 21;
inline constexpr uint64_t KEY_AXIS_MASK = (uint64_t{1} << KEY_AXIS_BITS) - 1;
inline constexpr int32_t KEY_AXIS_MIN = -(1 << (KEY_AXIS_BITS - 1));
inline constexpr int32_t KEY_AXIS_MAX = (1 << (KEY_AXIS_BITS - 1)) - 1;

using VoxelKey = uint64_t;

[[nodiscard]] inline bool is_packable(const VoxelPos& pos) {
    return pos.x >= KEY_AXIS_MIN && pos.x <= KEY_AXIS_MAX && pos.y >= KEY_AXIS_MIN && pos.y <= KEY_AXIS_MAX &&
           pos.z >= KEY_AXIS_MIN && pos.z <= KEY_AXIS_MAX;
}

[[nodiscard]] inline VoxelKey pack_voxel_key(const VoxelPos& pos) {
    auto axis = [](int32_t v) -> uint64_t { return static_cast<uint64_t>(static_cast<uint32_t>(v)) & KEY_AXIS_MASK; };
    return (axis(pos.x) << (2 * KEY_AXIS_BITS)) | (axis(pos.y) << KEY_AXIS_BITS) | axis(pos.z);
}

[[nodiscard]] inline VoxelPos unpack_voxel_key(VoxelKey key) {
    // Sign-extend each 21-bit field
    auto axis = [](uint64_t bits) -> int32_t {
        auto v = static_cast<int32_t>(bits & KEY_AXIS_MASK);
        return (v & (1 << (KEY_AXIS_BITS - 1))) ? v - (1 << KEY_AXIS_BITS) : v;
    };
    return VoxelPos(axis(key >> (2 * KEY_AXIS_BITS)), axis(key >> KEY_AXIS_BITS), axis(key));
}

// ============================================================================
// Neighbor Offsets
// ============================================================================

// The 8 horizontal neighbors, row by row (dz outer, dx inner)
inline constexpr glm::ivec2 NEIGHBOR_OFFSETS_8[8] = {{-1, -1}, {0, -1}, {1, -1}, {-1, 0},
                                                     {1, 0},   {-1, 1}, {0, 1},  {1, 1}};

}  // namespace voxelforge::world

