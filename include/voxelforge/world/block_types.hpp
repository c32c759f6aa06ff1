// VoxelForge World Generation
// block_types.hpp - Semantic block roles and their external ID table

#pragma once

#include "types.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voxelforge::world {

// ============================================================================
// Block Roles
// ============================================================================

// Every block the generator can place, by meaning rather than by ID
enum class BlockRole : uint8_t {
    Stone,
    Dirt,
    Grass,
    Sand,
    SandLight,
    Snow,
    Gravel,
    Clay,
    Cactus,
    Sandstone,
    Lava,
    WaterStill,
    Coal,
    Iron,
    Gold,
    Emerald,
    Diamond,
    Log,
    PoplarLog,
    OakLeaves,
    ColdLeaves,
    Cobblestone,
    Count
};

inline constexpr size_t BLOCK_ROLE_COUNT = static_cast<size_t>(BlockRole::Count);

// Role names as used by the editor's block table ("sand-light", "poplar log", ...)
[[nodiscard]] const char* block_role_to_string(BlockRole role);
[[nodiscard]] std::optional<BlockRole> block_role_from_string(std::string_view name);

// An entry of the editor's block registry
struct RegisteredBlock {
    BlockId id = BLOCK_INVALID;
    std::string name;
};

// ============================================================================
// Block Type Table
// ============================================================================

class BlockTypeTable {
public:
    BlockTypeTable();

    void set(BlockRole role, BlockId id);
    void unset(BlockRole role);

    [[nodiscard]] std::optional<BlockId> find(BlockRole role) const;
    [[nodiscard]] bool has(BlockRole role) const { return find(role).has_value(); }

    // True when the voxel ID is the one mapped to role (false for unmapped roles)
    [[nodiscard]] bool is(BlockId id, BlockRole role) const;

    [[nodiscard]] std::vector<BlockRole> missing_roles() const;
    [[nodiscard]] size_t mapped_count() const;

    // Parse a {"role": id, ...} object. Unknown role names are logged and ignored.
    bool load_from_json(std::string_view text);
    bool load(const std::filesystem::path& path);

    [[nodiscard]] std::string to_json() const;

    // Sequential IDs 1..22 in role order
    [[nodiscard]] static BlockTypeTable defaults();

    // Resolve roles against a registry list by case-insensitive name containment
    // (water-still -> "water", ores -> "<name>-ore", snow -> snow/snow-block/white-wool)
    [[nodiscard]] static BlockTypeTable from_registry(const std::vector<RegisteredBlock>& registry);

private:
    std::array<BlockId, BLOCK_ROLE_COUNT> ids_;
};

}  // namespace voxelforge::world
