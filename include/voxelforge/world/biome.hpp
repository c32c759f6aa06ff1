// VoxelForge World Generation
// biome.hpp - Biome types, climate classification and surface palettes

#pragma once

#include "block_types.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace voxelforge::world {

// ============================================================================
// Biome Type Enumeration
// ============================================================================

enum class BiomeType : uint8_t {
    SnowyPlains = 0,
    SnowyForest,
    SnowyTaiga,
    Plains,
    Forest,
    Taiga,
    Swamp,
    Savanna,
    Jungle,
    Desert,
    Ocean,
    Count  // Must be last
};

inline constexpr size_t BIOME_COUNT = static_cast<size_t>(BiomeType::Count);

/// Convert biome type to its snake_case name
[[nodiscard]] const char* biome_type_to_string(BiomeType type);

/// Convert a snake_case name to a biome type
[[nodiscard]] std::optional<BiomeType> biome_type_from_string(std::string_view name);

[[nodiscard]] inline bool is_snowy(BiomeType type) {
    return type == BiomeType::SnowyPlains || type == BiomeType::SnowyForest || type == BiomeType::SnowyTaiga;
}

// ============================================================================
// Classification
// ============================================================================

/// Temperature bands split at 0.2/0.4/0.6/0.8, humidity bands at 0.3/0.6.
/// Total over all inputs; values outside [0, 1] fall into the outer bands.
/// Never returns Ocean.
[[nodiscard]] BiomeType classify_biome(double temperature, double humidity);

// ============================================================================
// Surface Palette
// ============================================================================

struct BiomePalette {
    BlockRole subsurface = BlockRole::Dirt;       // Three blocks under the surface
    BlockRole surface = BlockRole::Grass;         // Surface and above
    std::optional<BlockRole> underwater_surface;  // Replaces both layers below sea level
    bool rock_outcrops = true;                    // Rock noise > 0.8 turns dirt/grass into cobblestone
};

/// Rock noise threshold for cobblestone outcrops
inline constexpr double ROCK_OUTCROP_THRESHOLD = 0.8;

[[nodiscard]] const BiomePalette& get_biome_palette(BiomeType type);

}  // namespace voxelforge::world
