// VoxelForge World Generation
// world_generator.hpp - Seed-based generation of a complete voxel world

#pragma once

#include "block_types.hpp"
#include "cave_carver.hpp"
#include "column_builder.hpp"
#include "generation_settings.hpp"
#include "hydrology.hpp"
#include "mountain_range.hpp"
#include "vegetation.hpp"
#include "voxel_map.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <voxelforge/core/progress.hpp>

namespace voxelforge::world {

// ============================================================================
// Generation Result
// ============================================================================

struct GenerationStats {
    ColumnBuildStats columns;
    HydrologyStats hydrology;
    CaveStats caves;
    MountainStats mountains;
    VegetationStats vegetation;
    size_t dropped_writes = 0;  // Writes of roles without a block ID
    size_t total_voxels = 0;
    double elapsed_ms = 0.0;
};

struct GenerationResult {
    VoxelMap voxels;
    std::vector<std::string> warnings;
    GenerationStats stats;
};

// Offsets from the world seed for the decoration streams
namespace decoration_stream {
    inline constexpr int64_t BED_MATERIAL = 11;
    inline constexpr int64_t BEACHES = 12;
    inline constexpr int64_t RIVER_BANKS = 13;
    inline constexpr int64_t EMERALD = 14;
    inline constexpr int64_t MOUNTAIN_SNOW = 15;
    inline constexpr int64_t VEGETATION = 16;
}  // namespace decoration_stream

// ============================================================================
// World Generator
// ============================================================================

// Runs the generation stages in order:
// heightmap, climate, density, columns, hydrology, caves and ores,
// underwater smoothing, mountains, vegetation.
//
// The generator keeps no state between calls; separate calls may run on
// separate threads.
class WorldGenerator {
public:
    WorldGenerator() = default;

    /// Generate a world. Returns nullopt when the settings fail validation.
    [[nodiscard]] std::optional<GenerationResult> generate(const GenerationSettings& settings, int32_t seed,
                                                           const BlockTypeTable& block_types,
                                                           core::ProgressReporter& progress) const;

    [[nodiscard]] std::optional<GenerationResult> generate(const GenerationSettings& settings, int32_t seed,
                                                           const BlockTypeTable& block_types) const;
};

}  // namespace voxelforge::world
