// VoxelForge World Generation
// cave_carver.hpp - Cave carving and ore replacement inside stone

#pragma once

#include "generation_settings.hpp"
#include "noise.hpp"
#include "world_grid.hpp"

#include <cstdint>
#include <optional>
#include <voxelforge/core/progress.hpp>

namespace voxelforge::world {

// ============================================================================
// Cave Noise
// ============================================================================

// All three fields span (width, max_height, length)
struct CaveNoise {
    NoiseField3D small;  // 2 octaves, scale 0.03, seed + 2
    NoiseField3D large;  // 2 octaves, scale 0.06, seed + 3
    NoiseField3D ore;    // 1 octave, scale 0.04, seed + 4
};

[[nodiscard]] CaveNoise generate_cave_noise(const GenerationSettings& settings, int32_t seed);

// ============================================================================
// Carving
// ============================================================================

/// True where the two cave fields open a cavity
[[nodiscard]] bool is_cave_cell(double small, double large);

/// Ore for a stone voxel at depth y, nullopt to keep the stone.
/// Ores are tried richest-threshold first; the first match wins. Emerald
/// additionally needs an emerald_draw < 0.3, drawn only when its noise and
/// depth tests pass.
[[nodiscard]] std::optional<BlockRole> select_ore(double ore_value, int y, double rarity,
                                                  DecorationRandom& emerald_random);

struct CaveStats {
    size_t carved = 0;
    size_t coal = 0;
    size_t iron = 0;
    size_t gold = 0;
    size_t emerald = 0;
    size_t diamond = 0;

    [[nodiscard]] size_t ore_total() const { return coal + iron + gold + emerald + diamond; }
};

// Walks every stone voxel from two below the column surface down to y = 2.
// Reports row progress from 80 to 85.
CaveStats carve_caves_and_ores(VoxelEditor& editor, const SurfaceHeightMap& surface, const CaveNoise& noise,
                               const GenerationSettings& settings, DecorationRandom& emerald_random,
                               core::ProgressReporter& progress);

}  // namespace voxelforge::world
