// VoxelForge World Generation
// density_field.hpp - 3D solid/air density used to locate column surfaces

#pragma once

#include "biome.hpp"
#include "generation_settings.hpp"
#include "world_grid.hpp"

#include <cstdint>
#include <vector>

namespace voxelforge::world {

// Density >= 0 is solid, < 0 is air.
// Index z * width * height + y * width + x, with height = max_height.
struct DensityField {
    int width = 0;
    int height = 0;
    int length = 0;
    std::vector<float> values;

    [[nodiscard]] size_t index(int x, int y, int z) const {
        return (static_cast<size_t>(z) * static_cast<size_t>(height) + static_cast<size_t>(y)) *
                   static_cast<size_t>(width) +
               static_cast<size_t>(x);
    }
    [[nodiscard]] float at(int x, int y, int z) const { return values[index(x, y, z)]; }
    [[nodiscard]] bool is_solid(int x, int y, int z) const { return at(x, y, z) >= 0.0f; }

    // Highest y >= 1 that is solid with air (or the world top) above it, 0 when none
    [[nodiscard]] int surface_height(int x, int z) const;
};

inline constexpr int DENSITY_REFERENCE_HEIGHT = 32;
inline constexpr float DENSITY_FLOOR = 10.0f;

// Flat-mode surface for a normalized height: round(16 + h * 32)
[[nodiscard]] int flat_surface_height(float height);

// Noise amplitude banded by roughness: < 0.5 and > 1.5 scale linearly, else 6
[[nodiscard]] double density_noise_amplitude(double roughness);

[[nodiscard]] DensityField generate_density_field(const GenerationSettings& settings, int32_t seed,
                                                  const ColumnMap<BiomeType>& biomes, const HeightMap& heights);

}  // namespace voxelforge::world
