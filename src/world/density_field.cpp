// VoxelForge World Generation
// density_field.cpp - 3D solid/air density used to locate column surfaces

#include <cmath>
#include <voxelforge/core/logger.hpp>
#include <voxelforge/world/density_field.hpp>
#include <voxelforge/world/noise.hpp>

namespace voxelforge::world {

int DensityField::surface_height(int x, int z) const {
    for (int y = height - 1; y > 0; --y) {
        if (is_solid(x, y, z) && (y == height - 1 || !is_solid(x, y + 1, z))) {
            return y;
        }
    }
    return 0;
}

int flat_surface_height(float height) {
    // Half-up rounding
    return static_cast<int>(std::floor(16.0 + static_cast<double>(height) * 32.0 + 0.5));
}

double density_noise_amplitude(double roughness) {
    if (roughness < 0.5) {
        return 4.0 + (roughness - 0.3) * 4.0;
    }
    if (roughness > 1.5) {
        return 6.0 + (roughness - 1.5) * 2.0;
    }
    return 6.0;
}

DensityField generate_density_field(const GenerationSettings& settings, int32_t seed,
                                    const ColumnMap<BiomeType>& biomes, const HeightMap& heights) {
    const int w = settings.width;
    const int h = settings.max_height;
    const int l = settings.length;

    DensityField field;
    field.width = w;
    field.height = h;
    field.length = l;
    field.values.assign(static_cast<size_t>(w) * static_cast<size_t>(h) * static_cast<size_t>(l), 0.0f);

    if (settings.completely_flat) {
        for (int z = 0; z < l; ++z) {
            for (int x = 0; x < w; ++x) {
                const int top = flat_surface_height(heights.at(x, z));
                for (int y = 0; y < h; ++y) {
                    field.values[field.index(x, y, z)] = y <= top ? DENSITY_FLOOR : -DENSITY_FLOOR;
                }
            }
        }
        VOXELFORGE_LOG_DEBUG(core::log_category::TERRAIN, "Binary flat density field {}x{}x{}", w, h, l);
        return field;
    }

    const NoiseField3D continentalness = generate_perlin_noise_3d(
        w, h, l, {.octaves = 2, .scale = settings.scale * 0.5, .persistence = 0.7, .amplitude = 1.0, .seed = seed});

    const double noise_amplitude = density_noise_amplitude(settings.roughness);
    const double flatness_weight = 1.0 - settings.flatness_factor;

    for (int z = 0; z < l; ++z) {
        for (int y = 0; y < h; ++y) {
            for (int x = 0; x < w; ++x) {
                const size_t index = field.index(x, y, z);
                if (y <= 1) {
                    field.values[index] = DENSITY_FLOOR;
                    continue;
                }

                double density = DENSITY_REFERENCE_HEIGHT - y;
                const BiomeType biome = biomes.at(x, z);
                if (biome == BiomeType::Desert) {
                    density *= 0.95;
                } else if (biome == BiomeType::Forest) {
                    density *= 1.05;
                }

                density += continentalness.values[index] * noise_amplitude * flatness_weight;
                field.values[index] = static_cast<float>(density);
            }
        }
    }

    VOXELFORGE_LOG_DEBUG(core::log_category::TERRAIN, "Density field {}x{}x{}, noise amplitude {:.2f}", w, h, l,
                         noise_amplitude * flatness_weight);
    return field;
}

}  // namespace voxelforge::world
