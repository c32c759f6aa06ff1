// VoxelForge World Generation
// heightmap.cpp - Composited, smoothed and eroded elevation field

#include <algorithm>
#include <cmath>
#include <voxelforge/core/logger.hpp>
#include <voxelforge/world/heightmap.hpp>

namespace voxelforge::world {

namespace {

constexpr int EROSION_BASE_HEIGHT = 36;
constexpr double EROSION_HEIGHT_RANGE = 28.0;

float clamp_unit(double value) {
    return static_cast<float>(std::clamp(value, 0.0, 1.0));
}

}  // namespace

TerrainLayers generate_terrain_layers(const GenerationSettings& settings, int32_t seed) {
    const int w = settings.width;
    const int l = settings.length;
    const int64_t base = seed;

    TerrainLayers layers;
    layers.continental = generate_perlin_noise(
        w, l, {.octaves = 1, .scale = settings.scale * 0.5, .persistence = 0.5, .amplitude = 1.0, .seed = base});
    layers.hill = generate_perlin_noise(
        w, l, {.octaves = 3, .scale = settings.scale * 2, .persistence = 0.5, .amplitude = 0.5, .seed = base + 1});
    layers.detail = generate_perlin_noise(
        w, l, {.octaves = 5, .scale = settings.scale * 4, .persistence = 0.5, .amplitude = 0.2, .seed = base + 2});
    layers.rock = generate_perlin_noise(
        w, l, {.octaves = 4, .scale = settings.scale * 3, .persistence = 0.6, .amplitude = 0.4, .seed = base + 10});
    layers.depth = generate_perlin_noise(
        w, l, {.octaves = 2, .scale = 0.02, .persistence = 0.5, .amplitude = 1.0, .seed = base + 6});

    VOXELFORGE_LOG_DEBUG(core::log_category::TERRAIN, "Generated terrain noise layers for {}x{} (seed {})", w, l,
                         seed);
    return layers;
}

HeightMap composite_heightmap(const TerrainLayers& layers, const GenerationSettings& settings) {
    HeightMap heights(settings.width, settings.length, FLAT_HEIGHT);
    if (settings.completely_flat) {
        VOXELFORGE_LOG_DEBUG(core::log_category::TERRAIN, "Completely flat terrain, height {}", FLAT_HEIGHT);
        return heights;
    }

    const double f = settings.flatness_factor;
    for (size_t i = 0; i < heights.values.size(); ++i) {
        const double base_terrain = layers.continental.values[i];
        const double hill_influence = layers.hill.values[i] * (1.0 - f);
        const double detail_influence = layers.detail.values[i] * (1.0 - f) * 0.5;
        const double depth_influence = layers.depth.values[i] * (1.0 - f) * 0.3;

        const double noise_value = (base_terrain + hill_influence + detail_influence) * (1.0 + depth_influence);
        heights.values[i] = clamp_unit(noise_value * (1.0 - f) + 0.5 * f);
    }
    return heights;
}

HeightMap smooth_heightmap(const HeightMap& raw, const GenerationSettings& settings) {
    HeightMap smoothed(raw.width, raw.length, 0.0f);
    const int radius = static_cast<int>(std::floor(2 + settings.terrain_blend * 2));

    for (int z = 0; z < raw.length; ++z) {
        for (int x = 0; x < raw.width; ++x) {
            double total = 0.0;
            double count = 0.0;

            for (int dz = -radius; dz <= radius; ++dz) {
                for (int dx = -radius; dx <= radius; ++dx) {
                    const int nx = x + dx;
                    const int nz = z + dz;
                    if (!raw.contains(nx, nz)) {
                        continue;
                    }
                    const double distance = std::sqrt(static_cast<double>(dx * dx + dz * dz));
                    const double weight = 1.0 / (1.0 + distance);
                    total += raw.at(nx, nz) * weight;
                    count += weight;
                }
            }

            smoothed.at(x, z) = static_cast<float>((total / count) * settings.smoothing +
                                                   raw.at(x, z) * (1.0 - settings.smoothing));
        }
    }
    return smoothed;
}

int eroded_block_height(float height, double roughness) {
    return static_cast<int>(std::floor(EROSION_BASE_HEIGHT + height * EROSION_HEIGHT_RANGE * roughness));
}

HeightMap erode_heightmap(const HeightMap& smoothed, const HeightMap& raw, const GenerationSettings& settings) {
    if (settings.completely_flat) {
        return raw;
    }

    HeightMap eroded(smoothed.width, smoothed.length, 0.0f);
    size_t lowered = 0;

    for (int z = 0; z < smoothed.length; ++z) {
        for (int x = 0; x < smoothed.width; ++x) {
            int height = eroded_block_height(smoothed.at(x, z), settings.roughness);
            const int original = height;

            for (int dz = -1; dz <= 1; ++dz) {
                for (int dx = -1; dx <= 1; ++dx) {
                    const int nx = x + dx;
                    const int nz = z + dz;
                    if (!smoothed.contains(nx, nz)) {
                        continue;
                    }
                    const int neighbor = eroded_block_height(smoothed.at(nx, nz), settings.roughness);
                    if (neighbor < height - 1) {
                        height = std::max(height - 1, neighbor + 1);
                    }
                }
            }

            if (height != original) {
                ++lowered;
            }
            eroded.at(x, z) = clamp_unit((height - EROSION_BASE_HEIGHT) / EROSION_HEIGHT_RANGE / settings.roughness);
        }
    }

    VOXELFORGE_LOG_DEBUG(core::log_category::TERRAIN, "Erosion lowered {} of {} columns", lowered,
                         eroded.values.size());
    return eroded;
}

}  // namespace voxelforge::world
