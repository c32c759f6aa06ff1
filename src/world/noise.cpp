// VoxelForge World Generation
// noise.cpp - Seeded LCG, permutation tables and octave Perlin noise

#include <algorithm>
#include <cmath>
#include <random>
#include <voxelforge/core/logger.hpp>
#include <voxelforge/world/noise.hpp>

namespace voxelforge::world {

namespace {

constexpr int64_t LCG_MULTIPLIER = 1664525;
constexpr int64_t LCG_INCREMENT = 1013904223;
constexpr int64_t LCG_MODULUS = 4294967296;  // 2^32

int64_t entropy_seed() {
    std::random_device device;
    return static_cast<int64_t>(device());
}

float normalize(float accumulated, double total_amplitude) {
    double value = (static_cast<double>(accumulated) / total_amplitude + 1.0) * 0.5;
    return static_cast<float>(std::clamp(value, 0.0, 1.0));
}

}  // namespace

// ============================================================================
// LcgRandom / DecorationRandom
// ============================================================================

double LcgRandom::next() {
    // C++ % truncates toward zero, matching the sign-of-dividend remainder
    state_ = (state_ * LCG_MULTIPLIER + LCG_INCREMENT) % LCG_MODULUS;
    return static_cast<double>(state_) / static_cast<double>(LCG_MODULUS);
}

DecorationRandom::DecorationRandom(int64_t seed, bool deterministic)
    : lcg_(static_cast<int64_t>(static_cast<uint32_t>(deterministic ? seed : entropy_seed()))) {}

double DecorationRandom::next() {
    ++draw_count_;
    return lcg_.next();
}

// ============================================================================
// PermutationTable
// ============================================================================

PermutationTable::PermutationTable(int64_t seed) {
    LcgRandom random(seed);
    std::array<uint8_t, 256> p{};
    for (int i = 0; i < 256; ++i) {
        p[static_cast<size_t>(i)] = static_cast<uint8_t>(i);
    }

    for (int i = 255; i > 0; --i) {
        int j = static_cast<int>(std::floor(random.next() * (i + 1)));
        if (j < 0) {
            // Negative seeds yield negative draws; the slot reads back as 0
            p[static_cast<size_t>(i)] = 0;
            continue;
        }
        std::swap(p[static_cast<size_t>(i)], p[static_cast<size_t>(j)]);
    }

    for (size_t i = 0; i < SIZE; ++i) {
        perm_[i] = p[i & 255];
    }
}

// ============================================================================
// Gradients and single-octave noise
// ============================================================================

double grad2d(int hash, double x, double y) {
    const int h = hash & 7;
    const double u = h < 4 ? x : y;
    const double v = h < 4 ? y : x;
    return ((h & 1) == 0 ? u : -u) + ((h & 2) == 0 ? v : -v);
}

double grad3d(int hash, double x, double y, double z) {
    const int h = hash & 15;
    const double u = h < 8 ? x : y;
    const double v = h < 4 ? y : (h == 12 || h == 14 ? x : z);
    return ((h & 1) == 0 ? u : -u) + ((h & 2) == 0 ? v : -v);
}

double perlin2d(double x, double y, const PermutationTable& perm) {
    const double fx = std::floor(x);
    const double fy = std::floor(y);
    const auto X = static_cast<size_t>(static_cast<int64_t>(fx) & 255);
    const auto Y = static_cast<size_t>(static_cast<int64_t>(fy) & 255);

    x -= fx;
    y -= fy;

    const double u = fade(x);
    const double v = fade(y);

    const size_t A = static_cast<size_t>(perm[X]) + Y;
    const size_t B = static_cast<size_t>(perm[X + 1]) + Y;
    const auto AA = static_cast<size_t>(perm[A]);
    const auto BA = static_cast<size_t>(perm[B]);
    const auto AB = static_cast<size_t>(perm[A + 1]);
    const auto BB = static_cast<size_t>(perm[B + 1]);

    const double g1 = grad2d(perm[AA], x, y);
    const double g2 = grad2d(perm[BA], x - 1, y);
    const double g3 = grad2d(perm[AB], x, y - 1);
    const double g4 = grad2d(perm[BB], x - 1, y - 1);

    return lerp(lerp(g1, g2, u), lerp(g3, g4, u), v);
}

double perlin3d(double x, double y, double z, const PermutationTable& perm) {
    const double fx = std::floor(x);
    const double fy = std::floor(y);
    const double fz = std::floor(z);
    const auto X = static_cast<size_t>(static_cast<int64_t>(fx) & 255);
    const auto Y = static_cast<size_t>(static_cast<int64_t>(fy) & 255);
    const auto Z = static_cast<size_t>(static_cast<int64_t>(fz) & 255);

    x -= fx;
    y -= fy;
    z -= fz;

    const double u = fade(x);
    const double v = fade(y);
    const double w = fade(z);

    const size_t A = static_cast<size_t>(perm[X]) + Y;
    const size_t B = static_cast<size_t>(perm[X + 1]) + Y;
    const size_t AA = static_cast<size_t>(perm[A]) + Z;
    const size_t AB = static_cast<size_t>(perm[A + 1]) + Z;
    const size_t BA = static_cast<size_t>(perm[B]) + Z;
    const size_t BB = static_cast<size_t>(perm[B + 1]) + Z;

    const double g1 = grad3d(perm[AA], x, y, z);
    const double g2 = grad3d(perm[BA], x - 1, y, z);
    const double g3 = grad3d(perm[AB], x, y - 1, z);
    const double g4 = grad3d(perm[BB], x - 1, y - 1, z);
    const double g5 = grad3d(perm[AA + 1], x, y, z - 1);
    const double g6 = grad3d(perm[BA + 1], x - 1, y, z - 1);
    const double g7 = grad3d(perm[AB + 1], x, y - 1, z - 1);
    const double g8 = grad3d(perm[BB + 1], x - 1, y - 1, z - 1);

    const double lerp1 = lerp(g1, g2, u);
    const double lerp2 = lerp(g3, g4, u);
    const double lerp3 = lerp(g5, g6, u);
    const double lerp4 = lerp(g7, g8, u);

    return lerp(lerp(lerp1, lerp2, v), lerp(lerp3, lerp4, v), w);
}

// ============================================================================
// Octave fields
// ============================================================================

NoiseField2D generate_perlin_noise(int width, int height, const NoiseOptions& options) {
    NoiseField2D field;
    field.width = width;
    field.height = height;
    field.values.assign(static_cast<size_t>(width) * static_cast<size_t>(height), 0.0f);

    const PermutationTable perm(options.seed);

    // Accumulated in float storage, each step computed in double
    double total_amplitude = 0.0;
    for (int octave = 0; octave < options.octaves; ++octave) {
        const double frequency = std::pow(2.0, octave);
        const double amplitude = std::pow(options.persistence, octave) * options.amplitude;
        total_amplitude += amplitude;

        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                const double nx = static_cast<double>(x) * options.scale * frequency;
                const double ny = static_cast<double>(y) * options.scale * frequency;
                float& value = field.values[field.index(x, y)];
                value = static_cast<float>(static_cast<double>(value) + perlin2d(nx, ny, perm) * amplitude);
            }
        }
    }

    for (float& value : field.values) {
        value = normalize(value, total_amplitude);
    }

    VOXELFORGE_LOG_TRACE(core::log_category::NOISE, "2D noise {}x{} seed={} octaves={} scale={}", width, height,
                         options.seed, options.octaves, options.scale);
    return field;
}

NoiseField3D generate_perlin_noise_3d(int width, int height, int depth, const NoiseOptions& options) {
    NoiseField3D field;
    field.width = width;
    field.height = height;
    field.depth = depth;
    field.values.assign(static_cast<size_t>(width) * static_cast<size_t>(height) * static_cast<size_t>(depth), 0.0f);

    const PermutationTable perm(options.seed);

    double total_amplitude = 0.0;
    for (int octave = 0; octave < options.octaves; ++octave) {
        const double frequency = std::pow(2.0, octave);
        const double amplitude = std::pow(options.persistence, octave) * options.amplitude;
        total_amplitude += amplitude;

        for (int z = 0; z < depth; ++z) {
            for (int y = 0; y < height; ++y) {
                for (int x = 0; x < width; ++x) {
                    const double nx = static_cast<double>(x) * options.scale * frequency;
                    const double ny = static_cast<double>(y) * options.scale * frequency;
                    const double nz = static_cast<double>(z) * options.scale * frequency;
                    float& value = field.values[field.index(x, y, z)];
                    value = static_cast<float>(static_cast<double>(value) + perlin3d(nx, ny, nz, perm) * amplitude);
                }
            }
        }
    }

    for (float& value : field.values) {
        value = normalize(value, total_amplitude);
    }

    VOXELFORGE_LOG_TRACE(core::log_category::NOISE, "3D noise {}x{}x{} seed={} octaves={} scale={}", width, height,
                         depth, options.seed, options.octaves, options.scale);
    return field;
}

}  // namespace voxelforge::world
