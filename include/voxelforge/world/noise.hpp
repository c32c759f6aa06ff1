// VoxelForge World Generation
// noise.hpp - Seeded LCG, permutation tables and octave Perlin noise

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace voxelforge::world {

// ============================================================================
// Seeded Random
// ============================================================================

// Linear congruential generator: s = (s * 1664525 + 1013904223) mod 2^32.
// The remainder keeps the sign of the dividend, so negative seeds produce
// negative draws exactly like the reference noise tables expect.
class LcgRandom {
public:
    explicit LcgRandom(int64_t seed) : state_(seed) {}

    // Next draw, state / 2^32
    double next();

    [[nodiscard]] int64_t state() const { return state_; }

private:
    int64_t state_;
};

// Draw source for decoration choices (bed material, beaches, snow, trees).
// Deterministic streams are seeded from the world seed; otherwise each stream
// is seeded from std::random_device.
class DecorationRandom {
public:
    DecorationRandom(int64_t seed, bool deterministic);

    // Uniform draw in [0, 1)
    double next();

    [[nodiscard]] size_t draw_count() const { return draw_count_; }

private:
    LcgRandom lcg_;
    size_t draw_count_ = 0;
};

// ============================================================================
// Permutation Table
// ============================================================================

class PermutationTable {
public:
    static constexpr size_t SIZE = 512;

    explicit PermutationTable(int64_t seed);

    [[nodiscard]] int operator[](size_t index) const { return perm_[index]; }
    [[nodiscard]] const std::array<uint8_t, SIZE>& values() const { return perm_; }

private:
    std::array<uint8_t, SIZE> perm_{};
};

// ============================================================================
// Lattice Noise Primitives
// ============================================================================

[[nodiscard]] inline double fade(double t) {
    return t * t * t * (t * (t * 6 - 15) + 10);
}

[[nodiscard]] inline double lerp(double a, double b, double t) {
    return a + t * (b - a);
}

[[nodiscard]] double grad2d(int hash, double x, double y);
[[nodiscard]] double grad3d(int hash, double x, double y, double z);

// Single octave, roughly [-1, 1]
[[nodiscard]] double perlin2d(double x, double y, const PermutationTable& perm);
[[nodiscard]] double perlin3d(double x, double y, double z, const PermutationTable& perm);

// ============================================================================
// Noise Fields
// ============================================================================

struct NoiseOptions {
    int octaves = 1;
    double scale = 0.01;
    double persistence = 0.5;
    double amplitude = 1.0;
    int64_t seed = 0;
};

// Dense 2D field, index y * width + x
struct NoiseField2D {
    int width = 0;
    int height = 0;
    std::vector<float> values;

    [[nodiscard]] size_t index(int x, int y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x);
    }
    [[nodiscard]] float at(int x, int y) const { return values[index(x, y)]; }
    [[nodiscard]] size_t size() const { return values.size(); }
};

// Dense 3D field, index z * width * height + y * width + x
struct NoiseField3D {
    int width = 0;
    int height = 0;
    int depth = 0;
    std::vector<float> values;

    [[nodiscard]] size_t index(int x, int y, int z) const {
        return (static_cast<size_t>(z) * static_cast<size_t>(height) + static_cast<size_t>(y)) *
                   static_cast<size_t>(width) +
               static_cast<size_t>(x);
    }
    [[nodiscard]] float at(int x, int y, int z) const { return values[index(x, y, z)]; }
    [[nodiscard]] size_t size() const { return values.size(); }
};

// Octave sum normalized from [-total_amplitude, total_amplitude] to [0, 1].
// Every dimension must be >= 1.
[[nodiscard]] NoiseField2D generate_perlin_noise(int width, int height, const NoiseOptions& options);
[[nodiscard]] NoiseField3D generate_perlin_noise_3d(int width, int height, int depth, const NoiseOptions& options);

}  // namespace voxelforge::world
