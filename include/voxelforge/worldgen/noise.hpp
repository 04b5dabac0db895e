#pragma once

/**
 * @file noise.hpp
 * @brief Deterministic scalar noise for procedural generation
 *
 * Point noise is a sine hash: sin(x*c1 + y*c2 + z*c3 + seed*c4) * K with the
 * integer part discarded. It has no internal state and uses no system
 * randomness, so the same inputs always give the same value. It is a
 * spatial hash, not gradient noise; adjacent integer inputs are unrelated.
 *
 * Fractal noise sums point noise over octaves of rising frequency and
 * falling weight, normalized by the total weight so the result stays in
 * [0, 1] for any octave count.
 */

#include <cstdint>

namespace voxelforge::worldgen {

// ============================================================================
// Parameters
// ============================================================================

/// Coefficients of the sine hash
struct NoiseCoefficients {
    double cx = 127.1;
    double cy = 311.7;
    double cz = 522.1;
    double cseed = 1013.0;
    double amplitude = 43758.5453;

    bool operator==(const NoiseCoefficients& other) const = default;
};

/// Upper bound GeneratorConfig::validate() accepts for FractalParams::octaves
constexpr int32_t MAX_OCTAVES = 32;

/// Octave stacking parameters for fractalNoise()
struct FractalParams {
    int32_t octaves = 1;
    double persistence = 0.5;   ///< Weight multiplier per octave
    double lacunarity = 2.0;    ///< Frequency multiplier per octave
    double scale = 1.0;         ///< Frequency of the first octave

    bool operator==(const FractalParams& other) const = default;
};

// ============================================================================
// NoiseField
// ============================================================================

class NoiseField {
public:
    explicit NoiseField(NoiseCoefficients coefficients = {});

    /// Hash noise at a 3D point. Returns [0, 1).
    [[nodiscard]] double pointNoise(double x, double y, double z, double seed) const;

    /// Octave sum of pointNoise(x*f, 0, z*f, seed). Returns [0, 1].
    /// params.octaves must be at least 1.
    [[nodiscard]] double fractalNoise(double x, double z, double seed,
                                      const FractalParams& params) const;

    [[nodiscard]] double fractalNoise(double x, double z, double seed,
                                      int32_t octaves, double persistence,
                                      double lacunarity, double scale) const {
        return fractalNoise(x, z, seed, FractalParams{octaves, persistence, lacunarity, scale});
    }

    [[nodiscard]] const NoiseCoefficients& coefficients() const { return coefficients_; }

private:
    NoiseCoefficients coefficients_;
};

}  // namespace voxelforge::worldgen
