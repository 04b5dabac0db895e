/**
 * @file noise.cpp
 * @brief Sine-hash point noise and fractal octave sum
 */

#include "voxelforge/worldgen/noise.hpp"

#include <cmath>

namespace voxelforge::worldgen {

NoiseField::NoiseField(NoiseCoefficients coefficients)
    : coefficients_(coefficients) {}

double NoiseField::pointNoise(double x, double y, double z, double seed) const {
    const auto& c = coefficients_;
    double n = std::sin(x * c.cx + y * c.cy + z * c.cz + seed * c.cseed) * c.amplitude;
    double fraction = n - std::floor(n);

    // A tiny negative n can round up to exactly 1.0
    if (fraction >= 1.0) {
        return 0.0;
    }
    return fraction;
}

double NoiseField::fractalNoise(double x, double z, double seed,
                                const FractalParams& params) const {
    double total = 0.0;
    double frequency = params.scale;
    double amplitude = 1.0;
    double weightSum = 0.0;

    for (int32_t i = 0; i < params.octaves; ++i) {
        total += pointNoise(x * frequency, 0.0, z * frequency, seed) * amplitude;
        weightSum += amplitude;
        amplitude *= params.persistence;
        frequency *= params.lacunarity;
    }

    if (weightSum <= 0.0) {
        return 0.0;
    }
    return total / weightSum;
}

}  // namespace voxelforge::worldgen
