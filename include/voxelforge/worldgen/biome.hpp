#pragma once

/**
 * @file biome.hpp
 * @brief Biome types and column classification
 *
 * Biomes are never stored. They are recomputed from world column
 * coordinates and the world seed whenever a pass needs them, so the
 * classifier must be a pure function of its inputs.
 */

#include "voxelforge/worldgen/noise.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace voxelforge::worldgen {

// ============================================================================
// Biome
// ============================================================================

enum class Biome : uint8_t {
    Plains = 0,
    Desert = 1,
    Forest = 2,
};

constexpr size_t BIOME_COUNT = 3;

constexpr std::array<Biome, BIOME_COUNT> ALL_BIOMES = {
    Biome::Plains, Biome::Desert, Biome::Forest
};

[[nodiscard]] std::string_view biomeName(Biome biome);
[[nodiscard]] std::optional<Biome> biomeFromName(std::string_view name);

// ============================================================================
// BiomeFieldParams
// ============================================================================

/// Large-scale noise field that drives biome selection
struct BiomeFieldParams {
    double seedOffset = 1.0;    ///< Decorrelates the biome field from height noise
    FractalParams fractal{3, 0.5, 2.0, 0.005};
    double desertBelow = 0.33;  ///< n < desertBelow -> Desert
    double forestFrom = 0.66;   ///< n >= forestFrom -> Forest, Plains in between

    bool operator==(const BiomeFieldParams& other) const = default;
};

// ============================================================================
// BiomeClassifier
// ============================================================================

class BiomeClassifier {
public:
    BiomeClassifier(const NoiseField& noise, BiomeFieldParams params)
        : noise_(noise), params_(params) {}

    /// Raw biome field value in [0, 1] at a world column
    [[nodiscard]] double fieldValue(int64_t worldX, int64_t worldZ, int64_t seed) const;

    /// Biome of a world column
    [[nodiscard]] Biome classify(int64_t worldX, int64_t worldZ, int64_t seed) const;

    [[nodiscard]] const BiomeFieldParams& params() const { return params_; }

private:
    const NoiseField& noise_;
    BiomeFieldParams params_;
};

}  // namespace voxelforge::worldgen
