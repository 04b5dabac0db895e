#pragma once

/**
 * @file generator_config.hpp
 * @brief Immutable parameters for chunk generation and meshing
 *
 * A GeneratorConfig is built once (defaults, or defaults overridden by a
 * config file) and handed to ChunkPipeline by value. Nothing in the
 * pipeline reads global state, so independently configured worlds can run
 * in the same process.
 *
 * Config file keys (all optional, defaults shown):
 *
 *   noise.coefficients: 127.1 311.7 522.1 1013 43758.5453
 *
 *   biome.seed_offset: 1
 *   biome.octaves: 3
 *   biome.persistence: 0.5
 *   biome.lacunarity: 2
 *   biome.scale: 0.005
 *   biome.desert_below: 0.33
 *   biome.forest_from: 0.66
 *
 *   # base amplitude octaves persistence lacunarity scale
 *   terrain:desert: 60 10 4 0.5 2 0.02
 *   terrain:plains: 64 15 5 0.5 2 0.02
 *   terrain:forest: 70 30 6 0.5 2 0.015
 *   terrain.topsoil_depth: 4
 *
 *   cave.seed_offset: 2
 *   cave.scale: 0.08
 *   cave.threshold: 0.75
 *
 *   feature.seed_offset: 3
 *   feature.height_seed_offset: 4
 *   tree.chance: 0.95
 *   tree.edge_margin: 3
 *   tree.trunk_base: 4
 *   tree.trunk_variation: 3
 *   tree.canopy_radius: 2
 *   cactus.chance: 0.98
 *   cactus.height_base: 2
 *   cactus.height_variation: 2
 *
 *   material:grass: 4caf50
 *   debug.logging: false
 *
 * The terrain rows may also be written as an indented data line under
 * "terrain:<biome>:".
 */

#include "voxelforge/core/block_type.hpp"
#include "voxelforge/worldgen/biome.hpp"
#include "voxelforge/worldgen/noise.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace voxelforge {

class ConfigDocument;

namespace worldgen {

/// Height field shape for one biome:
///   terrainHeight = floor(base + amplitude * fractalNoise(...))
struct TerrainShape {
    double base = 64.0;
    double amplitude = 15.0;
    FractalParams fractal{5, 0.5, 2.0, 0.02};

    bool operator==(const TerrainShape& other) const = default;
};

struct CaveParams {
    double seedOffset = 2.0;
    double scale = 0.08;       ///< Applied to world x, y and z before hashing
    double threshold = 0.75;   ///< Stone with noise above this becomes Air

    bool operator==(const CaveParams& other) const = default;
};

struct TreeParams {
    double chance = 0.95;        ///< Feature noise must exceed this
    int32_t edgeMargin = 3;      ///< Local x/z must lie in [margin, width - margin]
    int32_t trunkBase = 4;
    int32_t trunkVariation = 3;  ///< Trunk = base + floor(noise * variation)
    int32_t canopyRadius = 2;

    bool operator==(const TreeParams& other) const = default;
};

struct CactusParams {
    double chance = 0.98;
    int32_t heightBase = 2;
    int32_t heightVariation = 2;

    bool operator==(const CactusParams& other) const = default;
};

struct FeatureParams {
    double seedOffset = 3.0;        ///< Seed of the placement roll
    double heightSeedOffset = 4.0;  ///< Seed of the trunk / cactus height roll
    TreeParams tree;
    CactusParams cactus;

    bool operator==(const FeatureParams& other) const = default;
};

// ============================================================================
// GeneratorConfig
// ============================================================================

struct GeneratorConfig {
    NoiseCoefficients noise;
    BiomeFieldParams biomes;

    /// Indexed by Biome
    std::array<TerrainShape, BIOME_COUNT> terrain = defaultTerrain();

    /// Cells below the surface that keep topsoil (Dirt or Sand) before Stone
    int32_t topsoilDepth = 4;

    CaveParams caves;
    FeatureParams features;
    MaterialPalette materials = MaterialPalette::standard();

    bool debugLogging = false;

    [[nodiscard]] const TerrainShape& terrainFor(Biome biome) const {
        return terrain[static_cast<size_t>(biome)];
    }

    /// Throws std::invalid_argument describing the first bad value
    void validate() const;

    [[nodiscard]] static std::array<TerrainShape, BIOME_COUNT> defaultTerrain();

    bool operator==(const GeneratorConfig& other) const = default;
};

/// Apply the keys present in a parsed document on top of `base`.
/// Unknown keys and unparsable values are logged and skipped.
/// The result is validated (throws std::invalid_argument).
[[nodiscard]] GeneratorConfig applyConfigDocument(const ConfigDocument& doc,
                                                  GeneratorConfig base = {});

/// Load a config file over the defaults. nullopt if the file cannot be read.
[[nodiscard]] std::optional<GeneratorConfig> loadGeneratorConfig(const std::filesystem::path& path);

}  // namespace worldgen
}  // namespace voxelforge
