/**
 * @file generation_passes.hpp
 * @brief Standard generation passes: terrain, caves, features
 *
 * Each pass reads from and writes to GenerationContext. Callers can replace
 * any standard pass or insert custom passes at any priority level.
 *
 * The standard order is fixed by priority: terrain fill, then cave carving,
 * then surface features (which see the carved surface).
 */

#pragma once

#include "voxelforge/worldgen/feature.hpp"
#include "voxelforge/worldgen/generator_config.hpp"
#include "voxelforge/worldgen/world_generator.hpp"

#include <memory>
#include <vector>

namespace voxelforge::worldgen {

// ============================================================================
// TerrainPass: Fills each column from the biome's height field
// ============================================================================

class TerrainPass : public GenerationPass {
public:
    [[nodiscard]] std::string_view name() const override { return "core:terrain"; }
    [[nodiscard]] int32_t priority() const override {
        return static_cast<int32_t>(GenerationPriority::TerrainShape);
    }
    void generate(GenerationContext& ctx) const override;

    /// Terrain height of a world column for a given biome
    [[nodiscard]] static int32_t terrainHeight(const GenerationContext& ctx, Biome biome,
                                               int64_t worldX, int64_t worldZ);

    /// Block at height y in a column of the given terrain height
    [[nodiscard]] static BlockType fillBlock(int32_t y, int32_t height, Biome biome,
                                             int32_t topsoilDepth);
};

// ============================================================================
// CavePass: Turns Stone into Air where 3D noise exceeds a threshold
// ============================================================================

class CavePass : public GenerationPass {
public:
    [[nodiscard]] std::string_view name() const override { return "core:caves"; }
    [[nodiscard]] int32_t priority() const override {
        return static_cast<int32_t>(GenerationPriority::Carving);
    }
    void generate(GenerationContext& ctx) const override;
};

// ============================================================================
// FeaturePass: Places trees and cacti on the carved surface
// ============================================================================

class FeaturePass : public GenerationPass {
public:
    explicit FeaturePass(const FeatureParams& params);

    [[nodiscard]] std::string_view name() const override { return "core:features"; }
    [[nodiscard]] int32_t priority() const override {
        return static_cast<int32_t>(GenerationPriority::Structures);
    }
    void generate(GenerationContext& ctx) const override;

    /// Tallest structure any registered feature can place above a surface cell
    [[nodiscard]] int32_t maxFeatureHeight() const;

private:
    FeatureParams params_;
    std::vector<std::unique_ptr<Feature>> features_;
};

}  // namespace voxelforge::worldgen
