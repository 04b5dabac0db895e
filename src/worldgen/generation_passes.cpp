/**
 * @file generation_passes.cpp
 * @brief Standard generation pass implementations
 */

#include "voxelforge/worldgen/generation_passes.hpp"
#include "voxelforge/worldgen/feature_cactus.hpp"
#include "voxelforge/worldgen/feature_tree.hpp"

#include <algorithm>
#include <cmath>

namespace voxelforge::worldgen {

// ============================================================================
// TerrainPass
// ============================================================================

int32_t TerrainPass::terrainHeight(const GenerationContext& ctx, Biome biome,
                                   int64_t worldX, int64_t worldZ) {
    const TerrainShape& shape = ctx.config.terrainFor(biome);
    double n = ctx.noise.fractalNoise(
        static_cast<double>(worldX),
        static_cast<double>(worldZ),
        static_cast<double>(ctx.worldSeed),
        shape.fractal);
    return static_cast<int32_t>(std::floor(shape.base + shape.amplitude * n));
}

BlockType TerrainPass::fillBlock(int32_t y, int32_t height, Biome biome, int32_t topsoilDepth) {
    bool desert = biome == Biome::Desert;
    if (y > height) {
        return BlockType::Air;
    }
    if (y == height) {
        return desert ? BlockType::Sand : BlockType::Grass;
    }
    if (y > height - topsoilDepth) {
        return desert ? BlockType::Sand : BlockType::Dirt;
    }
    return BlockType::Stone;
}

void TerrainPass::generate(GenerationContext& ctx) const {
    for (int32_t lx = 0; lx < CHUNK_WIDTH; ++lx) {
        for (int32_t lz = 0; lz < CHUNK_DEPTH; ++lz) {
            int64_t wx = ctx.worldX(lx);
            int64_t wz = ctx.worldZ(lz);

            Biome biome = ctx.classifier.classify(wx, wz, ctx.worldSeed);
            int32_t height = terrainHeight(ctx, biome, wx, wz);

            int32_t idx = GenerationContext::hmIndex(lx, lz);
            ctx.heightmap[idx] = height;
            ctx.biomes[idx] = biome;

            for (int32_t y = 0; y < CHUNK_HEIGHT; ++y) {
                ctx.grid.set(lx, y, lz, fillBlock(y, height, biome, ctx.config.topsoilDepth));
            }
        }
    }
}

// ============================================================================
// CavePass
// ============================================================================

void CavePass::generate(GenerationContext& ctx) const {
    const CaveParams& caves = ctx.config.caves;
    double seed = ctx.seedWithOffset(caves.seedOffset);

    for (int32_t lx = 0; lx < CHUNK_WIDTH; ++lx) {
        double wx = static_cast<double>(ctx.worldX(lx)) * caves.scale;

        for (int32_t lz = 0; lz < CHUNK_DEPTH; ++lz) {
            double wz = static_cast<double>(ctx.worldZ(lz)) * caves.scale;

            // The top layer is never Stone after the terrain fill
            for (int32_t y = 0; y < CHUNK_HEIGHT - 1; ++y) {
                if (ctx.grid.get(lx, y, lz) != BlockType::Stone) continue;

                double density = ctx.noise.pointNoise(wx, static_cast<double>(y) * caves.scale, wz, seed);
                if (density > caves.threshold) {
                    ctx.grid.set(lx, y, lz, BlockType::Air);
                }
            }
        }
    }
}

// ============================================================================
// FeaturePass
// ============================================================================

FeaturePass::FeaturePass(const FeatureParams& params)
    : params_(params) {
    features_.push_back(std::make_unique<TreeFeature>(params.tree));
    features_.push_back(std::make_unique<CactusFeature>(params.cactus));
}

int32_t FeaturePass::maxFeatureHeight() const {
    int32_t tallest = 0;
    for (const auto& feature : features_) {
        tallest = std::max(tallest, feature->maxHeight());
    }
    return tallest;
}

void FeaturePass::generate(GenerationContext& ctx) const {
    double placementSeed = ctx.seedWithOffset(params_.seedOffset);
    double heightSeed = ctx.seedWithOffset(params_.heightSeedOffset);

    for (int32_t lx = 0; lx < CHUNK_WIDTH; ++lx) {
        for (int32_t lz = 0; lz < CHUNK_DEPTH; ++lz) {
            // Surface after carving; the heightmap still holds the terrain height
            int32_t surfaceY = ctx.grid.surfaceHeight(lx, lz);
            if (surfaceY < 0) continue;

            int64_t wx = ctx.worldX(lx);
            int64_t wz = ctx.worldZ(lz);
            double dwx = static_cast<double>(wx);
            double dwz = static_cast<double>(wz);

            FeaturePlacementContext placement{
                ctx.grid,
                LocalPos(lx, surfaceY, lz),
                wx,
                wz,
                ctx.classifier.classify(wx, wz, ctx.worldSeed),
                ctx.grid.get(lx, surfaceY, lz),
                ctx.noise.pointNoise(dwx, 0.0, dwz, placementSeed),
                ctx.noise.pointNoise(dwx, 1.0, dwz, heightSeed),
            };

            for (const auto& feature : features_) {
                if (feature->place(placement) == FeatureResult::Placed) {
                    break;
                }
            }
        }
    }
}

}  // namespace voxelforge::worldgen
