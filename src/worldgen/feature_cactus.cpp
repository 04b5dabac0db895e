#include "voxelforge/worldgen/feature_cactus.hpp"

#include <algorithm>
#include <cmath>

namespace voxelforge::worldgen {

CactusFeature::CactusFeature(CactusParams params)
    : params_(params) {}

FeatureResult CactusFeature::place(FeaturePlacementContext& ctx) const {
    if (ctx.biome != Biome::Desert || ctx.surfaceBlock != BlockType::Sand) {
        return FeatureResult::Skipped;
    }
    if (ctx.placementRoll <= params_.chance) {
        return FeatureResult::Skipped;
    }

    int32_t height = columnHeight(ctx.heightRoll);
    if (ctx.origin.y + height >= CHUNK_HEIGHT) {
        return FeatureResult::Skipped;
    }

    for (int32_t i = 1; i <= height; ++i) {
        ctx.grid.set(ctx.origin.x, ctx.origin.y + i, ctx.origin.z, BlockType::Cactus);
    }
    return FeatureResult::Placed;
}

int32_t CactusFeature::maxHeight() const {
    return params_.heightBase + std::max(params_.heightVariation - 1, 0);
}

int32_t CactusFeature::columnHeight(double heightRoll) const {
    return params_.heightBase +
           static_cast<int32_t>(std::floor(heightRoll * params_.heightVariation));
}

}  // namespace voxelforge::worldgen
