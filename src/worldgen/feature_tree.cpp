/**
 * @file feature_tree.cpp
 * @brief Tree feature implementation
 */

#include "voxelforge/worldgen/feature_tree.hpp"

#include <algorithm>
#include <cmath>

namespace voxelforge::worldgen {

TreeFeature::TreeFeature(TreeParams params)
    : params_(params) {}

FeatureResult TreeFeature::place(FeaturePlacementContext& ctx) const {
    if (ctx.biome != Biome::Forest || ctx.surfaceBlock != BlockType::Grass) {
        return FeatureResult::Skipped;
    }
    if (ctx.placementRoll <= params_.chance || !withinMargin(ctx.origin)) {
        return FeatureResult::Skipped;
    }

    int32_t height = trunkHeight(ctx.heightRoll);

    // Whole tree, canopy included, must fit under the ceiling
    if (ctx.origin.y + height + params_.canopyRadius >= CHUNK_HEIGHT) {
        return FeatureResult::Skipped;
    }

    for (int32_t i = 1; i <= height; ++i) {
        ctx.grid.set(ctx.origin.x, ctx.origin.y + i, ctx.origin.z, BlockType::Log);
    }

    placeCanopy(ctx.grid, LocalPos(ctx.origin.x, ctx.origin.y + height, ctx.origin.z));
    return FeatureResult::Placed;
}

int32_t TreeFeature::maxHeight() const {
    // heightRoll < 1, so the variation term never reaches trunkVariation
    int32_t tallestTrunk = params_.trunkBase + std::max(params_.trunkVariation - 1, 0);
    return tallestTrunk + params_.canopyRadius;
}

int32_t TreeFeature::trunkHeight(double heightRoll) const {
    return params_.trunkBase +
           static_cast<int32_t>(std::floor(heightRoll * params_.trunkVariation));
}

bool TreeFeature::withinMargin(const LocalPos& origin) const {
    int32_t m = params_.edgeMargin;
    return origin.x >= m && origin.x <= CHUNK_WIDTH - m &&
           origin.z >= m && origin.z <= CHUNK_DEPTH - m;
}

void TreeFeature::placeCanopy(VoxelGrid& grid, const LocalPos& center) const {
    int32_t r = params_.canopyRadius;

    for (int32_t dy = -r; dy <= r; ++dy) {
        for (int32_t dx = -r; dx <= r; ++dx) {
            for (int32_t dz = -r; dz <= r; ++dz) {
                if (dx * dx + dy * dy + dz * dz > r * r) continue;

                int32_t x = center.x + dx;
                int32_t y = center.y + dy;
                int32_t z = center.z + dz;

                // Never replace the trunk, earlier leaves or terrain
                if (grid.isAir(x, y, z)) {
                    grid.set(x, y, z, BlockType::Leaves);
                }
            }
        }
    }
}

}  // namespace voxelforge::worldgen
