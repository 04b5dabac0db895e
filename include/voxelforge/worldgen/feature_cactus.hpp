/**
 * @file feature_cactus.hpp
 * @brief Cactus column feature for desert sand
 */

#pragma once

#include "voxelforge/worldgen/feature.hpp"
#include "voxelforge/worldgen/generator_config.hpp"

namespace voxelforge::worldgen {

/// Single Cactus column on Desert columns whose surface is Sand
class CactusFeature : public Feature {
public:
    explicit CactusFeature(CactusParams params);

    [[nodiscard]] std::string_view name() const override { return "cactus"; }
    [[nodiscard]] FeatureResult place(FeaturePlacementContext& ctx) const override;
    [[nodiscard]] int32_t maxHeight() const override;

    [[nodiscard]] int32_t columnHeight(double heightRoll) const;

private:
    CactusParams params_;
};

}  // namespace voxelforge::worldgen
