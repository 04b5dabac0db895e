/**
 * @file feature_tree.hpp
 * @brief Tree feature for forest grass
 */

#pragma once

#include "voxelforge/worldgen/feature.hpp"
#include "voxelforge/worldgen/generator_config.hpp"

namespace voxelforge::worldgen {

/// Log trunk with a ball-shaped Leaves canopy centered on the trunk top.
///
/// Only placed on Forest columns whose surface is Grass, away from the
/// chunk edges so the canopy never needs neighbor data. Leaves only fill
/// Air; the trunk is written unconditionally.
class TreeFeature : public Feature {
public:
    explicit TreeFeature(TreeParams params);

    [[nodiscard]] std::string_view name() const override { return "tree"; }
    [[nodiscard]] FeatureResult place(FeaturePlacementContext& ctx) const override;
    [[nodiscard]] int32_t maxHeight() const override;

    /// Deterministic trunk height from the column's height roll
    [[nodiscard]] int32_t trunkHeight(double heightRoll) const;

    [[nodiscard]] const TreeParams& params() const { return params_; }

private:
    TreeParams params_;

    [[nodiscard]] bool withinMargin(const LocalPos& origin) const;
    void placeCanopy(VoxelGrid& grid, const LocalPos& center) const;
};

}  // namespace voxelforge::worldgen
