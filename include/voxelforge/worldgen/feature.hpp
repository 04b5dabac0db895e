/**
 * @file feature.hpp
 * @brief Feature interface for surface decorations
 *
 * Features are small multi-block structures (trees, cacti) placed on top of
 * the carved terrain. Each Feature decides from the placement context
 * whether it belongs on a column and writes itself into the grid.
 *
 * Features never coordinate across chunks. Anything that would reach past
 * the grid is either suppressed by the feature's own rules or clipped by
 * the grid's out-of-range write policy.
 */

#pragma once

#include "voxelforge/core/block_type.hpp"
#include "voxelforge/core/position.hpp"
#include "voxelforge/core/voxel_grid.hpp"
#include "voxelforge/worldgen/biome.hpp"

#include <cstdint>
#include <string_view>

namespace voxelforge::worldgen {

// ============================================================================
// FeatureResult
// ============================================================================

/// Outcome of a feature placement attempt
enum class FeatureResult {
    Placed,     ///< Feature was written into the grid
    Skipped     ///< Conditions not met (biome, surface, roll, margin, height)
};

// ============================================================================
// FeaturePlacementContext
// ============================================================================

/// Everything a feature needs to decide and place itself on one column
struct FeaturePlacementContext {
    VoxelGrid& grid;
    LocalPos origin;            ///< Surface cell (highest non-Air cell of the column)
    int64_t worldX;
    int64_t worldZ;
    Biome biome;
    BlockType surfaceBlock;
    double placementRoll;       ///< Per-column roll in [0, 1); features fire above a chance
    double heightRoll;          ///< Per-column roll in [0, 1) for structure height
};

// ============================================================================
// Feature Interface
// ============================================================================

/// Abstract base for all surface features
class Feature {
public:
    virtual ~Feature() = default;

    /// Name of this feature type (e.g., "tree", "cactus")
    [[nodiscard]] virtual std::string_view name() const = 0;

    /// Attempt to place this feature at the given context
    [[nodiscard]] virtual FeatureResult place(FeaturePlacementContext& ctx) const = 0;

    /// Highest cell this feature can write, relative to the surface cell
    [[nodiscard]] virtual int32_t maxHeight() const = 0;
};

}  // namespace voxelforge::worldgen
