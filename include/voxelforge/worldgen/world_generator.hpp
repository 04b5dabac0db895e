/**
 * @file world_generator.hpp
 * @brief Generation pipeline: passes, context, and pipeline orchestration
 *
 * The generation pipeline runs an ordered sequence of GenerationPasses over
 * a fresh VoxelGrid. Each pass reads/writes a shared GenerationContext.
 * Callers add, replace, or remove passes to customize world generation.
 *
 * Passes are const: all per-chunk state lives in the context, so one
 * pipeline may generate many chunks concurrently.
 */

#pragma once

#include "voxelforge/core/cancellation.hpp"
#include "voxelforge/core/position.hpp"
#include "voxelforge/core/voxel_grid.hpp"
#include "voxelforge/worldgen/biome.hpp"
#include "voxelforge/worldgen/generator_config.hpp"
#include "voxelforge/worldgen/noise.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace voxelforge::worldgen {

// ============================================================================
// GenerationPriority
// ============================================================================

/// Standard priority levels for generation passes
enum class GenerationPriority : int32_t {
    TerrainShape   = 1000,
    Carving        = 3000,
    Structures     = 5000,
};

// ============================================================================
// GenerationContext
// ============================================================================

constexpr size_t COLUMN_COUNT = static_cast<size_t>(CHUNK_WIDTH) * CHUNK_DEPTH;

/// Shared mutable context passed through all passes for one chunk
struct GenerationContext {
    VoxelGrid& grid;
    ChunkCoord coord;
    int64_t worldSeed;
    const GeneratorConfig& config;
    const NoiseField& noise;
    const BiomeClassifier& classifier;
    const CancellationToken* cancel = nullptr;

    /// Terrain height per (localX * 16 + localZ), populated by TerrainPass.
    /// Records the height before carving; caves may lower the real surface.
    std::array<int32_t, COLUMN_COUNT> heightmap{};

    /// Biome per (localX * 16 + localZ), populated by TerrainPass
    std::array<Biome, COLUMN_COUNT> biomes{};

    /// Heightmap index from local coords
    [[nodiscard]] static constexpr int32_t hmIndex(int32_t localX, int32_t localZ) {
        return localX * CHUNK_DEPTH + localZ;
    }

    [[nodiscard]] int64_t worldX(int32_t localX) const { return coord.worldOriginX() + localX; }
    [[nodiscard]] int64_t worldZ(int32_t localZ) const { return coord.worldOriginZ() + localZ; }

    /// Seed passed to the noise hash for a given stream offset
    [[nodiscard]] double seedWithOffset(double offset) const {
        return static_cast<double>(worldSeed) + offset;
    }

    void checkCancelled() const { throwIfCancelled(cancel); }
};

// ============================================================================
// GenerationPass
// ============================================================================

/// Abstract base for a single generation pass
class GenerationPass {
public:
    virtual ~GenerationPass() = default;

    /// Unique name for this pass (e.g., "core:terrain")
    [[nodiscard]] virtual std::string_view name() const = 0;

    /// Priority determines execution order (lower runs first)
    [[nodiscard]] virtual int32_t priority() const = 0;

    /// Execute this pass on the given context
    virtual void generate(GenerationContext& ctx) const = 0;
};

// ============================================================================
// GenerationPipeline
// ============================================================================

/// Orchestrates ordered generation passes over chunk grids
class GenerationPipeline {
public:
    explicit GenerationPipeline(GeneratorConfig config = {});

    // The classifier refers to noise_, so the pipeline stays in place
    GenerationPipeline(const GenerationPipeline&) = delete;
    GenerationPipeline& operator=(const GenerationPipeline&) = delete;

    /// Pipeline with the standard terrain, cave and feature passes
    [[nodiscard]] static std::unique_ptr<GenerationPipeline> createDefault(GeneratorConfig config = {});

    /// Add a pass (sorted by priority on insertion)
    void addPass(std::unique_ptr<GenerationPass> pass);

    /// Remove a pass by name (returns true if found)
    bool removePass(std::string_view name);

    /// Replace a pass with the same name (returns true if found and replaced)
    bool replacePass(std::unique_ptr<GenerationPass> pass);

    /// Generate one chunk by running all passes in priority order.
    /// Throws GenerationCancelled if the token fires between passes.
    [[nodiscard]] VoxelGrid generateChunk(ChunkCoord coord, int64_t worldSeed,
                                          const CancellationToken* cancel = nullptr) const;

    /// Number of registered passes
    [[nodiscard]] size_t passCount() const { return passes_.size(); }

    /// Get pass by name
    [[nodiscard]] GenerationPass* getPass(std::string_view name) const;

    /// Pass names in execution order
    [[nodiscard]] std::vector<std::string_view> passNames() const;

    [[nodiscard]] const GeneratorConfig& config() const { return config_; }
    [[nodiscard]] const NoiseField& noise() const { return noise_; }
    [[nodiscard]] const BiomeClassifier& classifier() const { return classifier_; }

private:
    GeneratorConfig config_;
    NoiseField noise_;
    BiomeClassifier classifier_;
    std::vector<std::unique_ptr<GenerationPass>> passes_;

    void sortPasses();
};

}  // namespace voxelforge::worldgen
