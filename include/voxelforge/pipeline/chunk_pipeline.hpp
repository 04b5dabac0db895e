#pragma once

/**
 * @file chunk_pipeline.hpp
 * @brief Task boundary: one chunk request in, one buffer set out
 *
 * Two request shapes exist:
 *   GenerateRequest  (chunkX, chunkZ, seed) -> voxels + mesh
 *   RemeshRequest    (voxel buffer)         -> mesh only
 *
 * A ChunkPipeline holds only immutable state (config, passes, palette), so
 * any number of threads may call it at once. Every call builds its own
 * grid and buffers and shares nothing with other calls.
 */

#include "voxelforge/core/cancellation.hpp"
#include "voxelforge/core/log.hpp"
#include "voxelforge/core/mesh.hpp"
#include "voxelforge/core/position.hpp"
#include "voxelforge/core/voxel_grid.hpp"
#include "voxelforge/worldgen/generator_config.hpp"
#include "voxelforge/worldgen/world_generator.hpp"

#include <cstdint>
#include <memory>
#include <variant>
#include <vector>

namespace voxelforge {

// ============================================================================
// Requests and responses
// ============================================================================

struct GenerateRequest {
    int32_t chunkX = 0;
    int32_t chunkZ = 0;
    int64_t seed = 0;

    [[nodiscard]] ChunkCoord coord() const { return {chunkX, chunkZ}; }
};

struct RemeshRequest {
    std::vector<uint8_t> voxelBuffer;   // Must hold exactly CHUNK_VOLUME bytes
};

using ChunkRequest = std::variant<GenerateRequest, RemeshRequest>;

struct GenerateResult {
    VoxelGrid voxels;
    MeshBuffers mesh;
};

struct RemeshResult {
    MeshBuffers mesh;
};

using ChunkResponse = std::variant<GenerateResult, RemeshResult>;

// ============================================================================
// ChunkPipeline
// ============================================================================

class ChunkPipeline {
public:
    /// Validates the config (throws std::invalid_argument)
    explicit ChunkPipeline(worldgen::GeneratorConfig config = {});

    /// Terrain, caves, features, then mesh
    [[nodiscard]] GenerateResult generate(const GenerateRequest& request,
                                          const CancellationToken* cancel = nullptr) const;

    /// Mesh a caller-supplied grid. Throws InvalidInputError if the buffer
    /// is not exactly CHUNK_VOLUME bytes.
    [[nodiscard]] RemeshResult remesh(RemeshRequest request,
                                      const CancellationToken* cancel = nullptr) const;

    /// Dispatch on the request shape
    [[nodiscard]] ChunkResponse process(ChunkRequest request,
                                        const CancellationToken* cancel = nullptr) const;

    [[nodiscard]] const worldgen::GeneratorConfig& config() const { return generator_->config(); }
    [[nodiscard]] const worldgen::GenerationPipeline& generator() const { return *generator_; }
    [[nodiscard]] const MeshBuilder& mesher() const { return mesher_; }

    /// Timing lines for this pipeline only (GeneratorConfig::debugLogging)
    [[nodiscard]] bool debugLogging() const { return log_.debugEnabled(); }

private:
    std::unique_ptr<worldgen::GenerationPipeline> generator_;
    MeshBuilder mesher_;
    Logger log_{"ChunkPipeline"};
};

}  // namespace voxelforge
