#include "voxelforge/pipeline/chunk_pipeline.hpp"
#include "voxelforge/core/errors.hpp"

#include <chrono>
#include <string>

namespace voxelforge {

namespace {

double elapsedMs(std::chrono::steady_clock::time_point start) {
    auto elapsed = std::chrono::steady_clock::now() - start;
    return std::chrono::duration<double, std::milli>(elapsed).count();
}

}  // namespace

ChunkPipeline::ChunkPipeline(worldgen::GeneratorConfig config)
    : generator_(worldgen::GenerationPipeline::createDefault(std::move(config)))
    , mesher_(generator_->config().materials) {
    log_.setDebugEnabled(generator_->config().debugLogging);
}

GenerateResult ChunkPipeline::generate(const GenerateRequest& request,
                                       const CancellationToken* cancel) const {
    auto start = std::chrono::steady_clock::now();

    GenerateResult result;
    result.voxels = generator_->generateChunk(request.coord(), request.seed, cancel);
    result.mesh = mesher_.buildChunkMesh(result.voxels, cancel);

    if (log_.debugEnabled()) {
        log_.debug("generated chunk " + request.coord().storageKey() +
                   " seed " + std::to_string(request.seed) + ": " +
                   std::to_string(result.mesh.faceCount()) + " faces in " +
                   std::to_string(elapsedMs(start)) + " ms");
    }
    return result;
}

RemeshResult ChunkPipeline::remesh(RemeshRequest request, const CancellationToken* cancel) const {
    if (request.voxelBuffer.size() != CHUNK_VOLUME) {
        log_.warn("rejecting remesh request: buffer has " +
                  std::to_string(request.voxelBuffer.size()) + " bytes, expected " +
                  std::to_string(CHUNK_VOLUME));
    }

    // Throws InvalidInputError on a length mismatch
    VoxelGrid grid = VoxelGrid::fromBytes(std::move(request.voxelBuffer));

    auto start = std::chrono::steady_clock::now();
    RemeshResult result{mesher_.buildChunkMesh(grid, cancel)};

    if (log_.debugEnabled()) {
        log_.debug("remeshed " + std::to_string(result.mesh.faceCount()) + " faces in " +
                   std::to_string(elapsedMs(start)) + " ms");
    }
    return result;
}

ChunkResponse ChunkPipeline::process(ChunkRequest request, const CancellationToken* cancel) const {
    if (auto* generateRequest = std::get_if<GenerateRequest>(&request)) {
        return generate(*generateRequest, cancel);
    }
    return remesh(std::move(std::get<RemeshRequest>(request)), cancel);
}

}  // namespace voxelforge
