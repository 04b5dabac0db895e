/**
 * @file world_generator.cpp
 * @brief GenerationPipeline implementation
 */

#include "voxelforge/worldgen/world_generator.hpp"
#include "voxelforge/worldgen/generation_passes.hpp"

#include <algorithm>

namespace voxelforge::worldgen {

GenerationPipeline::GenerationPipeline(GeneratorConfig config)
    : config_(std::move(config))
    , noise_(config_.noise)
    , classifier_(noise_, config_.biomes) {
    config_.validate();
}

std::unique_ptr<GenerationPipeline> GenerationPipeline::createDefault(GeneratorConfig config) {
    auto pipeline = std::make_unique<GenerationPipeline>(std::move(config));
    pipeline->addPass(std::make_unique<TerrainPass>());
    pipeline->addPass(std::make_unique<CavePass>());
    pipeline->addPass(std::make_unique<FeaturePass>(pipeline->config().features));
    return pipeline;
}

void GenerationPipeline::addPass(std::unique_ptr<GenerationPass> pass) {
    if (!pass) return;
    passes_.push_back(std::move(pass));
    sortPasses();
}

bool GenerationPipeline::removePass(std::string_view name) {
    auto it = std::find_if(passes_.begin(), passes_.end(),
        [&](const auto& p) { return p->name() == name; });
    if (it == passes_.end()) return false;
    passes_.erase(it);
    return true;
}

bool GenerationPipeline::replacePass(std::unique_ptr<GenerationPass> pass) {
    if (!pass) return false;
    auto name = pass->name();
    auto it = std::find_if(passes_.begin(), passes_.end(),
        [&](const auto& p) { return p->name() == name; });
    if (it == passes_.end()) return false;
    *it = std::move(pass);
    sortPasses();
    return true;
}

VoxelGrid GenerationPipeline::generateChunk(ChunkCoord coord, int64_t worldSeed,
                                            const CancellationToken* cancel) const {
    VoxelGrid grid;
    GenerationContext ctx{
        grid,
        coord,
        worldSeed,
        config_,
        noise_,
        classifier_,
        cancel,
        {},  // heightmap
        {},  // biomes
    };

    for (const auto& pass : passes_) {
        ctx.checkCancelled();
        pass->generate(ctx);
    }
    ctx.checkCancelled();

    return grid;
}

GenerationPass* GenerationPipeline::getPass(std::string_view name) const {
    auto it = std::find_if(passes_.begin(), passes_.end(),
        [&](const auto& p) { return p->name() == name; });
    return (it != passes_.end()) ? it->get() : nullptr;
}

std::vector<std::string_view> GenerationPipeline::passNames() const {
    std::vector<std::string_view> names;
    names.reserve(passes_.size());
    for (const auto& pass : passes_) {
        names.push_back(pass->name());
    }
    return names;
}

void GenerationPipeline::sortPasses() {
    std::stable_sort(passes_.begin(), passes_.end(),
        [](const auto& a, const auto& b) {
            return a->priority() < b->priority();
        });
}

}  // namespace voxelforge::worldgen
