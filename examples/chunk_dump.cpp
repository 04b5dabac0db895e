/**
 * @file chunk_dump.cpp
 * @brief Generate chunks on worker threads and print what came out
 *
 * Usage:
 *   chunk_dump [--seed N] [--chunk X Z]... [--radius R] [--config FILE]
 *              [--threads N] [--save DIR] [--verbose]
 *
 * --radius R generates the (2R+1)^2 square of chunks around each --chunk
 * (or around 0,0 when no chunk is given). --save writes each voxel buffer
 * as DIR/<x>_<z>.vxfg.
 */

#include "voxelforge/core/voxel_io.hpp"
#include "voxelforge/pipeline/chunk_pipeline.hpp"
#include "voxelforge/pipeline/chunk_worker_pool.hpp"
#include "voxelforge/worldgen/generator_config.hpp"

#include <array>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using namespace voxelforge;

namespace {

void printUsage() {
    std::cout << "Usage: chunk_dump [--seed N] [--chunk X Z]... [--radius R]\n"
              << "                  [--config FILE] [--threads N] [--save DIR] [--verbose]\n";
}

bool parseInt(const char* text, int64_t& out) {
    char* end = nullptr;
    long long value = std::strtoll(text, &end, 10);
    if (end == text || *end != '\0') return false;
    out = value;
    return true;
}

void printChunk(const ChunkCoord& coord, const GenerateResult& result,
                const worldgen::BiomeClassifier& classifier, int64_t seed) {
    std::array<int, worldgen::BIOME_COUNT> biomeColumns{};
    for (int32_t lx = 0; lx < CHUNK_WIDTH; ++lx) {
        for (int32_t lz = 0; lz < CHUNK_DEPTH; ++lz) {
            auto biome = classifier.classify(coord.worldOriginX() + lx, coord.worldOriginZ() + lz, seed);
            ++biomeColumns[static_cast<size_t>(biome)];
        }
    }

    std::cout << "Chunk " << coord.storageKey() << "\n";
    std::cout << "  Biomes:";
    for (auto biome : worldgen::ALL_BIOMES) {
        std::cout << " " << worldgen::biomeName(biome) << "=" << biomeColumns[static_cast<size_t>(biome)];
    }
    std::cout << "\n";

    std::cout << "  Mesh: " << result.mesh.faceCount() << " faces, "
              << result.mesh.vertexCount() << " vertices, "
              << std::fixed << std::setprecision(1)
              << (static_cast<double>(result.mesh.memoryUsage()) / 1024.0) << " KiB\n";

    std::cout << "  Blocks:";
    for (uint8_t raw = 0; raw < BLOCK_TYPE_COUNT; ++raw) {
        auto type = static_cast<BlockType>(raw);
        std::cout << " " << blockTypeName(type) << "=" << result.voxels.count(type);
    }
    std::cout << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse command line
    int64_t seed = 0;
    int64_t radius = 0;
    int64_t threads = 0;
    std::vector<ChunkCoord> centers;
    std::optional<std::filesystem::path> configPath;
    std::optional<std::filesystem::path> saveDir;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        int64_t x = 0;
        int64_t z = 0;

        if (arg == "--seed" && i + 1 < argc && parseInt(argv[i + 1], seed)) {
            ++i;
        } else if (arg == "--chunk" && i + 2 < argc &&
                   parseInt(argv[i + 1], x) && parseInt(argv[i + 2], z)) {
            centers.emplace_back(static_cast<int32_t>(x), static_cast<int32_t>(z));
            i += 2;
        } else if (arg == "--radius" && i + 1 < argc && parseInt(argv[i + 1], radius) && radius >= 0) {
            ++i;
        } else if (arg == "--threads" && i + 1 < argc && parseInt(argv[i + 1], threads) && threads >= 0) {
            ++i;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--save" && i + 1 < argc) {
            saveDir = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Unrecognized argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (centers.empty()) {
        centers.emplace_back(0, 0);
    }

    try {
        worldgen::GeneratorConfig config;
        if (configPath) {
            auto loaded = worldgen::loadGeneratorConfig(*configPath);
            if (!loaded) {
                return 1;
            }
            config = *loaded;
        }
        if (verbose) {
            config.debugLogging = true;
        }

        ChunkPipeline pipeline(config);
        ChunkWorkerPool pool(pipeline, static_cast<size_t>(threads));
        pool.start();

        std::vector<std::pair<ChunkCoord, ChunkTicket>> tickets;
        for (const auto& center : centers) {
            int32_t r = static_cast<int32_t>(radius);
            for (int32_t dx = -r; dx <= r; ++dx) {
                for (int32_t dz = -r; dz <= r; ++dz) {
                    ChunkCoord coord(center.x + dx, center.z + dz);
                    tickets.emplace_back(coord, pool.submit(GenerateRequest{coord.x, coord.z, seed}));
                }
            }
        }

        if (saveDir) {
            std::filesystem::create_directories(*saveDir);
        }

        for (auto& [coord, ticket] : tickets) {
            auto response = ticket.result.get();
            const auto& result = std::get<GenerateResult>(response);

            printChunk(coord, result, pipeline.generator().classifier(), seed);

            if (saveDir) {
                auto path = *saveDir / (coord.storageKey() + ".vxfg");
                saveVoxelGrid(result.voxels, path);
                std::cout << "  Saved " << path.string() << "\n";
            }
        }

        pool.stop();

        const auto& stats = pool.stats();
        std::cout << "Done: " << stats.completed.load() << " completed, "
                  << stats.failed.load() << " failed on "
                  << pool.threadCount() << " threads\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
