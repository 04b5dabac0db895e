#include <gtest/gtest.h>
#include "voxelforge/core/errors.hpp"
#include "voxelforge/worldgen/generation_passes.hpp"
#include "voxelforge/worldgen/world_generator.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <vector>

using namespace voxelforge;
using namespace voxelforge::worldgen;

// ============================================================================
// Test fixtures
// ============================================================================

class GenerationTest : public ::testing::Test {
protected:
    std::unique_ptr<GenerationPipeline> pipeline = GenerationPipeline::createDefault();

    static std::array<size_t, BLOCK_TYPE_COUNT> blockCounts(const VoxelGrid& grid) {
        std::array<size_t, BLOCK_TYPE_COUNT> counts{};
        for (uint8_t b : grid.bytes()) {
            if (b < BLOCK_TYPE_COUNT) counts[b]++;
        }
        return counts;
    }

    static std::vector<BlockType> column(const VoxelGrid& grid, int32_t x, int32_t z,
                                         int32_t fromY, int32_t toY) {
        std::vector<BlockType> result;
        for (int32_t y = fromY; y <= toY; ++y) {
            result.push_back(grid.get(x, y, z));
        }
        return result;
    }
};

class CustomPass : public GenerationPass {
public:
    CustomPass(std::string name, int32_t prio, std::vector<std::string>* log = nullptr)
        : name_(std::move(name)), priority_(prio), log_(log) {}

    std::string_view name() const override { return name_; }
    int32_t priority() const override { return priority_; }
    void generate(GenerationContext&) const override {
        if (log_) log_->push_back(name_);
    }

private:
    std::string name_;
    int32_t priority_;
    std::vector<std::string>* log_;
};

// ============================================================================
// GenerationPipeline structure
// ============================================================================

TEST_F(GenerationTest, DefaultPipelinePassOrder) {
    auto names = pipeline->passNames();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "core:terrain");
    EXPECT_EQ(names[1], "core:caves");
    EXPECT_EQ(names[2], "core:features");
}

TEST_F(GenerationTest, PipelineAddAndCount) {
    GenerationPipeline empty;
    EXPECT_EQ(empty.passCount(), 0u);

    empty.addPass(std::make_unique<CustomPass>("a", 1000));
    empty.addPass(std::make_unique<CustomPass>("b", 2000));
    empty.addPass(nullptr);
    EXPECT_EQ(empty.passCount(), 2u);
}

TEST_F(GenerationTest, PipelineRunsInPriorityOrder) {
    GenerationPipeline custom;
    std::vector<std::string> order;

    custom.addPass(std::make_unique<CustomPass>("late", 5000, &order));
    custom.addPass(std::make_unique<CustomPass>("early", 1000, &order));
    custom.addPass(std::make_unique<CustomPass>("middle", 3000, &order));
    custom.addPass(std::make_unique<CustomPass>("middle2", 3000, &order));

    (void)custom.generateChunk(ChunkCoord(0, 0), 0);
    ASSERT_EQ(order.size(), 4u);
    EXPECT_EQ(order[0], "early");
    EXPECT_EQ(order[1], "middle");
    EXPECT_EQ(order[2], "middle2");
    EXPECT_EQ(order[3], "late");
}

TEST_F(GenerationTest, PipelineRemovePass) {
    EXPECT_TRUE(pipeline->removePass("core:caves"));
    EXPECT_EQ(pipeline->passCount(), 2u);
    EXPECT_EQ(pipeline->getPass("core:caves"), nullptr);
    EXPECT_NE(pipeline->getPass("core:terrain"), nullptr);

    EXPECT_FALSE(pipeline->removePass("nonexistent"));
}

TEST_F(GenerationTest, PipelineReplacePass) {
    std::vector<std::string> log;
    EXPECT_TRUE(pipeline->replacePass(std::make_unique<CustomPass>("core:features", 500, &log)));
    EXPECT_EQ(pipeline->passCount(), 3u);

    // Replacement re-sorts: the new pass now runs before terrain
    EXPECT_EQ(pipeline->passNames().front(), "core:features");

    auto grid = pipeline->generateChunk(ChunkCoord(0, 0), 0);
    EXPECT_EQ(log.size(), 1u);
    EXPECT_EQ(grid.count(BlockType::Log), 0u);
    EXPECT_EQ(grid.count(BlockType::Cactus), 0u);

    EXPECT_FALSE(pipeline->replacePass(std::make_unique<CustomPass>("unknown", 1)));
}

TEST_F(GenerationTest, InvalidConfigRejected) {
    GeneratorConfig config;
    config.biomes.desertBelow = 0.9;
    config.biomes.forestFrom = 0.1;
    EXPECT_THROW(GenerationPipeline{config}, std::invalid_argument);
}

// ============================================================================
// Known chunks
// ============================================================================

TEST_F(GenerationTest, OriginChunkSeedZero) {
    auto grid = pipeline->generateChunk(ChunkCoord(0, 0), 0);

    auto counts = blockCounts(grid);
    EXPECT_EQ(counts[toByte(BlockType::Air)], 18346u);
    EXPECT_EQ(counts[toByte(BlockType::Dirt)], 600u);
    EXPECT_EQ(counts[toByte(BlockType::Grass)], 200u);
    EXPECT_EQ(counts[toByte(BlockType::Stone)], 13332u);
    EXPECT_EQ(counts[toByte(BlockType::Sand)], 224u);
    EXPECT_EQ(counts[toByte(BlockType::Log)], 10u);
    EXPECT_EQ(counts[toByte(BlockType::Leaves)], 54u);
    EXPECT_EQ(counts[toByte(BlockType::Cactus)], 2u);
}

TEST_F(GenerationTest, OriginChunkTreeColumn) {
    auto grid = pipeline->generateChunk(ChunkCoord(0, 0), 0);

    // Grass at 80, five logs, leaves capping the trunk
    std::vector<BlockType> expected = {
        BlockType::Dirt, BlockType::Dirt, BlockType::Grass,
        BlockType::Log, BlockType::Log, BlockType::Log, BlockType::Log, BlockType::Log,
        BlockType::Leaves, BlockType::Leaves, BlockType::Air, BlockType::Air,
    };
    EXPECT_EQ(column(grid, 5, 6, 78, 89), expected);

    EXPECT_EQ(grid.get(12, 81, 13), BlockType::Grass);
    EXPECT_EQ(grid.get(12, 86, 13), BlockType::Log);
    EXPECT_EQ(grid.get(12, 87, 13), BlockType::Leaves);
}

TEST_F(GenerationTest, OriginChunkCactusColumn) {
    auto grid = pipeline->generateChunk(ChunkCoord(0, 0), 0);

    std::vector<BlockType> expected = {
        BlockType::Sand, BlockType::Sand, BlockType::Sand,
        BlockType::Cactus, BlockType::Cactus, BlockType::Air,
    };
    EXPECT_EQ(column(grid, 11, 2, 62, 67), expected);
}

TEST_F(GenerationTest, OriginColumnIsCarvedDesert) {
    auto grid = pipeline->generateChunk(ChunkCoord(0, 0), 0);

    // Desert column of height 60 with a cave cell below the topsoil
    std::vector<BlockType> expected = {
        BlockType::Air, BlockType::Stone,
        BlockType::Sand, BlockType::Sand, BlockType::Sand, BlockType::Sand,
        BlockType::Air,
    };
    EXPECT_EQ(column(grid, 0, 0, 55, 61), expected);
}

TEST_F(GenerationTest, NegativeChunkSeed42) {
    auto grid = pipeline->generateChunk(ChunkCoord(-1, 3), 42);

    auto counts = blockCounts(grid);
    std::array<size_t, BLOCK_TYPE_COUNT> expected = {18295, 621, 207, 13376, 196, 11, 60, 2};
    EXPECT_EQ(counts, expected);

    // Trees at (9,11) with a 6-high trunk and (11,7) with 5
    EXPECT_EQ(grid.get(9, 87, 11), BlockType::Grass);
    EXPECT_EQ(grid.get(9, 93, 11), BlockType::Log);
    EXPECT_EQ(grid.get(9, 94, 11), BlockType::Leaves);
    EXPECT_EQ(grid.get(11, 93, 7), BlockType::Log);

    EXPECT_EQ(grid.get(10, 62, 1), BlockType::Sand);
    EXPECT_EQ(grid.get(10, 63, 1), BlockType::Cactus);
    EXPECT_EQ(grid.get(10, 64, 1), BlockType::Cactus);
    EXPECT_EQ(grid.get(10, 65, 1), BlockType::Air);
}

TEST_F(GenerationTest, FarChunkCoordinates) {
    // World X of this chunk is beyond the int32 range
    auto grid = pipeline->generateChunk(ChunkCoord(200000000, 0), 0);

    auto counts = blockCounts(grid);
    std::array<size_t, BLOCK_TYPE_COUNT> expected = {18274, 588, 196, 13363, 240, 15, 90, 2};
    EXPECT_EQ(counts, expected);

    auto mirrored = pipeline->generateChunk(ChunkCoord(-200000000, 0), 0);
    EXPECT_NE(mirrored, grid);
}

// ============================================================================
// Invariants
// ============================================================================

TEST_F(GenerationTest, GenerationIsDeterministic) {
    auto a = pipeline->generateChunk(ChunkCoord(7, -2), 1234);
    auto b = pipeline->generateChunk(ChunkCoord(7, -2), 1234);
    EXPECT_EQ(a, b);

    auto other = GenerationPipeline::createDefault();
    EXPECT_EQ(other->generateChunk(ChunkCoord(7, -2), 1234), a);
}

TEST_F(GenerationTest, SeedsAndCoordsMatter) {
    auto base = pipeline->generateChunk(ChunkCoord(0, 0), 0);
    EXPECT_NE(pipeline->generateChunk(ChunkCoord(0, 0), 1), base);
    EXPECT_NE(pipeline->generateChunk(ChunkCoord(1, 0), 0), base);
}

TEST_F(GenerationTest, OnlyKnownBlockTypes) {
    for (int32_t cx = -2; cx <= 2; cx += 2) {
        auto grid = pipeline->generateChunk(ChunkCoord(cx, -cx), 77);
        for (uint8_t b : grid.bytes()) {
            EXPECT_TRUE(isKnownBlockType(b));
        }
        for (int32_t x = 0; x < CHUNK_WIDTH; ++x) {
            for (int32_t z = 0; z < CHUNK_DEPTH; ++z) {
                EXPECT_EQ(grid.get(x, CHUNK_HEIGHT - 1, z), BlockType::Air);
            }
        }
    }
}

TEST_F(GenerationTest, CavesOnlyRemoveStone) {
    GenerationPipeline terrainOnly;
    terrainOnly.addPass(std::make_unique<TerrainPass>());

    GenerationPipeline carved;
    carved.addPass(std::make_unique<TerrainPass>());
    carved.addPass(std::make_unique<CavePass>());

    for (int64_t seed : {0, 42}) {
        auto before = terrainOnly.generateChunk(ChunkCoord(2, -1), seed);
        auto after = carved.generateChunk(ChunkCoord(2, -1), seed);

        size_t removed = 0;
        auto b = before.bytes();
        auto a = after.bytes();
        for (size_t i = 0; i < CHUNK_VOLUME; ++i) {
            if (a[i] != b[i]) {
                EXPECT_EQ(b[i], toByte(BlockType::Stone));
                EXPECT_EQ(a[i], toByte(BlockType::Air));
                ++removed;
            }
        }
        EXPECT_GT(removed, 0u);
    }
}

TEST_F(GenerationTest, FeaturesStayNearTerrainSurface) {
    GenerationPipeline terrainOnly;
    terrainOnly.addPass(std::make_unique<TerrainPass>());

    const auto* features = dynamic_cast<const FeaturePass*>(pipeline->getPass("core:features"));
    ASSERT_NE(features, nullptr);
    int32_t reach = features->maxFeatureHeight();
    EXPECT_EQ(reach, 8);

    ChunkCoord coord(0, 0);
    auto terrain = terrainOnly.generateChunk(coord, 0);
    auto full = pipeline->generateChunk(coord, 0);

    // Canopies overhang neighbors, so compare against the tallest nearby column
    int32_t radius = pipeline->config().features.tree.canopyRadius;
    for (int32_t x = 0; x < CHUNK_WIDTH; ++x) {
        for (int32_t z = 0; z < CHUNK_DEPTH; ++z) {
            int32_t terrainTop = -1;
            for (int32_t dx = -radius; dx <= radius; ++dx) {
                for (int32_t dz = -radius; dz <= radius; ++dz) {
                    terrainTop = std::max(terrainTop, terrain.surfaceHeight(x + dx, z + dz));
                }
            }
            int32_t top = full.surfaceHeight(x, z);
            EXPECT_LE(top, terrainTop + reach) << "column " << x << "," << z;
        }
    }
}

TEST_F(GenerationTest, TerrainFillRules) {
    EXPECT_EQ(TerrainPass::fillBlock(70, 64, Biome::Plains, 4), BlockType::Air);
    EXPECT_EQ(TerrainPass::fillBlock(64, 64, Biome::Plains, 4), BlockType::Grass);
    EXPECT_EQ(TerrainPass::fillBlock(61, 64, Biome::Forest, 4), BlockType::Dirt);
    EXPECT_EQ(TerrainPass::fillBlock(60, 64, Biome::Forest, 4), BlockType::Stone);
    EXPECT_EQ(TerrainPass::fillBlock(64, 64, Biome::Desert, 4), BlockType::Sand);
    EXPECT_EQ(TerrainPass::fillBlock(61, 64, Biome::Desert, 4), BlockType::Sand);
    EXPECT_EQ(TerrainPass::fillBlock(60, 64, Biome::Desert, 4), BlockType::Stone);
}

TEST_F(GenerationTest, HeightmapRecordsTerrainHeights) {
    class HeightProbe : public GenerationPass {
    public:
        explicit HeightProbe(std::array<int32_t, COLUMN_COUNT>& out,
                             std::array<Biome, COLUMN_COUNT>& biomes)
            : out_(out), biomes_(biomes) {}
        std::string_view name() const override { return "test:probe"; }
        int32_t priority() const override { return 2000; }
        void generate(GenerationContext& ctx) const override {
            out_ = ctx.heightmap;
            biomes_ = ctx.biomes;
        }
    private:
        std::array<int32_t, COLUMN_COUNT>& out_;
        std::array<Biome, COLUMN_COUNT>& biomes_;
    };

    std::array<int32_t, COLUMN_COUNT> heights{};
    std::array<Biome, COLUMN_COUNT> biomes{};
    pipeline->addPass(std::make_unique<HeightProbe>(heights, biomes));
    (void)pipeline->generateChunk(ChunkCoord(0, 0), 0);

    EXPECT_EQ(heights[GenerationContext::hmIndex(0, 0)], 60);
    EXPECT_EQ(biomes[GenerationContext::hmIndex(0, 0)], Biome::Desert);
    EXPECT_EQ(heights[GenerationContext::hmIndex(5, 6)], 80);
    EXPECT_EQ(biomes[GenerationContext::hmIndex(5, 6)], Biome::Forest);
    EXPECT_EQ(heights[GenerationContext::hmIndex(15, 15)], 74);
    EXPECT_EQ(biomes[GenerationContext::hmIndex(15, 15)], Biome::Plains);
}

TEST_F(GenerationTest, CancelledTokenStopsGeneration) {
    CancellationToken token;
    token.cancel();
    EXPECT_THROW((void)pipeline->generateChunk(ChunkCoord(0, 0), 0, &token), GenerationCancelled);

    CancellationToken live;
    auto grid = pipeline->generateChunk(ChunkCoord(0, 0), 0, &live);
    EXPECT_EQ(grid.count(BlockType::Log), 10u);
}
