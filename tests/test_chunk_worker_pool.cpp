#include <gtest/gtest.h>
#include "voxelforge/core/errors.hpp"
#include "voxelforge/pipeline/chunk_worker_pool.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace voxelforge;

class ChunkWorkerPoolTest : public ::testing::Test {
protected:
    ChunkPipeline pipeline;

    static RemeshRequest singleBlock() {
        std::vector<uint8_t> buffer(CHUNK_VOLUME, 0);
        buffer[VoxelGrid::index(8, 8, 8)] = toByte(BlockType::Stone);
        return RemeshRequest{std::move(buffer)};
    }
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(ChunkWorkerPoolTest, Construction) {
    ChunkWorkerPool pool(pipeline, 2);
    EXPECT_FALSE(pool.isRunning());
    EXPECT_EQ(pool.threadCount(), 2u);
    EXPECT_EQ(pool.pendingCount(), 0u);
}

TEST_F(ChunkWorkerPoolTest, DefaultThreadCount) {
    ChunkWorkerPool pool(pipeline);
    EXPECT_GE(pool.threadCount(), 1u);
}

TEST_F(ChunkWorkerPoolTest, StartAndStop) {
    ChunkWorkerPool pool(pipeline, 2);
    pool.start();
    EXPECT_TRUE(pool.isRunning());

    pool.start();  // no-op while running
    EXPECT_TRUE(pool.isRunning());

    pool.stop();
    EXPECT_FALSE(pool.isRunning());
}

TEST_F(ChunkWorkerPoolTest, RestartAfterStop) {
    ChunkWorkerPool pool(pipeline, 1);
    pool.start();
    pool.stop();
    pool.start();

    auto ticket = pool.submit(singleBlock());
    auto response = ticket.result.get();
    EXPECT_EQ(std::get<RemeshResult>(response).mesh.faceCount(), 6u);
}

// ============================================================================
// Request processing
// ============================================================================

TEST_F(ChunkWorkerPoolTest, GenerateThroughPool) {
    ChunkWorkerPool pool(pipeline, 2);
    pool.start();

    auto ticket = pool.submit(GenerateRequest{0, 0, 0});
    auto response = ticket.result.get();

    ASSERT_TRUE(std::holds_alternative<GenerateResult>(response));
    const auto& result = std::get<GenerateResult>(response);
    EXPECT_EQ(result.mesh.faceCount(), 26602u);
    EXPECT_EQ(result.voxels.count(BlockType::Cactus), 2u);

    pool.stop();
    EXPECT_EQ(pool.stats().completed.load(), 1u);
}

TEST_F(ChunkWorkerPoolTest, ManyRequestsMatchDirectCalls) {
    ChunkWorkerPool pool(pipeline, 4);
    pool.start();

    std::vector<GenerateRequest> requests;
    for (int32_t x = -2; x <= 2; ++x) {
        requests.push_back(GenerateRequest{x, 1 - x, 5});
    }

    std::vector<ChunkTicket> tickets;
    for (const auto& request : requests) {
        tickets.push_back(pool.submit(request));
    }

    for (size_t i = 0; i < requests.size(); ++i) {
        auto response = tickets[i].result.get();
        auto direct = pipeline.generate(requests[i]);
        const auto& pooled = std::get<GenerateResult>(response);
        EXPECT_EQ(pooled.voxels, direct.voxels);
        EXPECT_EQ(pooled.mesh, direct.mesh);
    }

    pool.stop();
    EXPECT_EQ(pool.stats().completed.load(), requests.size());
    EXPECT_EQ(pool.stats().failed.load(), 0u);
}

TEST_F(ChunkWorkerPoolTest, InvalidRemeshFails) {
    ChunkWorkerPool pool(pipeline, 1);
    pool.start();

    auto ticket = pool.submit(RemeshRequest{std::vector<uint8_t>(10)});
    EXPECT_THROW(ticket.result.get(), InvalidInputError);

    pool.stop();
    EXPECT_EQ(pool.stats().failed.load(), 1u);
    EXPECT_EQ(pool.stats().completed.load(), 0u);
}

TEST_F(ChunkWorkerPoolTest, StopFinishesQueuedWork) {
    ChunkWorkerPool pool(pipeline, 1);
    pool.start();

    std::vector<ChunkTicket> tickets;
    for (int i = 0; i < 5; ++i) {
        tickets.push_back(pool.submit(singleBlock()));
    }
    pool.stop();

    for (auto& ticket : tickets) {
        auto response = ticket.result.get();
        EXPECT_EQ(std::get<RemeshResult>(response).mesh.faceCount(), 6u);
    }
    EXPECT_EQ(pool.stats().completed.load(), 5u);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(ChunkWorkerPoolTest, CancelBeforeRun) {
    ChunkWorkerPool pool(pipeline, 1);

    auto ticket = pool.submit(GenerateRequest{0, 0, 0});
    ticket.token.cancel();
    pool.start();

    EXPECT_THROW(ticket.result.get(), GenerationCancelled);
    pool.stop();
    EXPECT_EQ(pool.stats().cancelled.load(), 1u);
    EXPECT_EQ(pool.stats().completed.load(), 0u);
}

TEST_F(ChunkWorkerPoolTest, CallerOwnedToken) {
    ChunkWorkerPool pool(pipeline, 1);

    CancellationToken token;
    auto cancelled = pool.submit(GenerateRequest{1, 1, 1}, token);
    auto live = pool.submit(singleBlock());
    token.cancel();
    pool.start();

    EXPECT_THROW(cancelled.result.get(), GenerationCancelled);
    EXPECT_NO_THROW(live.result.get());
}

TEST_F(ChunkWorkerPoolTest, StopWithoutStartCancelsQueued) {
    ChunkWorkerPool pool(pipeline, 2);
    auto ticket = pool.submit(singleBlock());
    EXPECT_EQ(pool.pendingCount(), 1u);

    pool.stop();
    EXPECT_THROW(ticket.result.get(), GenerationCancelled);
    EXPECT_EQ(pool.stats().cancelled.load(), 1u);
}

TEST_F(ChunkWorkerPoolTest, SubmitAfterStopThrows) {
    ChunkWorkerPool pool(pipeline, 1);
    pool.start();
    pool.stop();

    EXPECT_THROW((void)pool.submit(singleBlock()), std::runtime_error);
}

// ============================================================================
// Logging
// ============================================================================

TEST_F(ChunkWorkerPoolTest, FollowsPipelineDebugSetting) {
    worldgen::GeneratorConfig verbose;
    verbose.debugLogging = true;
    ChunkPipeline loud(verbose);

    testing::internal::CaptureStdout();
    {
        ChunkWorkerPool pool(loud, 1);
        pool.start();
        pool.stop();
    }
    std::cout.flush();
    EXPECT_NE(testing::internal::GetCapturedStdout().find("[ChunkWorkerPool] DEBUG: started 1 workers"),
              std::string::npos);

    testing::internal::CaptureStdout();
    {
        ChunkWorkerPool pool(pipeline, 1);
        pool.start();
        pool.stop();
    }
    std::cout.flush();
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "");
}
