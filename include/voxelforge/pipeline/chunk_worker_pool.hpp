#pragma once

/**
 * @file chunk_worker_pool.hpp
 * @brief Worker threads that run chunk requests through a ChunkPipeline
 */

#include "voxelforge/core/cancellation.hpp"
#include "voxelforge/core/log.hpp"
#include "voxelforge/core/queue.hpp"
#include "voxelforge/pipeline/chunk_pipeline.hpp"

#include <atomic>
#include <cstdint>
#include <future>
#include <thread>
#include <vector>

namespace voxelforge {

/// Handle for one submitted request
struct ChunkTicket {
    std::future<ChunkResponse> result;   // Rethrows InvalidInputError / GenerationCancelled
    CancellationToken token;             // cancel() abandons the task
};

// Chunk worker thread pool
//
// Requests are queued FIFO and handed to the first free worker. Completion
// order across requests is not defined.
//
// Usage:
//   ChunkPipeline pipeline(config);
//   ChunkWorkerPool pool(pipeline, 4);  // 4 worker threads
//   pool.start();
//
//   auto ticket = pool.submit(GenerateRequest{0, 0, seed});
//   auto response = ticket.result.get();
//
//   pool.stop();  // finishes queued requests first
//
class ChunkWorkerPool {
public:
    // Create pool with specified number of worker threads
    // numThreads = 0 means use hardware concurrency - 1 (leave one for main thread)
    explicit ChunkWorkerPool(const ChunkPipeline& pipeline, size_t numThreads = 0);
    ~ChunkWorkerPool();

    // Non-copyable, non-movable (owns threads)
    ChunkWorkerPool(const ChunkWorkerPool&) = delete;
    ChunkWorkerPool& operator=(const ChunkWorkerPool&) = delete;
    ChunkWorkerPool(ChunkWorkerPool&&) = delete;
    ChunkWorkerPool& operator=(ChunkWorkerPool&&) = delete;

    // Start/stop worker threads. stop() runs everything already queued,
    // then joins. Requests still queued on a pool that never started fail
    // with GenerationCancelled.
    void start();
    void stop();
    [[nodiscard]] bool isRunning() const { return running_; }

    /// Queue a request. Throws std::runtime_error once the pool is stopped.
    [[nodiscard]] ChunkTicket submit(ChunkRequest request);

    /// Queue a request under a caller-owned token
    [[nodiscard]] ChunkTicket submit(ChunkRequest request, CancellationToken token);

    [[nodiscard]] size_t threadCount() const { return threadCount_; }
    [[nodiscard]] size_t pendingCount() const { return queue_.size(); }

    // Statistics
    struct Stats {
        std::atomic<uint64_t> completed{0};
        std::atomic<uint64_t> failed{0};
        std::atomic<uint64_t> cancelled{0};
    };
    [[nodiscard]] const Stats& stats() const { return stats_; }

private:
    struct Task {
        ChunkRequest request;
        CancellationToken token;
        std::promise<ChunkResponse> promise;
    };

    const ChunkPipeline& pipeline_;
    size_t threadCount_;

    Queue<Task> queue_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};

    Stats stats_;
    Logger log_{"ChunkWorkerPool"};

    void workerLoop();
    void runTask(Task& task);
};

}  // namespace voxelforge
