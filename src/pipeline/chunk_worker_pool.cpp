#include "voxelforge/pipeline/chunk_worker_pool.hpp"
#include "voxelforge/core/errors.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>

namespace voxelforge {

ChunkWorkerPool::ChunkWorkerPool(const ChunkPipeline& pipeline, size_t numThreads)
    : pipeline_(pipeline)
    , threadCount_(numThreads)
{
    log_.setDebugEnabled(pipeline.debugLogging());
    if (threadCount_ == 0) {
        unsigned hardware = std::thread::hardware_concurrency();
        threadCount_ = std::max(1u, hardware > 0 ? hardware - 1 : 1u);
    }
}

ChunkWorkerPool::~ChunkWorkerPool() {
    stop();
}

void ChunkWorkerPool::start() {
    if (running_) {
        return;
    }

    queue_.resetShutdown();
    running_ = true;

    workers_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        workers_.emplace_back(&ChunkWorkerPool::workerLoop, this);
    }
    log_.debug("started " + std::to_string(threadCount_) + " workers");
}

void ChunkWorkerPool::stop() {
    // Refuse new work and wake all waiting workers; they drain the queue
    queue_.shutdown();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    // Only reachable when the pool was never started
    for (auto& task : queue_.drainAll()) {
        stats_.cancelled.fetch_add(1, std::memory_order_relaxed);
        task.promise.set_exception(std::make_exception_ptr(GenerationCancelled()));
    }

    if (running_.exchange(false)) {
        log_.debug("stopped");
    }
}

ChunkTicket ChunkWorkerPool::submit(ChunkRequest request) {
    return submit(std::move(request), CancellationToken());
}

ChunkTicket ChunkWorkerPool::submit(ChunkRequest request, CancellationToken token) {
    Task task{std::move(request), token, {}};
    ChunkTicket ticket{task.promise.get_future(), token};

    if (!queue_.push(std::move(task))) {
        throw std::runtime_error("ChunkWorkerPool: submit after stop");
    }
    return ticket;
}

void ChunkWorkerPool::workerLoop() {
    while (true) {
        if (auto task = queue_.tryPop()) {
            runTask(*task);
            continue;
        }
        if (!queue_.waitForWork()) {
            break;  // Shut down and drained
        }
    }
}

void ChunkWorkerPool::runTask(Task& task) {
    // Stats are updated before the promise is fulfilled
    if (task.token.isCancelled()) {
        stats_.cancelled.fetch_add(1, std::memory_order_relaxed);
        task.promise.set_exception(std::make_exception_ptr(GenerationCancelled()));
        return;
    }

    try {
        ChunkResponse response = pipeline_.process(std::move(task.request), &task.token);
        stats_.completed.fetch_add(1, std::memory_order_relaxed);
        task.promise.set_value(std::move(response));
    } catch (const GenerationCancelled&) {
        stats_.cancelled.fetch_add(1, std::memory_order_relaxed);
        task.promise.set_exception(std::current_exception());
    } catch (const std::exception& e) {
        log_.error(std::string("chunk task failed: ") + e.what());
        stats_.failed.fetch_add(1, std::memory_order_relaxed);
        task.promise.set_exception(std::current_exception());
    }
}

}  // namespace voxelforge
