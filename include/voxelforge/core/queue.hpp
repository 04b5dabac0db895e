#pragma once

/**
 * @file queue.hpp
 * @brief Thread-safe FIFO queue with blocking wait and shutdown
 *
 * Single-queue producer/consumer primitive used to hand chunk tasks to
 * worker threads.
 *
 * Usage:
 *   Queue<Task> queue;
 *
 *   // Worker:
 *   while (true) {
 *       if (auto task = queue.tryPop()) {
 *           run(*task);
 *           continue;
 *       }
 *       if (!queue.waitForWork()) break;  // shutdown and drained
 *   }
 *
 * After shutdown() the queue refuses new items but tryPop() keeps handing
 * out what was already queued, so workers drain before exiting.
 *
 * @tparam T Type of items in the queue (must be movable)
 */

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace voxelforge {

template<typename T>
class Queue {
public:
    Queue() = default;
    ~Queue() = default;

    // Non-copyable, non-movable (owns mutex/condition_variable)
    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;
    Queue(Queue&&) = delete;
    Queue& operator=(Queue&&) = delete;

    // ========================================================================
    // Push operations
    // ========================================================================

    /**
     * @brief Push an item to the back of the queue
     *
     * Wakes one thread blocked in waitForWork().
     *
     * @return false if the queue is shut down; the item is not queued
     */
    bool push(T&& item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdownFlag_) return false;
            queue_.push_back(std::move(item));
        }
        condition_.notify_one();
        return true;
    }

    bool push(const T& item) {
        T copy(item);
        return push(std::move(copy));
    }

    // ========================================================================
    // Pop operations
    // ========================================================================

    /**
     * @brief Try to pop the front element (non-blocking)
     *
     * @return The front item if available, nullopt if empty
     */
    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    /**
     * @brief Drain all items at once (non-blocking)
     */
    std::vector<T> drainAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> result;
        result.reserve(queue_.size());
        while (!queue_.empty()) {
            result.push_back(std::move(queue_.front()));
            queue_.pop_front();
        }
        return result;
    }

    // ========================================================================
    // Wait operations
    // ========================================================================

    /**
     * @brief Block until an item is available or shutdown
     *
     * Does NOT pop - caller should use tryPop() after waking.
     *
     * @return true if items are available, false once shut down and empty
     */
    bool waitForWork() {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait(lock, [this] { return shutdownFlag_ || !queue_.empty(); });
        return !queue_.empty();
    }

    // ========================================================================
    // Shutdown support
    // ========================================================================

    /**
     * @brief Refuse new items and wake all waiting threads
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdownFlag_ = true;
        }
        condition_.notify_all();
    }

    [[nodiscard]] bool isShutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdownFlag_;
    }

    /**
     * @brief Reset shutdown state (allows reuse)
     */
    void resetShutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdownFlag_ = false;
    }

    // ========================================================================
    // Query operations
    // ========================================================================

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    bool shutdownFlag_ = false;

    std::deque<T> queue_;
};

}  // namespace voxelforge
