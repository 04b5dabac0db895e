#pragma once

/**
 * @file cancellation.hpp
 * @brief Shared cancellation flag for in-flight chunk tasks
 *
 * Copies share one flag: the submitter keeps a copy and cancels, the worker
 * polls its copy at safe points and abandons the task.
 *
 * Usage:
 *   CancellationToken token;
 *   auto ticket = pool.submit(request, token);
 *   ...
 *   token.cancel();  // result future now fails with GenerationCancelled
 */

#include <atomic>
#include <memory>

namespace voxelforge {

class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool isCancelled() const {
        return flag_->load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/// Throws GenerationCancelled if a token is present and has fired
void throwIfCancelled(const CancellationToken* token);

}  // namespace voxelforge
