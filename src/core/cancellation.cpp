#include "voxelforge/core/cancellation.hpp"
#include "voxelforge/core/errors.hpp"

namespace voxelforge {

void throwIfCancelled(const CancellationToken* token) {
    if (token && token->isCancelled()) {
        throw GenerationCancelled();
    }
}

}  // namespace voxelforge
