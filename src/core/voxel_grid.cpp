#include "voxelforge/core/voxel_grid.hpp"
#include "voxelforge/core/errors.hpp"

#include <algorithm>
#include <string>

namespace voxelforge {

VoxelGrid::VoxelGrid()
    : data_(CHUNK_VOLUME, toByte(BlockType::Air)) {}

VoxelGrid VoxelGrid::fromBytes(std::vector<uint8_t> bytes) {
    if (bytes.size() != CHUNK_VOLUME) {
        throw InvalidInputError("voxel buffer must be " + std::to_string(CHUNK_VOLUME) +
                                " bytes, got " + std::to_string(bytes.size()));
    }
    return VoxelGrid(std::move(bytes));
}

VoxelGrid VoxelGrid::fromBytes(std::span<const uint8_t> bytes) {
    return fromBytes(std::vector<uint8_t>(bytes.begin(), bytes.end()));
}

int32_t VoxelGrid::surfaceHeight(int32_t x, int32_t z) const {
    if (!inBounds(x, 0, z)) {
        return -1;
    }
    for (int32_t y = CHUNK_HEIGHT - 1; y >= 0; --y) {
        if (data_[index(x, y, z)] != toByte(BlockType::Air)) {
            return y;
        }
    }
    return -1;
}

size_t VoxelGrid::count(BlockType type) const {
    return static_cast<size_t>(std::count(data_.begin(), data_.end(), toByte(type)));
}

}  // namespace voxelforge
