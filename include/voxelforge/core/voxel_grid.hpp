#pragma once

/**
 * @file voxel_grid.hpp
 * @brief Dense block storage for one chunk
 *
 * Storage is a flat byte buffer of CHUNK_VOLUME entries laid out X-major,
 * then Z, then Y:
 *
 *   index(x, y, z) = y + z * CHUNK_HEIGHT + x * CHUNK_HEIGHT * CHUNK_DEPTH
 *
 * External consumers of the raw buffer (collision, persistence, remeshing)
 * rely on this exact layout.
 *
 * Access outside the grid is not an error: reads return Air and writes are
 * dropped. Generation code depends on this to clip features at the edges.
 */

#include "voxelforge/core/block_type.hpp"
#include "voxelforge/core/position.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace voxelforge {

class VoxelGrid {
public:
    /// All-Air grid
    VoxelGrid();

    /// Adopt an existing buffer. Throws InvalidInputError unless the buffer
    /// holds exactly CHUNK_VOLUME bytes.
    [[nodiscard]] static VoxelGrid fromBytes(std::vector<uint8_t> bytes);
    [[nodiscard]] static VoxelGrid fromBytes(std::span<const uint8_t> bytes);

    // Movable and copyable. Copies are explicit snapshots, not shared views.
    VoxelGrid(const VoxelGrid&) = default;
    VoxelGrid& operator=(const VoxelGrid&) = default;
    VoxelGrid(VoxelGrid&&) noexcept = default;
    VoxelGrid& operator=(VoxelGrid&&) noexcept = default;

    /// Linear offset of an in-bounds cell
    [[nodiscard]] static constexpr size_t index(int32_t x, int32_t y, int32_t z) {
        return static_cast<size_t>(y) +
               static_cast<size_t>(z) * CHUNK_HEIGHT +
               static_cast<size_t>(x) * CHUNK_HEIGHT * CHUNK_DEPTH;
    }

    [[nodiscard]] static constexpr bool inBounds(int32_t x, int32_t y, int32_t z) {
        return LocalPos(x, y, z).inBounds();
    }

    /// Raw byte at a cell, 0 (Air) outside the grid
    [[nodiscard]] uint8_t getRaw(int32_t x, int32_t y, int32_t z) const {
        if (!inBounds(x, y, z)) {
            return toByte(BlockType::Air);
        }
        return data_[index(x, y, z)];
    }

    [[nodiscard]] BlockType get(int32_t x, int32_t y, int32_t z) const {
        return static_cast<BlockType>(getRaw(x, y, z));
    }

    [[nodiscard]] BlockType get(const LocalPos& pos) const {
        return get(pos.x, pos.y, pos.z);
    }

    [[nodiscard]] bool isAir(int32_t x, int32_t y, int32_t z) const {
        return getRaw(x, y, z) == toByte(BlockType::Air);
    }

    /// Write a cell; silently ignored outside the grid
    void set(int32_t x, int32_t y, int32_t z, BlockType type) {
        if (!inBounds(x, y, z)) {
            return;
        }
        data_[index(x, y, z)] = toByte(type);
    }

    void set(const LocalPos& pos, BlockType type) {
        set(pos.x, pos.y, pos.z, type);
    }

    /// Highest non-Air cell in a column, -1 if the column is entirely Air
    [[nodiscard]] int32_t surfaceHeight(int32_t x, int32_t z) const;

    /// Number of cells holding the given type
    [[nodiscard]] size_t count(BlockType type) const;

    /// Raw buffer in the documented layout
    [[nodiscard]] std::span<const uint8_t> bytes() const { return data_; }

    /// Move the buffer out, leaving this grid empty (size 0) until reassigned
    [[nodiscard]] std::vector<uint8_t> release() && { return std::move(data_); }

    bool operator==(const VoxelGrid& other) const = default;

private:
    explicit VoxelGrid(std::vector<uint8_t> data) : data_(std::move(data)) {}

    std::vector<uint8_t> data_;
};

}  // namespace voxelforge
