#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace voxelforge {

// Chunk extents. These are part of the voxel buffer contract with external
// consumers (collision, persistence) and are never configurable.
constexpr int32_t CHUNK_WIDTH = 16;    // X
constexpr int32_t CHUNK_HEIGHT = 128;  // Y
constexpr int32_t CHUNK_DEPTH = 16;    // Z
constexpr size_t CHUNK_VOLUME =
    static_cast<size_t>(CHUNK_WIDTH) * CHUNK_HEIGHT * CHUNK_DEPTH;

// Face enumeration for block faces and directions
enum class Face : uint8_t {
    NegX = 0,  // West  (-X)
    PosX = 1,  // East  (+X)
    NegY = 2,  // Down  (-Y)
    PosY = 3,  // Up    (+Y)
    NegZ = 4,  // North (-Z)
    PosZ = 5,  // South (+Z)
};

constexpr size_t FACE_COUNT = 6;

// Get the opposite face
constexpr Face oppositeFace(Face f) {
    return static_cast<Face>(static_cast<uint8_t>(f) ^ 1);
}

// Get face normal as integer offsets
constexpr std::array<int32_t, 3> faceNormal(Face f) {
    constexpr std::array<std::array<int32_t, 3>, 6> normals = {{
        {-1, 0, 0},  // NegX
        { 1, 0, 0},  // PosX
        { 0,-1, 0},  // NegY
        { 0, 1, 0},  // PosY
        { 0, 0,-1},  // NegZ
        { 0, 0, 1},  // PosZ
    }};
    return normals[static_cast<size_t>(f)];
}

// Floor division, so that -1 / 16 == -1 rather than 0
constexpr int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

// ============================================================================
// LocalPos - Cell position within a chunk
// ============================================================================
//
// Not range-restricted: generation code routinely computes positions that
// fall outside the chunk (tree canopies near the edge) and relies on the
// grid dropping them. Use inBounds() when the distinction matters.
//
struct LocalPos {
    int32_t x = 0;
    int32_t y = 0;
    int32_t z = 0;

    constexpr LocalPos() = default;
    constexpr LocalPos(int32_t x_, int32_t y_, int32_t z_) : x(x_), y(y_), z(z_) {}

    [[nodiscard]] constexpr bool inBounds() const {
        return x >= 0 && x < CHUNK_WIDTH &&
               y >= 0 && y < CHUNK_HEIGHT &&
               z >= 0 && z < CHUNK_DEPTH;
    }

    [[nodiscard]] constexpr LocalPos neighbor(Face face) const {
        auto n = faceNormal(face);
        return {x + n[0], y + n[1], z + n[2]};
    }

    constexpr bool operator==(const LocalPos& other) const = default;
};

// ============================================================================
// ChunkCoord - Horizontal chunk position (chunks span the full height)
// ============================================================================
struct ChunkCoord {
    int32_t x = 0;
    int32_t z = 0;

    constexpr ChunkCoord() = default;
    constexpr ChunkCoord(int32_t x_, int32_t z_) : x(x_), z(z_) {}

    // Chunk containing a world column. Negative coordinates round toward
    // negative infinity: world x = -1 belongs to chunk -1.
    [[nodiscard]] static constexpr ChunkCoord fromWorld(int64_t worldX, int64_t worldZ) {
        return {static_cast<int32_t>(floorDiv(worldX, CHUNK_WIDTH)),
                static_cast<int32_t>(floorDiv(worldZ, CHUNK_DEPTH))};
    }

    // World X/Z of local cell (0, 0). World columns span 16x the chunk
    // range, so they are 64-bit.
    [[nodiscard]] constexpr int64_t worldOriginX() const { return static_cast<int64_t>(x) * CHUNK_WIDTH; }
    [[nodiscard]] constexpr int64_t worldOriginZ() const { return static_cast<int64_t>(z) * CHUNK_DEPTH; }

    // Local cell of a world position inside this chunk (may be out of bounds
    // if the position belongs to another chunk)
    [[nodiscard]] constexpr LocalPos toLocal(int64_t worldX, int32_t worldY, int64_t worldZ) const {
        return {static_cast<int32_t>(worldX - worldOriginX()), worldY,
                static_cast<int32_t>(worldZ - worldOriginZ())};
    }

    // Storage key used by external chunk stores: "x_z"
    [[nodiscard]] std::string storageKey() const {
        return std::to_string(x) + "_" + std::to_string(z);
    }

    constexpr bool operator==(const ChunkCoord& other) const = default;
    constexpr auto operator<=>(const ChunkCoord& other) const = default;
};

}  // namespace voxelforge

template<>
struct std::hash<voxelforge::ChunkCoord> {
    size_t operator()(const voxelforge::ChunkCoord& pos) const noexcept {
        uint64_t packed = (static_cast<uint64_t>(static_cast<uint32_t>(pos.x)) << 32) |
                          static_cast<uint32_t>(pos.z);
        return std::hash<uint64_t>{}(packed);
    }
};
