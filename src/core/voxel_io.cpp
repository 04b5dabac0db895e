/**
 * @file voxel_io.cpp
 * @brief VXFG encode/decode and file I/O
 */

#include "voxelforge/core/voxel_io.hpp"
#include "voxelforge/core/errors.hpp"

#include <lz4.h>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace voxelforge {

namespace {

void writeU32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

uint32_t readU32(std::span<const uint8_t> data, size_t offset) {
    return static_cast<uint32_t>(data[offset]) |
           (static_cast<uint32_t>(data[offset + 1]) << 8) |
           (static_cast<uint32_t>(data[offset + 2]) << 16) |
           (static_cast<uint32_t>(data[offset + 3]) << 24);
}

}  // namespace

std::vector<uint8_t> compressVoxelGrid(const VoxelGrid& grid) {
    auto raw = grid.bytes();

    int maxCompressed = LZ4_compressBound(static_cast<int>(raw.size()));
    std::vector<uint8_t> out;
    out.reserve(VOXEL_FILE_HEADER_SIZE + static_cast<size_t>(maxCompressed));

    writeU32(out, VOXEL_FILE_MAGIC);
    writeU32(out, static_cast<uint32_t>(raw.size()));
    writeU32(out, 0);  // Compressed size, patched below

    out.resize(VOXEL_FILE_HEADER_SIZE + static_cast<size_t>(maxCompressed));
    int compressedSize = LZ4_compress_default(
        reinterpret_cast<const char*>(raw.data()),
        reinterpret_cast<char*>(out.data() + VOXEL_FILE_HEADER_SIZE),
        static_cast<int>(raw.size()),
        maxCompressed);

    if (compressedSize <= 0) {
        throw std::runtime_error("LZ4 compression failed");
    }

    out.resize(VOXEL_FILE_HEADER_SIZE + static_cast<size_t>(compressedSize));
    for (size_t i = 0; i < 4; ++i) {
        out[8 + i] = static_cast<uint8_t>((static_cast<uint32_t>(compressedSize) >> (8 * i)) & 0xFF);
    }
    return out;
}

VoxelGrid decompressVoxelGrid(std::span<const uint8_t> data) {
    if (data.size() < VOXEL_FILE_HEADER_SIZE) {
        throw InvalidInputError("voxel data too small");
    }
    if (readU32(data, 0) != VOXEL_FILE_MAGIC) {
        throw InvalidInputError("invalid voxel data magic");
    }

    uint32_t uncompressedSize = readU32(data, 4);
    uint32_t compressedSize = readU32(data, 8);

    if (uncompressedSize != CHUNK_VOLUME) {
        throw InvalidInputError("voxel data holds " + std::to_string(uncompressedSize) +
                                " bytes, expected " + std::to_string(CHUNK_VOLUME));
    }
    if (compressedSize != data.size() - VOXEL_FILE_HEADER_SIZE) {
        throw InvalidInputError("voxel data truncated");
    }

    std::vector<uint8_t> raw(uncompressedSize);
    int result = LZ4_decompress_safe(
        reinterpret_cast<const char*>(data.data() + VOXEL_FILE_HEADER_SIZE),
        reinterpret_cast<char*>(raw.data()),
        static_cast<int>(compressedSize),
        static_cast<int>(uncompressedSize));

    if (result != static_cast<int>(uncompressedSize)) {
        throw InvalidInputError("LZ4 decompression failed");
    }

    return VoxelGrid::fromBytes(std::move(raw));
}

void saveVoxelGrid(const VoxelGrid& grid, const std::filesystem::path& path) {
    auto encoded = compressVoxelGrid(grid);

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }

    file.write(reinterpret_cast<const char*>(encoded.data()),
               static_cast<std::streamsize>(encoded.size()));
    if (!file) {
        throw std::runtime_error("Failed to write voxel file: " + path.string());
    }
}

VoxelGrid loadVoxelGrid(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open voxel file: " + path.string());
    }

    std::vector<uint8_t> encoded((std::istreambuf_iterator<char>(file)),
                                 std::istreambuf_iterator<char>());
    return decompressVoxelGrid(encoded);
}

}  // namespace voxelforge
