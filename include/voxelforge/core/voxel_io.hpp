#pragma once

/**
 * @file voxel_io.hpp
 * @brief LZ4-compressed voxel buffer format
 *
 * Format: magic "VXFG" (4 bytes) + uncompressed size (4 bytes LE)
 * + compressed size (4 bytes LE) + LZ4 block of the raw grid bytes.
 *
 * The payload is the grid buffer in its documented layout, so a decoded
 * buffer can be fed straight into a RemeshRequest. Chunk stores name files
 * by ChunkCoord::storageKey().
 */

#include "voxelforge/core/voxel_grid.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace voxelforge {

constexpr uint32_t VOXEL_FILE_MAGIC = 0x47465856;  // "VXFG"
constexpr size_t VOXEL_FILE_HEADER_SIZE = 12;

/// Compress a grid into the VXFG format
[[nodiscard]] std::vector<uint8_t> compressVoxelGrid(const VoxelGrid& grid);

/// Decode a VXFG buffer. Throws InvalidInputError for a bad magic, truncated
/// data, or a payload that is not exactly one chunk.
[[nodiscard]] VoxelGrid decompressVoxelGrid(std::span<const uint8_t> data);

/// Write/read a VXFG file. I/O failures throw std::runtime_error.
void saveVoxelGrid(const VoxelGrid& grid, const std::filesystem::path& path);
[[nodiscard]] VoxelGrid loadVoxelGrid(const std::filesystem::path& path);

}  // namespace voxelforge
