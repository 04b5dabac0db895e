#pragma once

/**
 * @file errors.hpp
 * @brief Exception types reported across the chunk task boundary
 */

#include <stdexcept>
#include <string>

namespace voxelforge {

/// Caller supplied data the pipeline cannot accept (e.g. a voxel buffer of
/// the wrong length). Thrown before any output is produced.
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what) : std::invalid_argument(what) {}
};

/// The caller's cancellation token fired while a chunk task was running.
class GenerationCancelled : public std::runtime_error {
public:
    GenerationCancelled() : std::runtime_error("chunk task cancelled") {}
};

}  // namespace voxelforge
