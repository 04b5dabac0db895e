#pragma once

/**
 * @file log.hpp
 * @brief Tagged console logging
 *
 * Each component owns a Logger with a short tag. Info goes to stdout,
 * warnings and errors to stderr, debug lines only when that logger's debug
 * switch is on:
 *
 *   [ChunkWorkerPool] started 3 workers
 *   [config] WARNING: unknown key 'terain.desert.base'
 */

#include <string>
#include <string_view>
#include <utility>

namespace voxelforge {

class Logger {
public:
    explicit Logger(std::string tag, bool enableDebug = false)
        : tag_(std::move(tag)), debugEnabled_(enableDebug) {}

    void info(std::string_view message) const;
    void warn(std::string_view message) const;
    void error(std::string_view message) const;

    /// No-op unless debug logging is enabled
    void debug(std::string_view message) const;

    [[nodiscard]] const std::string& tag() const { return tag_; }

    // Set before the logger is shared between threads
    void setDebugEnabled(bool enabled) { debugEnabled_ = enabled; }
    [[nodiscard]] bool debugEnabled() const { return debugEnabled_; }

private:
    std::string tag_;
    bool debugEnabled_ = false;
};

}  // namespace voxelforge
