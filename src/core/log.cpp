#include "voxelforge/core/log.hpp"

#include <iostream>
#include <mutex>

namespace voxelforge {

namespace {

// Keeps lines from different worker threads from interleaving
std::mutex& outputMutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

void Logger::info(std::string_view message) const {
    std::lock_guard<std::mutex> lock(outputMutex());
    std::cout << "[" << tag_ << "] " << message << "\n";
}

void Logger::warn(std::string_view message) const {
    std::lock_guard<std::mutex> lock(outputMutex());
    std::cerr << "[" << tag_ << "] WARNING: " << message << "\n";
}

void Logger::error(std::string_view message) const {
    std::lock_guard<std::mutex> lock(outputMutex());
    std::cerr << "[" << tag_ << "] ERROR: " << message << "\n";
}

void Logger::debug(std::string_view message) const {
    if (!debugEnabled()) {
        return;
    }
    std::lock_guard<std::mutex> lock(outputMutex());
    std::cout << "[" << tag_ << "] DEBUG: " << message << "\n";
}

}  // namespace voxelforge
