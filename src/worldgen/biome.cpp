#include "voxelforge/worldgen/biome.hpp"

namespace voxelforge::worldgen {

std::string_view biomeName(Biome biome) {
    switch (biome) {
        case Biome::Plains: return "plains";
        case Biome::Desert: return "desert";
        case Biome::Forest: return "forest";
    }
    return "unknown";
}

std::optional<Biome> biomeFromName(std::string_view name) {
    for (Biome biome : ALL_BIOMES) {
        if (biomeName(biome) == name) {
            return biome;
        }
    }
    return std::nullopt;
}

double BiomeClassifier::fieldValue(int64_t worldX, int64_t worldZ, int64_t seed) const {
    return noise_.fractalNoise(
        static_cast<double>(worldX),
        static_cast<double>(worldZ),
        static_cast<double>(seed) + params_.seedOffset,
        params_.fractal);
}

Biome BiomeClassifier::classify(int64_t worldX, int64_t worldZ, int64_t seed) const {
    double n = fieldValue(worldX, worldZ, seed);
    if (n < params_.desertBelow) {
        return Biome::Desert;
    }
    if (n < params_.forestFrom) {
        return Biome::Plains;
    }
    return Biome::Forest;
}

}  // namespace voxelforge::worldgen
