#include "voxelforge/core/block_type.hpp"

namespace voxelforge {

namespace {

constexpr std::array<std::string_view, BLOCK_TYPE_COUNT> BLOCK_NAMES = {
    "air", "dirt", "grass", "stone", "sand", "log", "leaves", "cactus"
};

}  // namespace

std::string_view blockTypeName(BlockType type) {
    auto raw = toByte(type);
    if (!isKnownBlockType(raw)) {
        return "unknown";
    }
    return BLOCK_NAMES[raw];
}

std::optional<BlockType> blockTypeFromName(std::string_view name) {
    for (size_t i = 0; i < BLOCK_NAMES.size(); ++i) {
        if (BLOCK_NAMES[i] == name) {
            return static_cast<BlockType>(i);
        }
    }
    return std::nullopt;
}

MaterialPalette MaterialPalette::standard() {
    MaterialPalette palette;
    palette.set(BlockType::Dirt, Material::fromHex(0x8B5A2B));
    palette.set(BlockType::Grass, Material::fromHex(0x4CAF50));
    palette.set(BlockType::Stone, Material::fromHex(0x9E9E9E));
    palette.set(BlockType::Sand, Material::fromHex(0xF4A460));
    palette.set(BlockType::Log, Material::fromHex(0x663300));
    palette.set(BlockType::Leaves, Material::fromHex(0x006400));
    palette.set(BlockType::Cactus, Material::fromHex(0x228B22));
    return palette;
}

}  // namespace voxelforge
