#pragma once

/**
 * @file block_type.hpp
 * @brief Block type enumeration and per-type material colors
 *
 * Block types are stored as one byte per voxel. Air is always 0 and is the
 * universal empty value: anything that is not Air is solid for culling.
 */

#include <glm/glm.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace voxelforge {

// ============================================================================
// BlockType
// ============================================================================

enum class BlockType : uint8_t {
    Air = 0,
    Dirt = 1,
    Grass = 2,
    Stone = 3,
    Sand = 4,
    Log = 5,
    Leaves = 6,
    Cactus = 7,
};

constexpr size_t BLOCK_TYPE_COUNT = 8;

/// True if a raw voxel byte is one of the known block types
[[nodiscard]] constexpr bool isKnownBlockType(uint8_t raw) {
    return raw < BLOCK_TYPE_COUNT;
}

[[nodiscard]] constexpr uint8_t toByte(BlockType type) {
    return static_cast<uint8_t>(type);
}

/// Lower-case name ("air", "grass", ...), "unknown" for out-of-range values
[[nodiscard]] std::string_view blockTypeName(BlockType type);

/// Reverse of blockTypeName(); nullopt if the name is not a block type
[[nodiscard]] std::optional<BlockType> blockTypeFromName(std::string_view name);

// ============================================================================
// Material - color of a block type
// ============================================================================

struct Material {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    /// Build from a packed 0xRRGGBB value
    [[nodiscard]] static constexpr Material fromHex(uint32_t rgb) {
        return Material{
            static_cast<uint8_t>((rgb >> 16) & 0xFF),
            static_cast<uint8_t>((rgb >> 8) & 0xFF),
            static_cast<uint8_t>(rgb & 0xFF)
        };
    }

    [[nodiscard]] constexpr uint32_t toHex() const {
        return (static_cast<uint32_t>(r) << 16) |
               (static_cast<uint32_t>(g) << 8) |
               static_cast<uint32_t>(b);
    }

    /// Color channels scaled to [0, 1]
    [[nodiscard]] glm::vec3 normalized() const {
        return glm::vec3(r, g, b) / 255.0f;
    }

    constexpr bool operator==(const Material& other) const = default;
};

// ============================================================================
// MaterialPalette - fixed lookup from BlockType to Material
// ============================================================================
//
// Indexed directly by the block type byte. Air never has a material; the
// entry exists only so the array can be indexed without an offset.
//
class MaterialPalette {
public:
    /// Palette with the standard colors for every non-Air block type
    [[nodiscard]] static MaterialPalette standard();

    /// Material for a raw voxel byte, nullopt for Air and unknown bytes
    [[nodiscard]] std::optional<Material> lookup(uint8_t raw) const {
        if (raw == toByte(BlockType::Air) || !isKnownBlockType(raw)) {
            return std::nullopt;
        }
        return materials_[raw];
    }

    [[nodiscard]] std::optional<Material> lookup(BlockType type) const {
        return lookup(toByte(type));
    }

    /// Replace the color of one block type (ignored for Air)
    void set(BlockType type, Material material) {
        if (type == BlockType::Air) {
            return;
        }
        materials_[toByte(type)] = material;
    }

    bool operator==(const MaterialPalette& other) const = default;

private:
    std::array<Material, BLOCK_TYPE_COUNT> materials_{};
};

}  // namespace voxelforge
