#pragma once

/**
 * @file mesh.hpp
 * @brief Face-culled triangle meshes for voxel grids
 *
 * Every non-Air cell emits one quad (two triangles, six vertices) for each
 * of its six faces whose neighbor is Air. Cells outside the grid count as
 * Air, so the chunk boundary is always closed. Coplanar faces are never
 * merged.
 *
 * Cells holding a byte with no material (anything outside the known block
 * types) emit nothing but still hide their neighbors' faces.
 */

#include "voxelforge/core/block_type.hpp"
#include "voxelforge/core/cancellation.hpp"
#include "voxelforge/core/position.hpp"
#include "voxelforge/core/voxel_grid.hpp"

#include <glm/glm.hpp>

#include <array>
#include <cstddef>
#include <vector>

namespace voxelforge {

// ============================================================================
// MeshBuffers - flat vertex attribute streams ready for upload
// ============================================================================

struct MeshBuffers {
    std::vector<float> positions;   // 3 per vertex, chunk-local
    std::vector<float> normals;     // 3 per vertex, constant per face
    std::vector<float> uvs;         // 2 per vertex, always zero
    std::vector<float> colors;      // 3 per vertex in [0, 1], constant per face

    static constexpr size_t VERTICES_PER_FACE = 6;

    [[nodiscard]] bool isEmpty() const { return positions.empty(); }

    void clear() {
        positions.clear();
        normals.clear();
        uvs.clear();
        colors.clear();
    }

    void reserveFaces(size_t faceCount) {
        size_t vertices = faceCount * VERTICES_PER_FACE;
        positions.reserve(vertices * 3);
        normals.reserve(vertices * 3);
        uvs.reserve(vertices * 2);
        colors.reserve(vertices * 3);
    }

    // Statistics
    [[nodiscard]] size_t vertexCount() const { return positions.size() / 3; }
    [[nodiscard]] size_t triangleCount() const { return vertexCount() / 3; }
    [[nodiscard]] size_t faceCount() const { return vertexCount() / VERTICES_PER_FACE; }

    // Memory usage in bytes
    [[nodiscard]] size_t memoryUsage() const {
        return (positions.size() + normals.size() + uvs.size() + colors.size()) * sizeof(float);
    }

    bool operator==(const MeshBuffers& other) const = default;
};

// ============================================================================
// MeshBuilder
// ============================================================================

class MeshBuilder {
public:
    explicit MeshBuilder(MaterialPalette palette = MaterialPalette::standard());

    /// Mesh a whole chunk grid. Throws GenerationCancelled if the token
    /// fires; the check runs once per X slice.
    [[nodiscard]] MeshBuffers buildChunkMesh(const VoxelGrid& grid,
                                             const CancellationToken* cancel = nullptr) const;

    /// Number of faces buildChunkMesh() would emit
    [[nodiscard]] size_t countVisibleFaces(const VoxelGrid& grid) const;

    [[nodiscard]] const MaterialPalette& palette() const { return palette_; }

    // Face geometry, listed in emission order: -Y, +Y, -X, +X, -Z, +Z
    struct FaceData {
        Face face;
        std::array<glm::vec3, 4> corners;  // Unit-cube corners; triangles (0,1,2) and (0,2,3)
        glm::vec3 normal;
    };

    static const std::array<FaceData, 6> FACE_DATA;

private:
    MaterialPalette palette_;

    void addFace(MeshBuffers& mesh, const FaceData& faceData,
                 const glm::vec3& offset, const glm::vec3& color) const;
};

}  // namespace voxelforge
