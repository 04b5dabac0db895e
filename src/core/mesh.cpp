#include "voxelforge/core/mesh.hpp"

namespace voxelforge {

const std::array<MeshBuilder::FaceData, 6> MeshBuilder::FACE_DATA = {{
    // [0] NegY - bottom
    {
        .face = Face::NegY,
        .corners = {{
            {0.0f, 0.0f, 1.0f},
            {1.0f, 0.0f, 1.0f},
            {1.0f, 0.0f, 0.0f},
            {0.0f, 0.0f, 0.0f}
        }},
        .normal = {0.0f, -1.0f, 0.0f}
    },
    // [1] PosY - top
    {
        .face = Face::PosY,
        .corners = {{
            {0.0f, 1.0f, 0.0f},
            {1.0f, 1.0f, 0.0f},
            {1.0f, 1.0f, 1.0f},
            {0.0f, 1.0f, 1.0f}
        }},
        .normal = {0.0f, 1.0f, 0.0f}
    },
    // [2] NegX
    {
        .face = Face::NegX,
        .corners = {{
            {0.0f, 0.0f, 1.0f},
            {0.0f, 1.0f, 1.0f},
            {0.0f, 1.0f, 0.0f},
            {0.0f, 0.0f, 0.0f}
        }},
        .normal = {-1.0f, 0.0f, 0.0f}
    },
    // [3] PosX
    {
        .face = Face::PosX,
        .corners = {{
            {1.0f, 0.0f, 0.0f},
            {1.0f, 1.0f, 0.0f},
            {1.0f, 1.0f, 1.0f},
            {1.0f, 0.0f, 1.0f}
        }},
        .normal = {1.0f, 0.0f, 0.0f}
    },
    // [4] NegZ
    {
        .face = Face::NegZ,
        .corners = {{
            {1.0f, 0.0f, 0.0f},
            {0.0f, 0.0f, 0.0f},
            {0.0f, 1.0f, 0.0f},
            {1.0f, 1.0f, 0.0f}
        }},
        .normal = {0.0f, 0.0f, -1.0f}
    },
    // [5] PosZ
    {
        .face = Face::PosZ,
        .corners = {{
            {0.0f, 0.0f, 1.0f},
            {1.0f, 0.0f, 1.0f},
            {1.0f, 1.0f, 1.0f},
            {0.0f, 1.0f, 1.0f}
        }},
        .normal = {0.0f, 0.0f, 1.0f}
    },
}};

MeshBuilder::MeshBuilder(MaterialPalette palette)
    : palette_(palette) {}

MeshBuffers MeshBuilder::buildChunkMesh(const VoxelGrid& grid, const CancellationToken* cancel) const {
    MeshBuffers mesh;

    // X outer, Z middle, Y inner: the storage order of the grid
    for (int32_t x = 0; x < CHUNK_WIDTH; ++x) {
        throwIfCancelled(cancel);

        for (int32_t z = 0; z < CHUNK_DEPTH; ++z) {
            for (int32_t y = 0; y < CHUNK_HEIGHT; ++y) {
                auto material = palette_.lookup(grid.getRaw(x, y, z));
                if (!material) continue;

                glm::vec3 offset(static_cast<float>(x), static_cast<float>(y), static_cast<float>(z));
                glm::vec3 color = material->normalized();
                LocalPos pos(x, y, z);

                for (const FaceData& faceData : FACE_DATA) {
                    LocalPos n = pos.neighbor(faceData.face);
                    if (!grid.isAir(n.x, n.y, n.z)) continue;

                    addFace(mesh, faceData, offset, color);
                }
            }
        }
    }

    return mesh;
}

size_t MeshBuilder::countVisibleFaces(const VoxelGrid& grid) const {
    size_t faces = 0;
    for (int32_t x = 0; x < CHUNK_WIDTH; ++x) {
        for (int32_t z = 0; z < CHUNK_DEPTH; ++z) {
            for (int32_t y = 0; y < CHUNK_HEIGHT; ++y) {
                if (!palette_.lookup(grid.getRaw(x, y, z))) continue;

                LocalPos pos(x, y, z);
                for (const FaceData& faceData : FACE_DATA) {
                    LocalPos n = pos.neighbor(faceData.face);
                    if (grid.isAir(n.x, n.y, n.z)) {
                        ++faces;
                    }
                }
            }
        }
    }
    return faces;
}

void MeshBuilder::addFace(MeshBuffers& mesh, const FaceData& faceData,
                          const glm::vec3& offset, const glm::vec3& color) const {
    constexpr std::array<int, MeshBuffers::VERTICES_PER_FACE> CORNER_ORDER = {0, 1, 2, 0, 2, 3};

    for (int corner : CORNER_ORDER) {
        glm::vec3 p = faceData.corners[corner] + offset;
        mesh.positions.insert(mesh.positions.end(), {p.x, p.y, p.z});
        mesh.normals.insert(mesh.normals.end(), {faceData.normal.x, faceData.normal.y, faceData.normal.z});
        mesh.uvs.insert(mesh.uvs.end(), {0.0f, 0.0f});
        mesh.colors.insert(mesh.colors.end(), {color.r, color.g, color.b});
    }
}

}  // namespace voxelforge
