#pragma once
#include <cstddef>
#include <cstdint>
#include <glm/glm.hpp>
#include <MiniPainter/MeshDecoder.hpp>

namespace MiniPainter {

/**
 * @brief Axis-aligned bounds of a set of positions
 */
struct MeshBounds {
    glm::vec3 min{0.0f};
    glm::vec3 max{0.0f};
    bool valid = false;

    glm::vec3 center() const { return (min + max) * 0.5f; }
    glm::vec3 extent() const { return max - min; }
    float maxExtent() const {
        glm::vec3 e = extent();
        return glm::max(glm::max(e.x, e.y), e.z);
    }
};

/**
 * @brief Summary of a loaded model
 */
struct MeshStats {
    size_t triangles = 0;
    size_t rawVertices = 0;
    size_t uniqueVertices = 0;
    MeshBounds bounds;        // after normalization
    float scaleApplied = 1.0f;
};

MeshBounds computeBounds(const RawMesh& mesh);

/**
 * @brief Center the mesh on its bounding-box center and scale it uniformly
 * so its largest extent equals targetSize.
 *
 * A mesh with zero extent is only centered. Normals are left untouched since
 * the scale is uniform.
 * @return The scale factor applied
 */
float normalizeMesh(RawMesh& mesh, float targetSize);

} // namespace MiniPainter
