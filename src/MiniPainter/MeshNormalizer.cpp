#include <MiniPainter/MeshNormalizer.hpp>
#include <plog/Log.h>

namespace MiniPainter {

MeshBounds computeBounds(const RawMesh& mesh) {
    MeshBounds b;
    if (mesh.positions.empty()) return b;
    b.min = glm::vec3(1e30f);
    b.max = glm::vec3(-1e30f);
    for (const auto& p : mesh.positions) { b.min = glm::min(b.min, p); b.max = glm::max(b.max, p); }
    b.valid = true;
    return b;
}

float normalizeMesh(RawMesh& mesh, float targetSize) {
    MeshBounds b = computeBounds(mesh);
    if (!b.valid) return 1.0f;

    glm::vec3 center = b.center();
    float maxExtent = b.maxExtent();
    float scale = 1.0f;
    if (maxExtent > 1e-6f && targetSize > 0.0f) scale = targetSize / maxExtent;

    for (auto& p : mesh.positions) p = (p - center) * scale;

    PLOGD << "MeshNormalizer: extent " << maxExtent << " -> scale " << scale;
    return scale;
}

} // namespace MiniPainter
