#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <utility>
#include <glm/glm.hpp>
#include <MiniPainter/Errors.hpp>

namespace MiniPainter {

/**
 * @brief Unreduced triangle soup: one entry per triangle corner.
 *
 * Geometrically coincident corners of adjacent triangles occupy different
 * indices. positions and normals always have the same length, a multiple of 3.
 */
struct RawMesh {
    std::vector<glm::vec3> positions;
    std::vector<glm::vec3> normals;   // facet normal replicated on each corner

    size_t vertexCount() const { return positions.size(); }
    size_t triangleCount() const { return positions.size() / 3; }
    bool empty() const { return positions.empty(); }
};

/**
 * @brief Result of decoding or importing a mesh
 */
struct DecodeResult {
    bool success = false;
    PipelineError error;
    RawMesh mesh;
    std::vector<std::string> warnings;

    static DecodeResult Success(RawMesh m) {
        DecodeResult r;
        r.success = true;
        r.mesh = std::move(m);
        return r;
    }

    static DecodeResult Failure(ErrorKind kind, const std::string& msg) {
        DecodeResult r;
        r.error = PipelineError(kind, msg);
        return r;
    }
};

/**
 * @brief Decoder for the binary STL triangle-soup format.
 *
 * Layout: 80-byte header, uint32 triangle count (little endian), then one
 * 50-byte record per triangle: normal (3 x float32), three vertices
 * (3 x float32 each), uint16 attribute byte count. Triangles pass through
 * unchanged; degenerate or inverted faces are not validated.
 */
class MeshDecoder {
public:
    static constexpr size_t kHeaderSize = 80;
    static constexpr size_t kCountOffset = 80;
    static constexpr size_t kFirstTriangleOffset = 84;
    static constexpr size_t kTriangleRecordSize = 50;

    /**
     * @brief Decode a binary STL buffer.
     *
     * Fails with FormatError when the buffer is the textual ("solid ...")
     * variant, and with TruncatedError when the declared triangle count
     * needs more bytes than are present.
     */
    static DecodeResult decodeBinaryStl(const uint8_t* data, size_t size);
    static DecodeResult decodeBinaryStl(const std::vector<uint8_t>& data);

    /**
     * @brief Whether the buffer carries the textual STL signature and is not
     * a binary file of exactly the size its header declares.
     */
    static bool isAsciiStl(const uint8_t* data, size_t size);

    /**
     * @brief Expected byte size of a binary STL with the given triangle count.
     */
    static uint64_t expectedSize(uint32_t triangleCount);
};

} // namespace MiniPainter
