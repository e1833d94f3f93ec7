#include <MiniPainter/MeshDecoder.hpp>
#include <plog/Log.h>
#include <cstring>

namespace MiniPainter {

namespace {

// ============================================================
// Little-endian field readers
// ============================================================

uint32_t readUint32(const uint8_t* ptr) {
    return static_cast<uint32_t>(ptr[0])
         | (static_cast<uint32_t>(ptr[1]) << 8)
         | (static_cast<uint32_t>(ptr[2]) << 16)
         | (static_cast<uint32_t>(ptr[3]) << 24);
}

float readFloat(const uint8_t* ptr) {
    uint32_t bits = readUint32(ptr);
    float f;
    std::memcpy(&f, &bits, sizeof(f));
    return f;
}

glm::vec3 readVec3(const uint8_t* ptr) {
    return glm::vec3(readFloat(ptr), readFloat(ptr + 4), readFloat(ptr + 8));
}

} // namespace

uint64_t MeshDecoder::expectedSize(uint32_t triangleCount) {
    return static_cast<uint64_t>(kFirstTriangleOffset)
         + static_cast<uint64_t>(triangleCount) * kTriangleRecordSize;
}

bool MeshDecoder::isAsciiStl(const uint8_t* data, size_t size) {
    if (!data || size < 5) return false;
    if (std::memcmp(data, "solid", 5) != 0) return false;
    // Some exporters write "solid" into binary headers too; a buffer whose
    // size matches its declared triangle count exactly is binary.
    if (size >= kFirstTriangleOffset) {
        uint32_t count = readUint32(data + kCountOffset);
        if (expectedSize(count) == size) return false;
    }
    return true;
}

DecodeResult MeshDecoder::decodeBinaryStl(const std::vector<uint8_t>& data) {
    return decodeBinaryStl(data.data(), data.size());
}

DecodeResult MeshDecoder::decodeBinaryStl(const uint8_t* data, size_t size) {
    if (isAsciiStl(data, size)) {
        PLOGW << "MeshDecoder: textual STL rejected (" << size << " bytes)";
        return DecodeResult::Failure(ErrorKind::FormatError,
                                     "ASCII STL is not supported; please export a binary STL");
    }
    if (!data || size < kFirstTriangleOffset) {
        return DecodeResult::Failure(ErrorKind::TruncatedError,
                                     "file is " + std::to_string(size) + " bytes, shorter than the 84-byte STL header");
    }

    uint32_t triangleCount = readUint32(data + kCountOffset);
    uint64_t needed = expectedSize(triangleCount);
    if (needed > size) {
        PLOGW << "MeshDecoder: header declares " << triangleCount << " triangles (" << needed
              << " bytes) but buffer holds " << size;
        return DecodeResult::Failure(ErrorKind::TruncatedError,
                                     "header declares " + std::to_string(triangleCount) + " triangles needing "
                                     + std::to_string(needed) + " bytes, only " + std::to_string(size) + " present");
    }

    RawMesh mesh;
    mesh.positions.reserve(static_cast<size_t>(triangleCount) * 3);
    mesh.normals.reserve(static_cast<size_t>(triangleCount) * 3);

    const uint8_t* ptr = data + kFirstTriangleOffset;
    for (uint32_t t = 0; t < triangleCount; ++t) {
        glm::vec3 normal = readVec3(ptr);
        for (int corner = 0; corner < 3; ++corner) {
            mesh.positions.push_back(readVec3(ptr + 12 + corner * 12));
            mesh.normals.push_back(normal);
        }
        ptr += kTriangleRecordSize; // includes the trailing uint16 attribute field
    }

    DecodeResult result = DecodeResult::Success(std::move(mesh));
    if (needed < size) {
        result.warnings.push_back(std::to_string(size - needed) + " trailing bytes ignored");
        PLOGD << "MeshDecoder: " << (size - needed) << " trailing bytes ignored";
    }
    PLOGI << "MeshDecoder: decoded " << triangleCount << " triangles (" << result.mesh.vertexCount() << " raw vertices)";
    return result;
}

} // namespace MiniPainter
