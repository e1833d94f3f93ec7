#include <MiniPainter/MeshImporter.hpp>
#include <assimp/Importer.hpp>
#include <assimp/scene.h>
#include <assimp/postprocess.h>
#include <plog/Log.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace MiniPainter {

namespace {

glm::vec3 toGlm(const aiVector3D& v) {
    return glm::vec3(v.x, v.y, v.z);
}

glm::vec3 facetNormal(const glm::vec3& a, const glm::vec3& b, const glm::vec3& c) {
    glm::vec3 n = glm::cross(b - a, c - a);
    float len = glm::length(n);
    if (len <= 0.0f) return glm::vec3(0.0f);
    return n / len;
}

// Append every triangle of an Assimp mesh as three independent corners
void flattenMesh(const aiMesh* mesh, RawMesh& out, size_t& skippedFaces) {
    for (unsigned int f = 0; f < mesh->mNumFaces; ++f) {
        const aiFace& face = mesh->mFaces[f];
        if (face.mNumIndices != 3) { ++skippedFaces; continue; }

        glm::vec3 corners[3];
        for (int k = 0; k < 3; ++k) corners[k] = toGlm(mesh->mVertices[face.mIndices[k]]);
        glm::vec3 n = facetNormal(corners[0], corners[1], corners[2]);

        for (int k = 0; k < 3; ++k) {
            out.positions.push_back(corners[k]);
            out.normals.push_back(mesh->HasNormals() ? toGlm(mesh->mNormals[face.mIndices[k]]) : n);
        }
    }
}

} // namespace

std::string MeshImporter::extensionOf(const std::string& name) {
    std::string ext = std::filesystem::path(name).extension().string();
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool MeshImporter::usesNativeStlDecoder(const std::string& name) {
    std::string ext = extensionOf(name);
    return ext.empty() || ext == "stl";
}

DecodeResult MeshImporter::importFromMemory(const std::vector<uint8_t>& data, const std::string& name) {
    if (usesNativeStlDecoder(name)) {
        return MeshDecoder::decodeBinaryStl(data);
    }
    return importWithAssimp(data, extensionOf(name));
}

DecodeResult MeshImporter::importFromFile(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary | std::ios::ate);
    if (!ifs) {
        return DecodeResult::Failure(ErrorKind::FormatError, "cannot open file: " + path);
    }
    std::streamsize sz = ifs.tellg();
    ifs.seekg(0, std::ios::beg);
    std::vector<uint8_t> buf(static_cast<size_t>(sz > 0 ? sz : 0));
    if (sz > 0 && !ifs.read(reinterpret_cast<char*>(buf.data()), sz)) {
        return DecodeResult::Failure(ErrorKind::FormatError, "failed to read file: " + path);
    }
    PLOGD << "MeshImporter: read " << buf.size() << " bytes from " << path;
    return importFromMemory(buf, path);
}

DecodeResult MeshImporter::importWithAssimp(const std::vector<uint8_t>& data, const std::string& extension) {
    if (data.empty()) {
        return DecodeResult::Failure(ErrorKind::FormatError, "empty ." + extension + " file");
    }

    // No JoinIdenticalVertices: corners must stay unreduced.
    Assimp::Importer importer;
    unsigned int flags = aiProcess_Triangulate | aiProcess_PreTransformVertices;
    const aiScene* scene = importer.ReadFileFromMemory(data.data(), data.size(), flags, extension.c_str());

    if (!scene || (scene->mFlags & AI_SCENE_FLAGS_INCOMPLETE) || !scene->HasMeshes()) {
        PLOGW << "MeshImporter: Assimp failed for ." << extension << " : " << importer.GetErrorString();
        return DecodeResult::Failure(ErrorKind::FormatError,
                                     "failed to import ." + extension + " model: " + std::string(importer.GetErrorString()));
    }

    RawMesh mesh;
    size_t skippedFaces = 0;
    for (unsigned int m = 0; m < scene->mNumMeshes; ++m) {
        flattenMesh(scene->mMeshes[m], mesh, skippedFaces);
    }
    if (mesh.empty()) {
        return DecodeResult::Failure(ErrorKind::FormatError, "model contains no triangles");
    }

    DecodeResult result = DecodeResult::Success(std::move(mesh));
    if (skippedFaces > 0) {
        result.warnings.push_back("skipped " + std::to_string(skippedFaces) + " non-triangle faces");
    }
    PLOGI << "MeshImporter: imported ." << extension << " with " << result.mesh.triangleCount()
          << " triangles from " << scene->mNumMeshes << " meshes";
    return result;
}

} // namespace MiniPainter
