#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <MiniPainter/MeshDecoder.hpp>

namespace MiniPainter {

/**
 * @brief Loads any supported mesh file into a raw triangle soup.
 *
 * Files named *.stl (or with no extension) go through MeshDecoder so the
 * binary STL error contract holds. Every other extension is handed to
 * Assimp, triangulated and flattened without joining vertices, so each face
 * corner gets its own raw index just like an STL corner does.
 */
class MeshImporter {
public:
    /**
     * @brief Import a mesh from an in-memory file.
     * @param data File bytes
     * @param name File name; its extension selects the decoder
     */
    static DecodeResult importFromMemory(const std::vector<uint8_t>& data, const std::string& name);

    /**
     * @brief Read a file from disk and import it.
     */
    static DecodeResult importFromFile(const std::string& path);

    /**
     * @brief Lowercase extension without the dot ("" if none).
     */
    static std::string extensionOf(const std::string& name);

    static bool usesNativeStlDecoder(const std::string& name);

private:
    static DecodeResult importWithAssimp(const std::vector<uint8_t>& data, const std::string& extension);
};

} // namespace MiniPainter
