#pragma once
#include <string>
#include <chrono>
#include <nlohmann/json.hpp>
#include <MiniPainter/PaintSession.hpp>

namespace MiniPainter {

enum class ExportFormat { Json, Obj };

// "json" or "obj" (case-insensitive); false for anything else
bool parseExportFormat(const std::string& name, ExportFormat& out);

struct ExportResult {
    bool ok = false;
    std::string content;
    std::string error;
};

/**
 * @brief Writes the current color scheme of a session snapshot.
 *
 * JSON: {model, timestamp, regions: [{id, name, color, vertices, percentage, visible}]}
 * with the resolved color as "#RRGGBB" and raw-vertex coverage.
 * OBJ: a group listing, one "g <id>" per region followed by its vertex count.
 */
class ColorSchemeExporter {
public:
    static nlohmann::json toJson(const RenderSnapshot& snapshot, const std::string& timestamp);
    static std::string toObjGroups(const RenderSnapshot& snapshot);

    // Export using the current time; unknown format names fail
    static ExportResult exportAs(const std::string& formatName, const RenderSnapshot& snapshot);
    static ExportResult exportAs(ExportFormat format, const RenderSnapshot& snapshot);

    // Write content to path, creating parent directories
    static ExportResult writeToFile(const std::string& path, const std::string& content);

    // "YYYY-MM-DDTHH:MM:SS.mmmZ"
    static std::string isoTimestampUtc(std::chrono::system_clock::time_point when);
};

} // namespace MiniPainter
