#include <MiniPainter/ColorSchemeExporter.hpp>
#include <plog/Log.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace MiniPainter {

bool parseExportFormat(const std::string& name, ExportFormat& out){
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if(lower == "json"){ out = ExportFormat::Json; return true; }
    if(lower == "obj"){ out = ExportFormat::Obj; return true; }
    return false;
}

std::string ColorSchemeExporter::isoTimestampUtc(std::chrono::system_clock::time_point when){
    using namespace std::chrono;
    std::time_t t = system_clock::to_time_t(when);
    auto ms = duration_cast<milliseconds>(when.time_since_epoch()).count() % 1000;
    if(ms < 0) ms += 1000;

    struct tm tmBuf;
#ifdef _WIN32
    gmtime_s(&tmBuf, &t);
#else
    gmtime_r(&t, &tmBuf);
#endif
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tmBuf);
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%s.%03dZ", date, static_cast<int>(ms));
    return buf;
}

nlohmann::json ColorSchemeExporter::toJson(const RenderSnapshot& snapshot, const std::string& timestamp){
    nlohmann::json doc;
    doc["model"] = snapshot.model ? snapshot.model->name : std::string();
    doc["timestamp"] = timestamp;
    nlohmann::json regions = nlohmann::json::array();
    for(const auto& r : snapshot.regions){
        regions.push_back({
            {"id", r.id},
            {"name", r.name},
            {"color", toHexColor(r.color)},
            {"vertices", r.vertexCount},
            {"percentage", r.percentage},
            {"visible", r.visible}
        });
    }
    doc["regions"] = std::move(regions);
    return doc;
}

std::string ColorSchemeExporter::toObjGroups(const RenderSnapshot& snapshot){
    std::string out = "# Miniature painting regions\n";
    for(const auto& r : snapshot.regions){
        out += "g " + r.id + "\n";
        out += "# " + std::to_string(r.vertexCount) + " vertices\n";
    }
    return out;
}

ExportResult ColorSchemeExporter::exportAs(const std::string& formatName, const RenderSnapshot& snapshot){
    ExportFormat format = ExportFormat::Json;
    if(!parseExportFormat(formatName, format)){
        ExportResult res;
        res.error = "Unsupported format: " + formatName;
        return res;
    }
    return exportAs(format, snapshot);
}

ExportResult ColorSchemeExporter::exportAs(ExportFormat format, const RenderSnapshot& snapshot){
    ExportResult res;
    if(!snapshot.hasModel()){
        res.error = "no model loaded";
        return res;
    }
    switch(format){
        case ExportFormat::Json:
            res.content = toJson(snapshot, isoTimestampUtc(std::chrono::system_clock::now())).dump(2);
            break;
        case ExportFormat::Obj:
            res.content = toObjGroups(snapshot);
            break;
    }
    res.ok = true;
    return res;
}

ExportResult ColorSchemeExporter::writeToFile(const std::string& path, const std::string& content){
    ExportResult res;
    try {
        std::filesystem::path p(path);
        auto parent = p.parent_path();
        if(!parent.empty()) std::filesystem::create_directories(parent);
        std::ofstream ofs(p, std::ios::binary);
        if(!ofs){ res.error = "failed to open " + path + " for write"; return res; }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        if(!ofs){ res.error = "failed to write " + path; return res; }
    } catch(const std::exception& ex){
        res.error = ex.what();
        return res;
    }
    res.ok = true;
    res.content = content;
    PLOGI << "ColorSchemeExporter: wrote " << content.size() << " bytes to " << path;
    return res;
}

} // namespace MiniPainter
