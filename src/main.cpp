// main.cpp - command-line driver for the painting pipeline.
//
// Loads a model, asks the segmentation oracle for paint regions, applies
// --hide/--paint edits, prints one line per region to stdout and writes the
// requested exports. Logs go to stderr.

#include <MiniPainter/PainterConfig.hpp>
#include <MiniPainter/Logging.hpp>
#include <MiniPainter/PaintSession.hpp>
#include <MiniPainter/HttpSegmentationOracle.hpp>
#include <MiniPainter/ColorSchemeExporter.hpp>
#include <plog/Log.h>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace MiniPainter;

enum ExitCode {
    kExitOk = 0,
    kExitUsage = 2,
    kExitDecode = 3,
    kExitOracleUnavailable = 4,
    kExitSegmentation = 5,
    kExitExport = 6
};

static void usage(){
    fprintf(stderr,
        "Usage: minipainter --in model.stl [--config cfg.json] [--oracle URL] [--profile P]\n"
        "                   [--digits N] [--no-normalize] [--hide ID]... [--paint ID=#RRGGBB]...\n"
        "                   [--export out.json] [--export-obj out.obj] [--log-level L]\n");
}

struct CliOptions {
    std::string inPath;
    std::string configPath;
    std::string oracleUrl;
    std::string profile;
    bool profileSet = false;
    int digits = -1;
    bool noNormalize = false;
    std::vector<std::string> hide;
    std::vector<std::pair<std::string, std::string>> paint;   // id, color text
    std::string exportJson;
    std::string exportObj;
    std::string logLevel;
};

static bool parseArgs(int argc, char** argv, CliOptions& o){
    for(int i = 1; i < argc; i++){
        const char* a = argv[i];
        bool hasValue = i + 1 < argc;
        if(!strcmp(a, "--in") && hasValue) o.inPath = argv[++i];
        else if(!strcmp(a, "--config") && hasValue) o.configPath = argv[++i];
        else if(!strcmp(a, "--oracle") && hasValue) o.oracleUrl = argv[++i];
        else if(!strcmp(a, "--profile") && hasValue){ o.profile = argv[++i]; o.profileSet = true; }
        else if(!strcmp(a, "--digits") && hasValue){
            const char* v = argv[++i];
            char* end = nullptr;
            long d = std::strtol(v, &end, 10);
            if(end == v || *end != '\0'){ fprintf(stderr, "--digits expects an integer, got '%s'\n", v); return false; }
            o.digits = static_cast<int>(d);
        }
        else if(!strcmp(a, "--no-normalize")) o.noNormalize = true;
        else if(!strcmp(a, "--hide") && hasValue) o.hide.push_back(argv[++i]);
        else if(!strcmp(a, "--paint") && hasValue){
            std::string arg = argv[++i];
            size_t eq = arg.rfind('=');
            if(eq == std::string::npos || eq == 0){ fprintf(stderr, "--paint expects ID=#RRGGBB, got '%s'\n", arg.c_str()); return false; }
            o.paint.emplace_back(arg.substr(0, eq), arg.substr(eq + 1));
        }
        else if(!strcmp(a, "--export") && hasValue) o.exportJson = argv[++i];
        else if(!strcmp(a, "--export-obj") && hasValue) o.exportObj = argv[++i];
        else if(!strcmp(a, "--log-level") && hasValue) o.logLevel = argv[++i];
        else { fprintf(stderr, "Unknown or incomplete option: %s\n", a); return false; }
    }
    if(o.inPath.empty()){ fprintf(stderr, "--in is required\n"); return false; }
    return true;
}

static bool readFileBytes(const std::string& path, std::vector<uint8_t>& out){
    std::ifstream ifs(path, std::ios::binary | std::ios::ate);
    if(!ifs) return false;
    std::streamsize sz = ifs.tellg();
    ifs.seekg(0, std::ios::beg);
    out.resize(static_cast<size_t>(sz > 0 ? sz : 0));
    return sz <= 0 || static_cast<bool>(ifs.read(reinterpret_cast<char*>(out.data()), sz));
}

static int exitCodeFor(ErrorKind kind){
    switch(kind){
        case ErrorKind::None: return kExitOk;
        case ErrorKind::FormatError:
        case ErrorKind::TruncatedError: return kExitDecode;
        case ErrorKind::BackendUnavailable: return kExitOracleUnavailable;
        case ErrorKind::SegmentationError:
        case ErrorKind::ProtocolError: return kExitSegmentation;
    }
    return kExitSegmentation;
}

static bool writeExport(ExportFormat format, const std::string& path, const RenderSnapshot& snap){
    ExportResult res = ColorSchemeExporter::exportAs(format, snap);
    if(res.ok) res = ColorSchemeExporter::writeToFile(path, res.content);
    if(!res.ok){
        fprintf(stderr, "Export error (%s): %s\n", path.c_str(), res.error.c_str());
        return false;
    }
    return true;
}

int main(int argc, char** argv){
    CliOptions cli;
    if(!parseArgs(argc, argv, cli)){ usage(); return kExitUsage; }

    ConfigResult cfgResult = loadConfig(cli.configPath);
    if(!cfgResult.success){ fprintf(stderr, "Config error: %s\n", cfgResult.error.c_str()); return kExitUsage; }
    PainterConfig cfg = std::move(cfgResult.config);
    if(!cli.oracleUrl.empty()) cfg.oracle.baseUrl = cli.oracleUrl;
    if(cli.profileSet) cfg.oracle.profile = cli.profile;
    if(cli.digits >= 0) cfg.quantization.digits = cli.digits;
    if(cli.noNormalize) cfg.mesh.normalize = false;
    if(!cli.logLevel.empty()) cfg.log.level = cli.logLevel;
    std::string invalid = validateConfig(cfg);
    if(!invalid.empty()){ fprintf(stderr, "Config error: %s\n", invalid.c_str()); return kExitUsage; }

    plog::Severity level = plog::info;
    if(!parseLogLevel(cfg.log.level, level)) level = plog::info;
    initLogging(level, cfg.log.file);

    std::vector<Color> paintColors;
    for(const auto& p : cli.paint){
        Color c;
        if(!parseHexColor(p.second, c)){
            fprintf(stderr, "--paint %s: '%s' is not a #RRGGBB color\n", p.first.c_str(), p.second.c_str());
            return kExitUsage;
        }
        paintColors.push_back(c);
    }

    std::vector<uint8_t> bytes;
    if(!readFileBytes(cli.inPath, bytes)){
        fprintf(stderr, "Load error: cannot read %s\n", cli.inPath.c_str());
        return kExitDecode;
    }

    auto oracle = std::make_shared<HttpSegmentationOracle>(cfg.makeHttpClient(), cfg.oracle.healthTimeoutSeconds);
    PaintSession session(oracle, cfg.sessionOptions());

    HealthStatus health = session.probeHealth();
    if(!health.reachable){
        fprintf(stderr, "Segmentation backend unavailable at %s: %s\n", cfg.oracle.baseUrl.c_str(), health.error.c_str());
        return kExitOracleUnavailable;
    }

    PaintSession::UploadStatus status = session.beginUpload(bytes, cli.inPath);
    if(status != PaintSession::UploadStatus::Started){
        fprintf(stderr, "Upload failed (%s): %s\n", uploadStatusName(status), session.currentError().describe().c_str());
        return exitCodeFor(session.currentError().kind);
    }

    // The HTTP timeout bounds the call, so this loop ends once it resolves
    while(session.hasPending()){
        session.waitForPending(std::chrono::milliseconds(200));
    }
    if(session.currentError().isError()){
        fprintf(stderr, "%s\n", session.currentError().describe().c_str());
        return exitCodeFor(session.currentError().kind);
    }

    for(const auto& id : cli.hide){
        if(!session.setVisibility(id, false)){ fprintf(stderr, "--hide: unknown region '%s'\n", id.c_str()); return kExitUsage; }
    }
    for(size_t i = 0; i < cli.paint.size(); ++i){
        if(!session.setOverrideColor(cli.paint[i].first, paintColors[i])){
            fprintf(stderr, "--paint: unknown region '%s'\n", cli.paint[i].first.c_str());
            return kExitUsage;
        }
    }

    RenderSnapshot snap = session.snapshot();
    const MeshStats& stats = snap.model->stats;
    fprintf(stdout, "model: %s\ntriangles: %zu\nvertices: %zu raw, %zu unique\nregions: %zu\n",
            snap.model->name.c_str(), stats.triangles, stats.rawVertices, stats.uniqueVertices, snap.regions.size());
    for(const auto& r : snap.regions){
        fprintf(stdout, "  %-16s %-20s %s %6zu vertices %6.2f%%%s%s\n", r.id.c_str(), r.name.c_str(),
                toHexColor(r.color).c_str(), r.vertexCount, r.percentage,
                r.visible ? "" : " hidden", r.overridden ? " painted" : "");
    }

    bool exportOk = true;
    if(!cli.exportJson.empty()) exportOk = writeExport(ExportFormat::Json, cli.exportJson, snap) && exportOk;
    if(!cli.exportObj.empty()) exportOk = writeExport(ExportFormat::Obj, cli.exportObj, snap) && exportOk;
    return exportOk ? kExitOk : kExitExport;
}
