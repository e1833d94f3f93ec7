#pragma once
#include <string>
#include <functional>
#include <nlohmann/json.hpp>
#include <MiniPainter/PaintSession.hpp>
#include <MiniPainter/OracleHttpClient.hpp>

namespace MiniPainter {

/**
 * @brief Runtime settings. Defaults, then an optional JSON file, then
 * environment variables (MINIPAINTER_ORACLE_URL, MINIPAINTER_ORACLE_TIMEOUT,
 * MINIPAINTER_LOG_LEVEL).
 *
 * File layout mirrors the struct:
 * {
 *   "oracle": {"baseUrl": "...", "timeoutSeconds": 30, "healthTimeoutSeconds": 5,
 *              "profile": "", "detailLevel": "medium"},
 *   "quantization": {"digits": 6},
 *   "mesh": {"normalize": true, "targetSize": 5.0},
 *   "paint": {"defaultColor": "#808080"},
 *   "log": {"level": "info", "file": ""}
 * }
 * Every key is optional.
 */
struct PainterConfig {
    struct Oracle {
        std::string baseUrl = "http://localhost:5000";
        long timeoutSeconds = 30;
        long healthTimeoutSeconds = 5;
        std::string profile;
        std::string detailLevel = "medium";
    } oracle;

    struct Quantization {
        int digits = QuantizationPolicy::kDefaultDigits;
    } quantization;

    struct Mesh {
        bool normalize = true;
        float targetSize = 5.0f;
    } mesh;

    struct Paint {
        std::string defaultColor = "#808080";
    } paint;

    struct Log {
        std::string level = "info";
        std::string file;
    } log;

    // Call only on a validated config
    SessionOptions sessionOptions() const;
    OracleHttpClient makeHttpClient() const;
};

struct ConfigResult {
    bool success = false;
    std::string error;
    PainterConfig config;
};

using EnvLookup = std::function<const char*(const char*)>;

// Overlay the keys present in doc onto base; wrong types fail
ConfigResult configFromJson(const nlohmann::json& doc, PainterConfig base = PainterConfig());

// Read and overlay a JSON file
ConfigResult loadConfigFile(const std::string& path, PainterConfig base = PainterConfig());

// Overlay MINIPAINTER_* variables; lookup defaults to std::getenv
ConfigResult applyEnvironment(PainterConfig config, const EnvLookup& lookup = EnvLookup());

// Empty string when every field is in range
std::string validateConfig(const PainterConfig& config);

/**
 * @brief Defaults, then path (skipped when empty), then the environment,
 * then validation.
 */
ConfigResult loadConfig(const std::string& path, const EnvLookup& lookup = EnvLookup());

} // namespace MiniPainter
