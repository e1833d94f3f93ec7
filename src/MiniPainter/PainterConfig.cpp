#include <MiniPainter/PainterConfig.hpp>
#include <MiniPainter/Logging.hpp>
#include <plog/Log.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace MiniPainter {

namespace {

using nlohmann::json;

std::string fieldPath(const char* section, const char* key){
    return std::string(section) + "." + key;
}

bool readField(const json& sec, const char* section, const char* key, std::string& out, std::string& err){
    if(!sec.contains(key)) return true;
    if(!sec[key].is_string()){ err = fieldPath(section, key) + " must be a string"; return false; }
    out = sec[key].get<std::string>();
    return true;
}

bool readField(const json& sec, const char* section, const char* key, long& out, std::string& err){
    if(!sec.contains(key)) return true;
    if(!sec[key].is_number_integer()){ err = fieldPath(section, key) + " must be an integer"; return false; }
    out = sec[key].get<long>();
    return true;
}

bool readField(const json& sec, const char* section, const char* key, int& out, std::string& err){
    long v = out;
    if(!readField(sec, section, key, v, err)) return false;
    out = static_cast<int>(v);
    return true;
}

bool readField(const json& sec, const char* section, const char* key, float& out, std::string& err){
    if(!sec.contains(key)) return true;
    if(!sec[key].is_number()){ err = fieldPath(section, key) + " must be a number"; return false; }
    out = sec[key].get<float>();
    return true;
}

bool readField(const json& sec, const char* section, const char* key, bool& out, std::string& err){
    if(!sec.contains(key)) return true;
    if(!sec[key].is_boolean()){ err = fieldPath(section, key) + " must be true or false"; return false; }
    out = sec[key].get<bool>();
    return true;
}

// Null when the section is absent; sets err when present but not an object
const json* section(const json& doc, const char* name, std::string& err){
    if(!doc.contains(name)) return nullptr;
    if(!doc[name].is_object()){ err = std::string(name) + " must be an object"; return nullptr; }
    return &doc[name];
}

ConfigResult failed(const std::string& err){
    ConfigResult r;
    r.error = err;
    return r;
}

} // namespace

SessionOptions PainterConfig::sessionOptions() const {
    SessionOptions o;
    o.quantization = QuantizationPolicy(quantization.digits);
    o.normalize = mesh.normalize;
    o.targetSize = mesh.targetSize;
    o.profile = oracle.profile;
    o.detailLevel = oracle.detailLevel;
    Color c;
    if(parseHexColor(paint.defaultColor, c)) o.defaultColor = c;
    return o;
}

OracleHttpClient PainterConfig::makeHttpClient() const {
    OracleHttpClient client(oracle.baseUrl);
    client.setTimeoutSeconds(oracle.timeoutSeconds);
    return client;
}

ConfigResult configFromJson(const json& doc, PainterConfig base){
    if(!doc.is_object()) return failed("config root must be a JSON object");

    std::string err;
    PainterConfig& c = base;
    if(const json* s = section(doc, "oracle", err)){
        if(!readField(*s, "oracle", "baseUrl", c.oracle.baseUrl, err) ||
           !readField(*s, "oracle", "timeoutSeconds", c.oracle.timeoutSeconds, err) ||
           !readField(*s, "oracle", "healthTimeoutSeconds", c.oracle.healthTimeoutSeconds, err) ||
           !readField(*s, "oracle", "profile", c.oracle.profile, err) ||
           !readField(*s, "oracle", "detailLevel", c.oracle.detailLevel, err)) return failed(err);
    }
    if(!err.empty()) return failed(err);

    if(const json* s = section(doc, "quantization", err)){
        if(!readField(*s, "quantization", "digits", c.quantization.digits, err)) return failed(err);
    }
    if(!err.empty()) return failed(err);

    if(const json* s = section(doc, "mesh", err)){
        if(!readField(*s, "mesh", "normalize", c.mesh.normalize, err) ||
           !readField(*s, "mesh", "targetSize", c.mesh.targetSize, err)) return failed(err);
    }
    if(!err.empty()) return failed(err);

    if(const json* s = section(doc, "paint", err)){
        if(!readField(*s, "paint", "defaultColor", c.paint.defaultColor, err)) return failed(err);
    }
    if(!err.empty()) return failed(err);

    if(const json* s = section(doc, "log", err)){
        if(!readField(*s, "log", "level", c.log.level, err) ||
           !readField(*s, "log", "file", c.log.file, err)) return failed(err);
    }
    if(!err.empty()) return failed(err);

    ConfigResult r;
    r.success = true;
    r.config = std::move(base);
    return r;
}

ConfigResult loadConfigFile(const std::string& path, PainterConfig base){
    std::ifstream ifs(path);
    if(!ifs) return failed("cannot open config file: " + path);
    std::stringstream ss;
    ss << ifs.rdbuf();

    json doc;
    try {
        doc = json::parse(ss.str());
    } catch(const std::exception& e){
        return failed("invalid JSON in " + path + ": " + e.what());
    }
    ConfigResult r = configFromJson(doc, std::move(base));
    if(!r.success) r.error = path + ": " + r.error;
    return r;
}

ConfigResult applyEnvironment(PainterConfig config, const EnvLookup& lookup){
    auto get = [&lookup](const char* name) -> const char* {
        return lookup ? lookup(name) : std::getenv(name);
    };

    if(const char* v = get("MINIPAINTER_ORACLE_URL")){
        if(*v) config.oracle.baseUrl = v;
    }
    if(const char* v = get("MINIPAINTER_ORACLE_TIMEOUT")){
        if(*v){
            char* end = nullptr;
            long seconds = std::strtol(v, &end, 10);
            if(end == v || *end != '\0'){
                return failed(std::string("MINIPAINTER_ORACLE_TIMEOUT is not an integer: ") + v);
            }
            config.oracle.timeoutSeconds = seconds;
        }
    }
    if(const char* v = get("MINIPAINTER_LOG_LEVEL")){
        if(*v) config.log.level = v;
    }

    ConfigResult r;
    r.success = true;
    r.config = std::move(config);
    return r;
}

std::string validateConfig(const PainterConfig& c){
    if(c.oracle.baseUrl.empty()) return "oracle.baseUrl must not be empty";
    if(c.oracle.timeoutSeconds <= 0) return "oracle.timeoutSeconds must be positive";
    if(c.oracle.healthTimeoutSeconds <= 0) return "oracle.healthTimeoutSeconds must be positive";
    if(c.oracle.detailLevel != "low" && c.oracle.detailLevel != "medium" && c.oracle.detailLevel != "high"){
        return "oracle.detailLevel must be low, medium or high";
    }
    if(c.quantization.digits < QuantizationPolicy::kMinDigits || c.quantization.digits > QuantizationPolicy::kMaxDigits){
        return "quantization.digits must be in [" + std::to_string(QuantizationPolicy::kMinDigits) + ", " +
               std::to_string(QuantizationPolicy::kMaxDigits) + "]";
    }
    if(!(c.mesh.targetSize > 0.0f)) return "mesh.targetSize must be positive";
    Color color;
    if(!parseHexColor(c.paint.defaultColor, color)) return "paint.defaultColor is not a #RRGGBB color";
    plog::Severity sev;
    if(!parseLogLevel(c.log.level, sev)) return "log.level is not a known level: " + c.log.level;
    return std::string();
}

ConfigResult loadConfig(const std::string& path, const EnvLookup& lookup){
    PainterConfig base;
    if(!path.empty()){
        ConfigResult fromFile = loadConfigFile(path, base);
        if(!fromFile.success) return fromFile;
        base = std::move(fromFile.config);
        PLOGD << "PainterConfig: loaded " << path;
    }
    ConfigResult r = applyEnvironment(std::move(base), lookup);
    if(!r.success) return r;

    std::string err = validateConfig(r.config);
    if(!err.empty()) return failed(err);
    return r;
}

} // namespace MiniPainter
