#include <MiniPainter/SegmentationProtocol.hpp>
#include <plog/Log.h>
#include <cctype>
#include <unordered_set>

namespace MiniPainter {

std::string SegmentationRequest::endpoint() const {
    return profile.empty() ? "/segment" : "/segment-advanced";
}

nlohmann::json SegmentationRequest::toJson() const {
    nlohmann::json verts = nlohmann::json::array();
    for (const auto& v : vertices) {
        verts.push_back({v.x, v.y, v.z});
    }
    nlohmann::json body;
    body["vertices"] = std::move(verts);
    if (!profile.empty()) {
        body["type"] = profile;
        body["detail_level"] = detailLevel;
    }
    return body;
}

std::string titleCase(const std::string& id) {
    std::string out = id;
    bool startOfWord = true;
    for (auto& ch : out) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalpha(c)) {
            ch = static_cast<char>(startOfWord ? std::toupper(c) : std::tolower(c));
            startOfWord = false;
        } else {
            startOfWord = !std::isdigit(c);
        }
    }
    return out;
}

namespace {

SegmentationOutcome protocolError(const std::string& msg) {
    PLOGW << "SegmentationProtocol: malformed response: " << msg;
    return SegmentationOutcome::Failure(ErrorKind::ProtocolError, msg);
}

// Returns the oracle's failure message, or a fallback when none is given
std::string failureMessage(const nlohmann::json& doc, const std::string& fallback) {
    if (doc.is_object() && doc.contains("error") && doc["error"].is_string()) {
        std::string msg = doc["error"].get<std::string>();
        if (!msg.empty()) return msg;
    }
    return fallback;
}

bool parseRegion(const nlohmann::json& jr, size_t position, OracleRegion& out, std::string& err) {
    if (!jr.is_object()) { err = "region " + std::to_string(position) + " is not an object"; return false; }

    if (!jr.contains("id") || !jr["id"].is_string() || jr["id"].get<std::string>().empty()) {
        err = "region " + std::to_string(position) + " has no string id";
        return false;
    }
    out.id = jr["id"].get<std::string>();

    if (!jr.contains("vertex_indices") || !jr["vertex_indices"].is_array()) {
        err = "region '" + out.id + "' has no vertex_indices array";
        return false;
    }
    const auto& indices = jr["vertex_indices"];
    out.canonicalIndices.reserve(indices.size());
    for (const auto& idx : indices) {
        if (idx.is_number_unsigned()) {
            uint64_t u = idx.get<uint64_t>();
            out.canonicalIndices.push_back(u > static_cast<uint64_t>(INT64_MAX) ? INT64_MAX : static_cast<int64_t>(u));
        } else if (idx.is_number_integer()) {
            out.canonicalIndices.push_back(idx.get<int64_t>());
        } else {
            err = "region '" + out.id + "' has a non-integer vertex index";
            return false;
        }
    }

    if (jr.contains("name") && !jr["name"].is_null()) {
        if (!jr["name"].is_string()) { err = "region '" + out.id + "' name is not a string"; return false; }
        out.name = jr["name"].get<std::string>();
    }
    if (out.name.empty()) out.name = titleCase(out.id);

    if (jr.contains("color") && !jr["color"].is_null()) {
        if (!jr["color"].is_string() || !parseHexColor(jr["color"].get<std::string>(), out.color)) {
            err = "region '" + out.id + "' color is not #RRGGBB";
            return false;
        }
        out.hasColor = true;
    }

    if (jr.contains("description") && jr["description"].is_string()) {
        out.description = jr["description"].get<std::string>();
    }
    return true;
}

} // namespace

SegmentationOutcome parseSegmentationDocument(const nlohmann::json& doc) {
    if (!doc.is_object()) return protocolError("response is not a JSON object");
    if (!doc.contains("success") || !doc["success"].is_boolean()) {
        return protocolError("response has no boolean 'success' field");
    }
    if (!doc["success"].get<bool>()) {
        std::string msg = failureMessage(doc, "Segmentation failed");
        PLOGW << "SegmentationProtocol: oracle reported failure: " << msg;
        return SegmentationOutcome::Failure(ErrorKind::SegmentationError, msg);
    }
    if (!doc.contains("regions") || !doc["regions"].is_array()) {
        return protocolError("response has no 'regions' array");
    }

    std::vector<OracleRegion> regions;
    std::unordered_set<std::string> seenIds;
    const auto& jregions = doc["regions"];
    regions.reserve(jregions.size());
    for (size_t i = 0; i < jregions.size(); ++i) {
        OracleRegion region;
        std::string err;
        if (!parseRegion(jregions[i], i, region, err)) return protocolError(err);
        if (!seenIds.insert(region.id).second) return protocolError("duplicate region id '" + region.id + "'");
        regions.push_back(std::move(region));
    }
    return SegmentationOutcome::Success(std::move(regions));
}

SegmentationOutcome parseSegmentationResponse(long httpCode, const std::string& body) {
    nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
    bool parsed = !doc.is_discarded();

    if (httpCode < 200 || httpCode >= 300) {
        std::string msg = failureMessage(parsed ? doc : nlohmann::json(),
                                         "oracle returned HTTP " + std::to_string(httpCode));
        PLOGW << "SegmentationProtocol: HTTP " << httpCode << ": " << msg;
        return SegmentationOutcome::Failure(ErrorKind::SegmentationError, msg);
    }
    if (!parsed) return protocolError("response body is not valid JSON");
    return parseSegmentationDocument(doc);
}

HealthStatus parseHealthResponse(long httpCode, const std::string& body) {
    HealthStatus h;
    if (httpCode < 200 || httpCode >= 300) {
        h.error = "health check returned HTTP " + std::to_string(httpCode);
        return h;
    }
    nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        h.error = "health check body is not a JSON object";
        return h;
    }
    auto field = [&doc](const char* key) {
        return (doc.contains(key) && doc[key].is_string()) ? doc[key].get<std::string>() : std::string();
    };
    h.status = field("status");
    h.service = field("service");
    h.version = field("version");
    h.reachable = (h.status == "healthy");
    if (!h.reachable) h.error = "oracle status is '" + h.status + "'";
    return h;
}

} // namespace MiniPainter
