#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <glm/glm.hpp>
#include <nlohmann/json.hpp>
#include <MiniPainter/Color.hpp>
#include <MiniPainter/Errors.hpp>

namespace MiniPainter {

// ============================================================
// Request
// ============================================================

/**
 * @brief Canonical vertices sent to the segmentation oracle.
 *
 * vertices[i] is canonical index i; the indices in the response are only
 * meaningful against this exact ordering.
 */
struct SegmentationRequest {
    std::vector<glm::vec3> vertices;
    std::string profile;                   // empty: plain segmentation
    std::string detailLevel = "medium";    // only sent with a profile

    // "/segment" or "/segment-advanced"
    std::string endpoint() const;
    nlohmann::json toJson() const;
};

// ============================================================
// Response
// ============================================================

struct OracleRegion {
    std::string id;
    std::string name;
    std::string description;
    bool hasColor = false;
    Color color{0.5f};
    std::vector<int64_t> canonicalIndices;   // as received; may hold out-of-range values
};

/**
 * @brief Outcome of one request/response exchange.
 *
 * On failure error.kind is BackendUnavailable, SegmentationError or
 * ProtocolError and regions is empty.
 */
struct SegmentationOutcome {
    bool success = false;
    PipelineError error;
    std::vector<OracleRegion> regions;

    static SegmentationOutcome Success(std::vector<OracleRegion> r) {
        SegmentationOutcome o;
        o.success = true;
        o.regions = std::move(r);
        return o;
    }

    static SegmentationOutcome Failure(ErrorKind kind, const std::string& msg) {
        SegmentationOutcome o;
        o.error = PipelineError(kind, msg);
        return o;
    }
};

/**
 * @brief Interpret an HTTP status and body returned by /segment.
 *
 * A non-2xx status or {"success": false} becomes a SegmentationError with
 * the oracle's message verbatim. Anything else that does not match the
 * expected document shape becomes a ProtocolError.
 */
SegmentationOutcome parseSegmentationResponse(long httpCode, const std::string& body);

/**
 * @brief Same as parseSegmentationResponse for an already parsed 2xx document.
 */
SegmentationOutcome parseSegmentationDocument(const nlohmann::json& doc);

// ============================================================
// Health probe
// ============================================================

struct HealthStatus {
    bool reachable = false;
    std::string status;
    std::string service;
    std::string version;
    std::string error;   // transport or parse failure, empty when reachable
};

HealthStatus parseHealthResponse(long httpCode, const std::string& body);

/**
 * @brief "legs" -> "Legs", "left_arm" -> "Left_Arm"; display name fallback.
 */
std::string titleCase(const std::string& id);

} // namespace MiniPainter
