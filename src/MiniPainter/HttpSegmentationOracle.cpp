#include <MiniPainter/HttpSegmentationOracle.hpp>
#include <plog/Log.h>
#include <utility>

namespace MiniPainter {

HttpSegmentationOracle::HttpSegmentationOracle(OracleHttpClient client, long healthTimeoutSeconds)
    : client_(std::move(client)), healthTimeoutSeconds_(healthTimeoutSeconds) {}

HealthStatus HttpSegmentationOracle::probeHealth() {
    auto resp = client_.get("/health", healthTimeoutSeconds_);
    if (!resp.transportOk()) {
        HealthStatus h;
        h.error = "oracle unreachable at " + client_.baseUrl() + ": " + resp.curlError;
        return h;
    }
    HealthStatus h = parseHealthResponse(resp.httpCode, resp.body);
    if (h.reachable) {
        PLOGI << "HttpSegmentationOracle: " << h.service << " " << h.version << " is " << h.status;
    } else {
        PLOGW << "HttpSegmentationOracle: health check failed: " << h.error;
    }
    return h;
}

SegmentationOutcome HttpSegmentationOracle::segment(const SegmentationRequest& request) {
    PLOGI << "HttpSegmentationOracle: sending " << request.vertices.size() << " canonical vertices to "
          << request.endpoint();
    auto resp = client_.postJson(request.endpoint(), request.toJson());
    if (!resp.transportOk()) {
        return SegmentationOutcome::Failure(ErrorKind::BackendUnavailable,
                                            "segmentation backend unreachable: " + resp.curlError);
    }
    return parseSegmentationResponse(resp.httpCode, resp.body);
}

} // namespace MiniPainter
