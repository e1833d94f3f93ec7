#pragma once
#include <MiniPainter/SegmentationOracle.hpp>
#include <MiniPainter/OracleHttpClient.hpp>

namespace MiniPainter {

/**
 * @brief Segmentation oracle reached over HTTP (GET /health, POST /segment).
 */
class HttpSegmentationOracle : public ISegmentationOracle {
public:
    explicit HttpSegmentationOracle(OracleHttpClient client, long healthTimeoutSeconds = 5);

    HealthStatus probeHealth() override;
    SegmentationOutcome segment(const SegmentationRequest& request) override;

    const OracleHttpClient& client() const { return client_; }

private:
    OracleHttpClient client_;
    long healthTimeoutSeconds_;
};

} // namespace MiniPainter
