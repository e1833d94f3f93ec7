// SegmentationOracle.hpp - typed boundary to the external segmentation service
#pragma once
#include <MiniPainter/SegmentationProtocol.hpp>

namespace MiniPainter {

/**
 * @brief External service that assigns canonical vertices to paint regions.
 *
 * Implementations perform no geometry of their own. segment() may be called
 * from a worker thread while probeHealth() runs on the caller; implementations
 * must not keep results across calls.
 */
class ISegmentationOracle
{
public:
    virtual ~ISegmentationOracle() = default;

    // Liveness check consumed before enabling uploads
    virtual HealthStatus probeHealth() = 0;

    // One request/response exchange; transport failures are reported as
    // BackendUnavailable, never thrown
    virtual SegmentationOutcome segment(const SegmentationRequest &request) = 0;
};

} // namespace MiniPainter
