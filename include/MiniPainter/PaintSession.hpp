#pragma once
#include <string>
#include <vector>
#include <memory>
#include <future>
#include <chrono>
#include <functional>
#include <cstdint>
#include <MiniPainter/Color.hpp>
#include <MiniPainter/Errors.hpp>
#include <MiniPainter/MeshDecoder.hpp>
#include <MiniPainter/MeshNormalizer.hpp>
#include <MiniPainter/VertexCanonicalizer.hpp>
#include <MiniPainter/SegmentationOracle.hpp>
#include <MiniPainter/PaintState.hpp>
#include <MiniPainter/ColorCompositor.hpp>

namespace MiniPainter {

struct SessionOptions {
    QuantizationPolicy quantization;
    bool normalize = true;
    float targetSize = 5.0f;
    std::string profile;                 // empty: plain /segment
    std::string detailLevel = "medium";
    Color defaultColor{ColorCompositor::kDefaultGray};
};

/**
 * @brief Geometry of one uploaded model; immutable once built.
 */
struct LoadedModel {
    std::string name;
    RawMesh mesh;
    CanonicalTable table;
    MeshStats stats;
};

struct RegionSummary {
    std::string id;
    std::string name;
    Color color{0.0f};         // resolved: override or base
    bool visible = true;
    bool overridden = false;
    size_t vertexCount = 0;    // raw vertices
    float percentage = 0.0f;
};

/**
 * @brief Read-only view handed to the renderer after each compositor run.
 *
 * Holds shared references, so it stays valid after the session moves on to
 * another buffer or model.
 */
struct RenderSnapshot {
    uint64_t generation = 0;
    std::shared_ptr<const LoadedModel> model;   // null before the first load
    std::shared_ptr<const ColorBuffer> colors;
    std::vector<RegionSummary> regions;
    std::string selectedRegion;

    bool hasModel() const { return model != nullptr; }
};

/**
 * @brief Owns the loaded model, its paint state and color buffer, and the
 * single outstanding segmentation request.
 *
 * Everything here runs on the caller's (event loop) thread except the oracle
 * call, which runs through std::async and is picked up by poll(). Each upload
 * takes a new generation number; a result whose generation is no longer
 * current is discarded. Failures never touch the previously loaded model.
 */
class PaintSession {
public:
    enum class UploadStatus {
        Started,          // decoded; oracle request in flight
        Busy,             // a request is already outstanding
        BackendOffline,   // oracle not reachable
        DecodeFailed      // FormatError or TruncatedError
    };

    using SnapshotListener = std::function<void(const RenderSnapshot&)>;

    explicit PaintSession(std::shared_ptr<ISegmentationOracle> oracle, SessionOptions options = SessionOptions());
    ~PaintSession();

    PaintSession(const PaintSession&) = delete;
    PaintSession& operator=(const PaintSession&) = delete;

    const SessionOptions& options() const { return options_; }

    // ---- Oracle reachability ----
    HealthStatus probeHealth();
    const HealthStatus& lastHealth() const { return health_; }
    bool oracleReachable() const { return health_.reachable; }
    // Upload control state: reachable and no request outstanding
    bool uploadEnabled() const { return oracleReachable() && !hasPending(); }

    // ---- Upload pipeline ----
    /**
     * @brief Decode, normalize and canonicalize a model, then send its
     * canonical vertices to the oracle in the background.
     *
     * If the oracle was last seen unreachable it is probed once first.
     * On any status other than Started the current model is untouched.
     */
    UploadStatus beginUpload(const std::vector<uint8_t>& bytes, const std::string& name);

    /**
     * @brief Install a finished oracle result if there is one.
     * @return true when a current-generation result (success or failure) was applied
     */
    bool poll();

    /**
     * @brief Block up to timeout for the outstanding request, then poll().
     */
    bool waitForPending(std::chrono::milliseconds timeout);

    /**
     * @brief Forget the outstanding request. Its result is discarded when it
     * arrives; the call itself is not cancelled.
     */
    void abandonPending();

    bool hasPending() const { return pending_ != nullptr; }
    uint64_t generation() const { return generation_; }

    // ---- Current state ----
    bool hasModel() const { return model_ != nullptr; }
    const LoadedModel* model() const { return model_.get(); }
    std::shared_ptr<const LoadedModel> sharedModel() const { return model_; }
    const PaintState& paintState() const { return paint_; }
    const ColorBuffer& colorBuffer() const { return *colors_; }
    const PipelineError& currentError() const { return error_; }
    void clearError() { error_ = PipelineError(); }

    // ---- Paint mutations; false for an unknown region id ----
    bool setVisibility(const std::string& regionId, bool visible);
    bool toggleVisibility(const std::string& regionId);
    bool setOverrideColor(const std::string& regionId, const Color& color);
    bool clearOverride(const std::string& regionId);
    void clearOverrides();
    bool moveRegion(const std::string& regionId, size_t newPosition);

    const std::string& selectedRegion() const { return selected_; }
    bool selectRegion(const std::string& regionId);

    RenderSnapshot snapshot() const;
    void setSnapshotListener(SnapshotListener listener) { listener_ = std::move(listener); }

private:
    struct PendingUpload {
        uint64_t generation = 0;
        std::shared_ptr<const LoadedModel> model;
        std::future<SegmentationOutcome> result;
    };

    void applyOutcome(std::shared_ptr<const LoadedModel> model, uint64_t generation, SegmentationOutcome outcome);
    void recomposite();
    void reapAbandoned();

    std::shared_ptr<ISegmentationOracle> oracle_;
    SessionOptions options_;
    ColorCompositor compositor_;
    HealthStatus health_;

    uint64_t generation_ = 0;
    uint64_t modelGeneration_ = 0;
    std::unique_ptr<PendingUpload> pending_;
    std::vector<std::unique_ptr<PendingUpload>> abandoned_;

    std::shared_ptr<const LoadedModel> model_;
    PaintState paint_;
    std::shared_ptr<const ColorBuffer> colors_;
    std::string selected_;
    PipelineError error_;
    SnapshotListener listener_;
};

const char* uploadStatusName(PaintSession::UploadStatus status);

} // namespace MiniPainter
