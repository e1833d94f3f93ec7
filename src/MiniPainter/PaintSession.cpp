#include <MiniPainter/PaintSession.hpp>
#include <MiniPainter/MeshImporter.hpp>
#include <MiniPainter/RegionExpander.hpp>
#include <plog/Log.h>
#include <exception>
#include <utility>

namespace MiniPainter {

const char* uploadStatusName(PaintSession::UploadStatus status){
    switch(status){
        case PaintSession::UploadStatus::Started: return "Started";
        case PaintSession::UploadStatus::Busy: return "Busy";
        case PaintSession::UploadStatus::BackendOffline: return "BackendOffline";
        case PaintSession::UploadStatus::DecodeFailed: return "DecodeFailed";
    }
    return "Unknown";
}

PaintSession::PaintSession(std::shared_ptr<ISegmentationOracle> oracle, SessionOptions options)
    : oracle_(std::move(oracle)), options_(std::move(options)), compositor_(options_.defaultColor),
      colors_(std::make_shared<ColorBuffer>()) {}

// Outstanding std::async futures block here until their oracle call returns.
PaintSession::~PaintSession() = default;

HealthStatus PaintSession::probeHealth(){
    if(!oracle_){
        health_ = HealthStatus();
        health_.error = "no segmentation oracle configured";
        return health_;
    }
    health_ = oracle_->probeHealth();
    if(!health_.reachable){
        PLOGW << "PaintSession: oracle unreachable, uploads disabled: " << health_.error;
    }
    return health_;
}

PaintSession::UploadStatus PaintSession::beginUpload(const std::vector<uint8_t>& bytes, const std::string& name){
    reapAbandoned();
    if(pending_){
        PLOGW << "PaintSession: upload of '" << name << "' rejected, generation " << pending_->generation
              << " still pending";
        return UploadStatus::Busy;
    }
    if(!oracleReachable() && !probeHealth().reachable){
        error_ = PipelineError(ErrorKind::BackendUnavailable,
                               health_.error.empty() ? "segmentation backend unreachable" : health_.error);
        return UploadStatus::BackendOffline;
    }

    DecodeResult decoded = MeshImporter::importFromMemory(bytes, name);
    if(!decoded.success){
        PLOGE << "PaintSession: cannot load '" << name << "': " << decoded.error.describe();
        error_ = decoded.error;
        return UploadStatus::DecodeFailed;
    }
    for(const auto& w : decoded.warnings){
        PLOGW << "PaintSession: " << name << ": " << w;
    }

    auto model = std::make_shared<LoadedModel>();
    model->name = name;
    model->mesh = std::move(decoded.mesh);
    if(options_.normalize){
        model->stats.scaleApplied = normalizeMesh(model->mesh, options_.targetSize);
    }
    model->table = VertexCanonicalizer::canonicalize(model->mesh.positions, options_.quantization);
    model->stats.triangles = model->mesh.triangleCount();
    model->stats.rawVertices = model->mesh.vertexCount();
    model->stats.uniqueVertices = model->table.uniqueCount();
    model->stats.bounds = computeBounds(model->mesh);

    SegmentationRequest request;
    request.vertices = model->table.positions;
    request.profile = options_.profile;
    request.detailLevel = options_.detailLevel;

    pending_.reset(new PendingUpload());
    pending_->generation = ++generation_;
    pending_->model = model;
    std::shared_ptr<ISegmentationOracle> oracle = oracle_;
    pending_->result = std::async(std::launch::async, [oracle, request](){
        try {
            return oracle->segment(request);
        } catch(const std::exception& e){
            return SegmentationOutcome::Failure(ErrorKind::BackendUnavailable,
                                                std::string("segmentation call failed: ") + e.what());
        }
    });

    error_ = PipelineError();
    PLOGI << "PaintSession: '" << name << "' generation " << generation_ << ": " << model->stats.triangles
          << " triangles, " << model->stats.rawVertices << " raw / " << model->stats.uniqueVertices
          << " unique vertices sent for segmentation";
    return UploadStatus::Started;
}

bool PaintSession::poll(){
    reapAbandoned();
    if(!pending_) return false;
    if(pending_->result.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) return false;

    std::unique_ptr<PendingUpload> done = std::move(pending_);
    SegmentationOutcome outcome = done->result.get();
    if(done->generation != generation_){
        PLOGI << "PaintSession: discarding stale result for generation " << done->generation
              << " (current " << generation_ << ")";
        return false;
    }
    applyOutcome(done->model, done->generation, std::move(outcome));
    return true;
}

bool PaintSession::waitForPending(std::chrono::milliseconds timeout){
    if(pending_) pending_->result.wait_for(timeout);
    return poll();
}

void PaintSession::abandonPending(){
    if(!pending_) return;
    PLOGI << "PaintSession: abandoning generation " << pending_->generation;
    ++generation_;
    abandoned_.push_back(std::move(pending_));
}

// Drops abandoned requests whose calls have returned; the rest stay owned so
// their future destructors never block the event loop.
void PaintSession::reapAbandoned(){
    for(auto it = abandoned_.begin(); it != abandoned_.end();){
        if((*it)->result.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready){
            SegmentationOutcome stale = (*it)->result.get();
            PLOGI << "PaintSession: discarded stale " << (stale.success ? "result" : "failure")
                  << " for generation " << (*it)->generation;
            it = abandoned_.erase(it);
        } else {
            ++it;
        }
    }
}

void PaintSession::applyOutcome(std::shared_ptr<const LoadedModel> model, uint64_t generation, SegmentationOutcome outcome){
    if(!outcome.success){
        PLOGE << "PaintSession: segmentation of '" << model->name << "' failed: " << outcome.error.describe();
        if(outcome.error.kind == ErrorKind::BackendUnavailable){
            health_.reachable = false;
            health_.error = outcome.error.message;
        }
        error_ = outcome.error;
        return;
    }

    // Build the complete new state before replacing anything
    std::vector<Region> regions;
    regions.reserve(outcome.regions.size());
    for(size_t i = 0; i < outcome.regions.size(); ++i){
        OracleRegion& src = outcome.regions[i];
        Region r;
        r.id = src.id;
        r.name = src.name;
        r.description = src.description;
        r.baseColor = src.hasColor ? src.color : paletteColorAt(i);
        ExpandedRegion expanded = RegionExpander::expand(model->table, src.canonicalIndices);
        r.rawIndices = std::move(expanded.rawIndices);
        r.canonicalIndices = std::move(src.canonicalIndices);
        regions.push_back(std::move(r));
    }

    model_ = std::move(model);
    modelGeneration_ = generation;
    paint_.populate(std::move(regions), model_->mesh.vertexCount());
    selected_ = paint_.regions().empty() ? std::string() : paint_.regions().front().id;
    error_ = PipelineError();

    PLOGI << "PaintSession: '" << model_->name << "' segmented into " << paint_.regions().size() << " regions";
    for(const auto& r : paint_.regions()){
        PLOGI << "  " << r.id << " (" << r.name << "): " << r.vertexCount() << " vertices, "
              << paint_.coveragePercent(r) << "%";
    }
    recomposite();
}

void PaintSession::recomposite(){
    auto buffer = std::make_shared<ColorBuffer>();
    compositor_.composeInto(paint_, *buffer);
    colors_ = std::move(buffer);
    if(listener_) listener_(snapshot());
}

bool PaintSession::setVisibility(const std::string& regionId, bool visible){
    if(!paint_.setVisibility(regionId, visible)) return false;
    recomposite();
    return true;
}

bool PaintSession::toggleVisibility(const std::string& regionId){
    if(!paint_.toggleVisibility(regionId)) return false;
    recomposite();
    return true;
}

bool PaintSession::setOverrideColor(const std::string& regionId, const Color& color){
    if(!paint_.setOverrideColor(regionId, color)) return false;
    recomposite();
    return true;
}

bool PaintSession::clearOverride(const std::string& regionId){
    if(!paint_.clearOverride(regionId)) return false;
    recomposite();
    return true;
}

void PaintSession::clearOverrides(){
    paint_.clearOverrides();
    recomposite();
}

bool PaintSession::moveRegion(const std::string& regionId, size_t newPosition){
    if(!paint_.moveRegion(regionId, newPosition)) return false;
    recomposite();
    return true;
}

bool PaintSession::selectRegion(const std::string& regionId){
    if(!paint_.findRegion(regionId)) return false;
    selected_ = regionId;
    return true;
}

RenderSnapshot PaintSession::snapshot() const {
    RenderSnapshot s;
    s.generation = modelGeneration_;
    s.model = model_;
    s.colors = colors_;
    s.selectedRegion = selected_;
    s.regions.reserve(paint_.regions().size());
    for(const auto& r : paint_.regions()){
        RegionSummary rs;
        rs.id = r.id;
        rs.name = r.name;
        rs.color = paint_.resolvedColor(r);
        rs.visible = r.visible;
        rs.overridden = paint_.overrideFor(r.id) != nullptr;
        rs.vertexCount = r.vertexCount();
        rs.percentage = paint_.coveragePercent(r);
        s.regions.push_back(std::move(rs));
    }
    return s;
}

} // namespace MiniPainter
