#include <MiniPainter/PaintState.hpp>
#include <plog/Log.h>
#include <algorithm>
#include <utility>

namespace MiniPainter {

void PaintState::populate(std::vector<Region> regions, size_t rawVertexCount){
    for(auto& r : regions) r.visible = true;
    regions_ = std::move(regions);
    overrides_.clear();
    rawVertexCount_ = rawVertexCount;
    populated_ = true;
    PLOGD << "PaintState: populated " << regions_.size() << " regions over " << rawVertexCount_ << " raw vertices";
}

void PaintState::reset(){
    regions_.clear();
    overrides_.clear();
    rawVertexCount_ = 0;
    populated_ = false;
}

const Region* PaintState::findRegion(const std::string& id) const {
    for(const auto& r : regions_) if(r.id == id) return &r;
    return nullptr;
}

Region* PaintState::findMutable(const std::string& id){
    for(auto& r : regions_) if(r.id == id) return &r;
    return nullptr;
}

int PaintState::indexOf(const std::string& id) const {
    for(size_t i = 0; i < regions_.size(); ++i) if(regions_[i].id == id) return static_cast<int>(i);
    return -1;
}

bool PaintState::setVisibility(const std::string& id, bool visible){
    Region* r = findMutable(id);
    if(!r) return false;
    r->visible = visible;
    return true;
}

bool PaintState::toggleVisibility(const std::string& id){
    Region* r = findMutable(id);
    if(!r) return false;
    r->visible = !r->visible;
    return true;
}

bool PaintState::setOverrideColor(const std::string& id, const Color& color){
    if(!findRegion(id)) return false;
    overrides_[id] = color;
    return true;
}

bool PaintState::clearOverride(const std::string& id){
    if(!findRegion(id)) return false;
    overrides_.erase(id);
    return true;
}

void PaintState::clearOverrides(){
    overrides_.clear();
}

bool PaintState::moveRegion(const std::string& id, size_t newPosition){
    int from = indexOf(id);
    if(from < 0) return false;
    size_t to = std::min(newPosition, regions_.size() - 1);
    size_t src = static_cast<size_t>(from);
    if(src == to) return true;
    // rotate keeps the relative order of every other region
    if(src < to){
        std::rotate(regions_.begin() + src, regions_.begin() + src + 1, regions_.begin() + to + 1);
    } else {
        std::rotate(regions_.begin() + to, regions_.begin() + src, regions_.begin() + src + 1);
    }
    return true;
}

const Color* PaintState::overrideFor(const std::string& id) const {
    auto it = overrides_.find(id);
    return it == overrides_.end() ? nullptr : &it->second;
}

Color PaintState::resolvedColor(const Region& region) const {
    const Color* o = overrideFor(region.id);
    return o ? *o : region.baseColor;
}

float PaintState::coveragePercent(const Region& region) const {
    if(rawVertexCount_ == 0) return 0.0f;
    return 100.0f * static_cast<float>(region.rawIndices.size()) / static_cast<float>(rawVertexCount_);
}

} // namespace MiniPainter
