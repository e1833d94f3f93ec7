#include <MiniPainter/ColorCompositor.hpp>

namespace MiniPainter {

ColorBuffer ColorCompositor::compose(const PaintState& state) const {
    ColorBuffer out;
    composeInto(state, out);
    return out;
}

void ColorCompositor::composeInto(const PaintState& state, ColorBuffer& out) const {
    const size_t n = state.rawVertexCount();
    out.resize(n * 3);
    for(size_t i = 0; i < n; ++i){
        out[i * 3 + 0] = defaultColor_.r;
        out[i * 3 + 1] = defaultColor_.g;
        out[i * 3 + 2] = defaultColor_.b;
    }

    for(const Region& region : state.regions()){
        if(!region.visible) continue;
        const Color c = state.resolvedColor(region);
        for(uint32_t raw : region.rawIndices){
            if(raw >= n) continue;
            const size_t o = static_cast<size_t>(raw) * 3;
            out[o + 0] = c.r;
            out[o + 1] = c.g;
            out[o + 2] = c.b;
        }
    }
}

} // namespace MiniPainter
