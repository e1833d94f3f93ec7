#include <MiniPainter/RegionExpander.hpp>
#include <plog/Log.h>

namespace MiniPainter {

ExpandedRegion RegionExpander::expand(const CanonicalTable& table, const std::vector<int64_t>& canonicalIndices){
    ExpandedRegion out;
    std::vector<bool> seen(table.uniqueCount(), false);

    size_t reserve = 0;
    for(int64_t c : canonicalIndices){
        if(auto raws = table.rawIndicesOf(c)) reserve += raws->size();
    }
    out.rawIndices.reserve(reserve);

    for(int64_t c : canonicalIndices){
        const std::vector<uint32_t>* raws = table.rawIndicesOf(c);
        if(!raws){
            out.skippedIndices.push_back(c);
            continue;
        }
        size_t slot = static_cast<size_t>(c);
        if(seen[slot]){
            ++out.duplicateIndices;
            continue;
        }
        seen[slot] = true;
        // reverseMap sets are disjoint, so raw indices cannot repeat across
        // distinct canonical indices
        out.rawIndices.insert(out.rawIndices.end(), raws->begin(), raws->end());
    }

    if(!out.skippedIndices.empty()){
        PLOGW << "RegionExpander: skipped " << out.skippedIndices.size()
              << " canonical indices outside [0, " << table.uniqueCount() << ")";
    }
    return out;
}

std::vector<ExpandedRegion> RegionExpander::expandAll(const CanonicalTable& table,
                                                      const std::vector<std::vector<int64_t>>& regions){
    std::vector<ExpandedRegion> out;
    out.reserve(regions.size());
    for(const auto& r : regions) out.push_back(expand(table, r));
    return out;
}

} // namespace MiniPainter
