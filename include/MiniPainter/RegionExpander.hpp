#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>
#include <MiniPainter/VertexCanonicalizer.hpp>

namespace MiniPainter {

/**
 * @brief Raw-vertex membership of one region, lifted from canonical indices.
 */
struct ExpandedRegion {
    std::vector<uint32_t> rawIndices;       // each raw index appears once
    std::vector<int64_t> skippedIndices;    // outside [0, uniqueCount)
    size_t duplicateIndices = 0;            // canonical indices listed more than once
};

class RegionExpander {
public:
    /**
     * @brief Expand a region's canonical indices into raw indices.
     *
     * For each canonical index c, every raw index in reverseMap[c] is
     * appended in ascending order. Repeated canonical indices contribute
     * once. Out-of-range (including negative) indices are skipped and
     * reported, never fatal.
     */
    static ExpandedRegion expand(const CanonicalTable& table, const std::vector<int64_t>& canonicalIndices);

    /**
     * @brief Expand several regions against the same table.
     */
    static std::vector<ExpandedRegion> expandAll(const CanonicalTable& table,
                                                 const std::vector<std::vector<int64_t>>& regions);
};

} // namespace MiniPainter
