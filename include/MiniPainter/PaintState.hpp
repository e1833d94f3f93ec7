#pragma once
#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <cstddef>
#include <MiniPainter/Color.hpp>

namespace MiniPainter {

/**
 * @brief A named, colorable subset of the model's vertices.
 */
struct Region {
    std::string id;
    std::string name;
    std::string description;
    Color baseColor{0.5f};
    bool visible = true;
    std::vector<int64_t> canonicalIndices;   // as returned by the oracle
    std::vector<uint32_t> rawIndices;        // expanded through the reverse map

    size_t vertexCount() const { return rawIndices.size(); }
};

/**
 * @brief Ordered region list with visibility flags and user color overrides.
 *
 * List order is the overlap priority used by the compositor: when two
 * visible regions share a raw vertex, the one later in the list wins.
 *
 * States: Empty until populate(), then mutated in place. populate() replaces
 * the regions and drops every override at once; there is no partial reset.
 */
class PaintState {
public:
    void populate(std::vector<Region> regions, size_t rawVertexCount);
    void reset();

    bool empty() const { return !populated_; }
    size_t rawVertexCount() const { return rawVertexCount_; }

    const std::vector<Region>& regions() const { return regions_; }
    const Region* findRegion(const std::string& id) const;
    // Position in the list, or -1
    int indexOf(const std::string& id) const;

    // Mutations return false (and change nothing) for an unknown region id
    bool setVisibility(const std::string& id, bool visible);
    bool toggleVisibility(const std::string& id);
    bool setOverrideColor(const std::string& id, const Color& color);
    bool clearOverride(const std::string& id);
    void clearOverrides();

    /**
     * @brief Move a region to newPosition in the list (clamped to the end).
     */
    bool moveRegion(const std::string& id, size_t newPosition);

    const Color* overrideFor(const std::string& id) const;
    const std::map<std::string, Color>& overrides() const { return overrides_; }

    // Override if one is set, else the region's base color
    Color resolvedColor(const Region& region) const;

    // Share of raw vertices covered by the region, in percent
    float coveragePercent(const Region& region) const;

private:
    Region* findMutable(const std::string& id);

    std::vector<Region> regions_;
    std::map<std::string, Color> overrides_;
    size_t rawVertexCount_ = 0;
    bool populated_ = false;
};

} // namespace MiniPainter
