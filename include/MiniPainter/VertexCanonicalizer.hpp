#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <glm/glm.hpp>

namespace MiniPainter {

/**
 * @brief Fixed decimal precision used to form deduplication keys.
 *
 * Each coordinate is rounded to digits() decimals and the three results are
 * joined into a string key. Two positions whose keys are identical become one
 * canonical vertex, so points closer than the tolerance are merged on
 * purpose. The same policy instance must be used to build a canonical table
 * and to interpret any indices computed against it.
 */
class QuantizationPolicy {
public:
    static constexpr int kDefaultDigits = 6;
    static constexpr int kLegacyDigits = 4;
    static constexpr int kMinDigits = 1;
    static constexpr int kMaxDigits = 9;

    QuantizationPolicy() = default;
    // digits is clamped to [kMinDigits, kMaxDigits]
    explicit QuantizationPolicy(int digits);

    static QuantizationPolicy legacy() { return QuantizationPolicy(kLegacyDigits); }

    int digits() const { return digits_; }

    std::string makeKey(const glm::vec3& p) const;

    bool operator==(const QuantizationPolicy& o) const { return digits_ == o.digits_; }
    bool operator!=(const QuantizationPolicy& o) const { return digits_ != o.digits_; }

private:
    int digits_ = kDefaultDigits;
};

/**
 * @brief Unique-vertex table plus the maps between raw and canonical indices.
 *
 * Canonical indices are dense and assigned in first-seen order of the raw
 * scan. forwardMap is total over raw indices; reverseMap[c] lists, in
 * ascending order, every raw index whose key equals that of canonical c.
 */
struct CanonicalTable {
    QuantizationPolicy policy;
    std::vector<glm::vec3> positions;                 // first-seen raw position per canonical index
    std::vector<uint32_t> forwardMap;                 // raw index -> canonical index
    std::vector<std::vector<uint32_t>> reverseMap;    // canonical index -> raw indices

    size_t uniqueCount() const { return positions.size(); }
    size_t rawCount() const { return forwardMap.size(); }

    bool containsCanonical(int64_t canonical) const {
        return canonical >= 0 && static_cast<uint64_t>(canonical) < reverseMap.size();
    }

    /**
     * @brief Raw indices sharing a canonical position, or nullptr when the
     * index is outside [0, uniqueCount).
     */
    const std::vector<uint32_t>* rawIndicesOf(int64_t canonical) const {
        if (!containsCanonical(canonical)) return nullptr;
        return &reverseMap[static_cast<size_t>(canonical)];
    }
};

class VertexCanonicalizer {
public:
    /**
     * @brief Collapse a raw position buffer into a canonical table.
     *
     * Deterministic: the same input and policy always give the same
     * canonical order and grouping. Cannot fail.
     */
    static CanonicalTable canonicalize(const std::vector<glm::vec3>& rawPositions,
                                       const QuantizationPolicy& policy = QuantizationPolicy());
};

} // namespace MiniPainter
