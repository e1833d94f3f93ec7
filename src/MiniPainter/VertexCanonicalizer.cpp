#include <MiniPainter/VertexCanonicalizer.hpp>
#include <plog/Log.h>
#include <algorithm>
#include <cstdio>
#include <unordered_map>

namespace MiniPainter {

QuantizationPolicy::QuantizationPolicy(int digits)
    : digits_(std::clamp(digits, kMinDigits, kMaxDigits)) {}

// Appends one fixed-precision coordinate; "-0.000000" is folded into "0.000000"
// so values rounding to zero on either side of it share a key.
static void appendCoord(std::string& key, float v, int digits) {
    char buf[64];
    int n = std::snprintf(buf, sizeof(buf), "%.*f", digits, static_cast<double>(v));
    if (n <= 0) return;
    const char* s = buf;
    if (buf[0] == '-') {
        bool allZero = true;
        for (int i = 1; i < n; ++i) {
            if (buf[i] != '0' && buf[i] != '.') { allZero = false; break; }
        }
        if (allZero) ++s;
    }
    key.append(s);
}

std::string QuantizationPolicy::makeKey(const glm::vec3& p) const {
    std::string key;
    key.reserve(48);
    appendCoord(key, p.x, digits_);
    key.push_back(',');
    appendCoord(key, p.y, digits_);
    key.push_back(',');
    appendCoord(key, p.z, digits_);
    return key;
}

CanonicalTable VertexCanonicalizer::canonicalize(const std::vector<glm::vec3>& rawPositions,
                                                 const QuantizationPolicy& policy) {
    CanonicalTable table;
    table.policy = policy;
    table.forwardMap.resize(rawPositions.size());

    std::unordered_map<std::string, uint32_t> keyToCanonical;
    keyToCanonical.reserve(rawPositions.size() / 3 + 1);

    for (size_t i = 0; i < rawPositions.size(); ++i) {
        std::string key = policy.makeKey(rawPositions[i]);
        auto it = keyToCanonical.find(key);
        uint32_t canonical;
        if (it == keyToCanonical.end()) {
            canonical = static_cast<uint32_t>(table.positions.size());
            keyToCanonical.emplace(std::move(key), canonical);
            table.positions.push_back(rawPositions[i]);
            table.reverseMap.emplace_back();
        } else {
            canonical = it->second;
        }
        table.forwardMap[i] = canonical;
        table.reverseMap[canonical].push_back(static_cast<uint32_t>(i));
    }

    PLOGI << "VertexCanonicalizer: " << rawPositions.size() << " raw -> " << table.uniqueCount()
          << " unique vertices (" << policy.digits() << " decimals)";
    return table;
}

} // namespace MiniPainter
