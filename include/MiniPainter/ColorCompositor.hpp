#pragma once
#include <MiniPainter/Color.hpp>
#include <MiniPainter/PaintState.hpp>

namespace MiniPainter {

/**
 * @brief Rebuilds the per-vertex color buffer from paint state.
 *
 * Pure function of (raw vertex count, region list, visibility, overrides):
 *  1. every raw vertex gets the default color
 *  2. visible regions are applied in list order, each writing its resolved
 *     color over all of its raw indices
 * Later regions therefore win on shared vertices, and a hidden region leaves
 * whatever the earlier regions or the default put there.
 */
class ColorCompositor {
public:
    static constexpr float kDefaultGray = 0.5f;

    ColorCompositor() = default;
    explicit ColorCompositor(const Color& defaultColor) : defaultColor_(defaultColor) {}

    const Color& defaultColor() const { return defaultColor_; }
    void setDefaultColor(const Color& c) { defaultColor_ = c; }

    ColorBuffer compose(const PaintState& state) const;

    // Same as compose() but reuses the caller's storage
    void composeInto(const PaintState& state, ColorBuffer& out) const;

private:
    Color defaultColor_{kDefaultGray};
};

} // namespace MiniPainter
