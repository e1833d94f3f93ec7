#pragma once
#include <string>
#include <vector>
#include <array>
#include <cstdint>
#include <glm/glm.hpp>

namespace MiniPainter {

/**
 * @brief Linear RGB color in [0, 1] per channel.
 */
using Color = glm::vec3;

/**
 * @brief Interleaved RGB color per raw vertex (r,g,b, r,g,b, ...).
 *
 * Same length and order as the raw vertex buffer times three.
 */
using ColorBuffer = std::vector<float>;

/**
 * @brief Parse "#RRGGBB" (leading '#' optional, case-insensitive) into a color.
 * @return false and leaves out untouched if the text is not a 6-digit hex color
 */
bool parseHexColor(const std::string& text, Color& out);

/**
 * @brief Format a color as "#RRGGBB" (uppercase), channels rounded to 8 bits.
 */
std::string toHexColor(const Color& c);

/**
 * @brief Build a color from a packed 0xRRGGBB value.
 */
Color colorFromRgb24(uint32_t rgb);

/**
 * @brief Named entry of the paint palette offered to the user.
 */
struct PaletteEntry {
    const char* name;
    uint32_t rgb;
};

/**
 * @brief The fixed miniature paint palette, in display order.
 */
const std::array<PaletteEntry, 12>& paintPalette();

/**
 * @brief Palette color for a list position, wrapping around.
 */
Color paletteColorAt(size_t position);

} // namespace MiniPainter
