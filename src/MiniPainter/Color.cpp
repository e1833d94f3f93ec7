#include <MiniPainter/Color.hpp>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace MiniPainter {

static int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    return -1;
}

static uint8_t toByte(float channel) {
    float clamped = glm::clamp(channel, 0.0f, 1.0f);
    return static_cast<uint8_t>(std::lround(clamped * 255.0f));
}

bool parseHexColor(const std::string& text, Color& out) {
    size_t start = (!text.empty() && text[0] == '#') ? 1 : 0;
    if (text.size() - start != 6) return false;

    uint32_t rgb = 0;
    for (size_t i = start; i < text.size(); ++i) {
        int d = hexDigit(text[i]);
        if (d < 0) return false;
        rgb = (rgb << 4) | static_cast<uint32_t>(d);
    }
    out = colorFromRgb24(rgb);
    return true;
}

std::string toHexColor(const Color& c) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", toByte(c.r), toByte(c.g), toByte(c.b));
    return std::string(buf);
}

Color colorFromRgb24(uint32_t rgb) {
    return Color(static_cast<float>((rgb >> 16) & 0xFF) / 255.0f,
                 static_cast<float>((rgb >> 8) & 0xFF) / 255.0f,
                 static_cast<float>(rgb & 0xFF) / 255.0f);
}

const std::array<PaletteEntry, 12>& paintPalette() {
    static const std::array<PaletteEntry, 12> palette = {{
        {"Brown",        0x8B4513},
        {"Silver",       0xC0C0C0},
        {"Gold",         0xFFD700},
        {"Steel Blue",   0x4682B4},
        {"Dark Red",     0x8B0000},
        {"Forest Green", 0x228B22},
        {"Indigo",       0x4B0082},
        {"Tomato",       0xFF6347},
        {"Dark Slate",   0x2F4F4F},
        {"Khaki",        0xF0E68C},
        {"Purple",       0x800080},
        {"Black",        0x000000},
    }};
    return palette;
}

Color paletteColorAt(size_t position) {
    const auto& palette = paintPalette();
    return colorFromRgb24(palette[position % palette.size()].rgb);
}

} // namespace MiniPainter
