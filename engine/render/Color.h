// Simple color helper.
#pragma once

#include <cstdint>

namespace Engine {

struct Color {
    unsigned char r{0};
    unsigned char g{0};
    unsigned char b{0};
    unsigned char a{255};

    // 0xRRGGBB, the layout config files use.
    static Color fromHex(std::uint32_t rgb, unsigned char alpha = 255) {
        return Color{static_cast<unsigned char>((rgb >> 16) & 0xFF), static_cast<unsigned char>((rgb >> 8) & 0xFF),
                     static_cast<unsigned char>(rgb & 0xFF), alpha};
    }

    Color withAlpha(unsigned char alpha) const { return Color{r, g, b, alpha}; }
};

}  // namespace Engine
