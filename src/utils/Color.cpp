/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/Color.hpp"
#include <algorithm>
#include <cmath>

namespace CurveLights {
namespace Color {

namespace {

float hueToChannel(float p, float q, float t) {
    if (t < 0.0f) t += 1.0f;
    if (t > 1.0f) t -= 1.0f;
    if (t < 1.0f / 6.0f) return p + (q - p) * 6.0f * t;
    if (t < 0.5f) return q;
    if (t < 2.0f / 3.0f) return p + (q - p) * 6.0f * (2.0f / 3.0f - t);
    return p;
}

uint8_t toByte(float channel) {
    return static_cast<uint8_t>(std::lround(std::clamp(channel, 0.0f, 1.0f) * 255.0f));
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

uint32_t fromHSL(float hue, float saturation, float lightness) {
    float h = hue - std::floor(hue);
    float s = std::clamp(saturation, 0.0f, 1.0f);
    float l = std::clamp(lightness, 0.0f, 1.0f);

    if (s == 0.0f) {
        uint8_t grey = toByte(l);
        return pack(grey, grey, grey);
    }

    float q = (l <= 0.5f) ? l * (1.0f + s) : l + s - l * s;
    float p = 2.0f * l - q;

    return pack(toByte(hueToChannel(p, q, h + 1.0f / 3.0f)),
                toByte(hueToChannel(p, q, h)),
                toByte(hueToChannel(p, q, h - 1.0f / 3.0f)));
}

std::optional<uint32_t> parseHexColor(const std::string& text) {
    size_t start = (!text.empty() && text[0] == '#') ? 1 : 0;
    size_t digits = text.size() - start;
    if (digits != 6 && digits != 8) {
        return std::nullopt;
    }

    uint32_t value = 0;
    for (size_t i = start; i < text.size(); ++i) {
        int nibble = hexValue(text[i]);
        if (nibble < 0) {
            return std::nullopt;
        }
        value = (value << 4) | static_cast<uint32_t>(nibble);
    }

    if (digits == 6) {
        value = (value << 8) | 0xFF;
    }
    return value;
}

std::string toHexString(uint32_t rgba) {
    static const char* HEX = "0123456789abcdef";
    std::string result = "#";
    for (int shift = 28; shift >= 8; shift -= 4) {
        result += HEX[(rgba >> shift) & 0xF];
    }
    return result;
}

} // namespace Color
} // namespace CurveLights
