/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLOR_HPP
#define COLOR_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace CurveLights {

/**
 * @brief Helpers for packed RGBA colors (0xRRGGBBAA)
 */
namespace Color {

constexpr uint32_t WHITE = 0xFFFFFFFF;
constexpr uint32_t BLACK = 0x000000FF;

inline uint8_t red(uint32_t rgba) { return static_cast<uint8_t>((rgba >> 24) & 0xFF); }
inline uint8_t green(uint32_t rgba) { return static_cast<uint8_t>((rgba >> 16) & 0xFF); }
inline uint8_t blue(uint32_t rgba) { return static_cast<uint8_t>((rgba >> 8) & 0xFF); }
inline uint8_t alpha(uint32_t rgba) { return static_cast<uint8_t>(rgba & 0xFF); }

inline uint32_t pack(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 0xFF) {
    return (static_cast<uint32_t>(r) << 24) | (static_cast<uint32_t>(g) << 16) |
           (static_cast<uint32_t>(b) << 8) | static_cast<uint32_t>(a);
}

/**
 * @brief Converts HSL (all components in [0,1], hue wraps) to packed opaque RGBA
 */
uint32_t fromHSL(float hue, float saturation, float lightness);

/**
 * @brief Parses "#rrggbb" or "#rrggbbaa" (leading '#' optional)
 * @return Packed color, or std::nullopt when the string is malformed
 */
std::optional<uint32_t> parseHexColor(const std::string& text);

/**
 * @brief Formats a packed color as "#rrggbb"
 */
std::string toHexString(uint32_t rgba);

} // namespace Color
} // namespace CurveLights

#endif // COLOR_HPP
