/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLOR_HPP
#define COLOR_HPP

#include <cstdint>

namespace DinerEngine {

/**
 * @brief RGBA color with normalized float channels (0.0 - 1.0)
 */
struct Color {
    float r{1.0f};
    float g{1.0f};
    float b{1.0f};
    float a{1.0f};

    constexpr Color() = default;
    constexpr Color(float red, float green, float blue, float alpha = 1.0f)
        : r(red), g(green), b(blue), a(alpha) {}

    /**
     * @brief Builds an opaque color from a 0xRRGGBB literal
     */
    static constexpr Color fromHex(uint32_t hex) {
        return Color(static_cast<float>((hex & 0xFF0000u) >> 16) / 255.0f,
                     static_cast<float>((hex & 0x00FF00u) >> 8) / 255.0f,
                     static_cast<float>(hex & 0x0000FFu) / 255.0f,
                     1.0f);
    }

    constexpr Color withAlpha(float alpha) const { return Color(r, g, b, alpha); }

    constexpr bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    // 0-255 channel helpers for byte-oriented backends
    uint8_t r8() const { return toByte(r); }
    uint8_t g8() const { return toByte(g); }
    uint8_t b8() const { return toByte(b); }
    uint8_t a8() const { return toByte(a); }

private:
    static uint8_t toByte(float v) {
        if (v <= 0.0f) return 0;
        if (v >= 1.0f) return 255;
        return static_cast<uint8_t>(v * 255.0f + 0.5f);
    }
};

// Palette
namespace Colors {
inline constexpr Color Red = Color::fromHex(0xab3722);
inline constexpr Color Blue = Color::fromHex(0x263cab);
inline constexpr Color Green = Color::fromHex(0x36a632);
inline constexpr Color Purple = Color::fromHex(0x732c91);
inline constexpr Color Orange = Color::fromHex(0xe05600);
inline constexpr Color Brown = Color::fromHex(0x4a2d1a);
inline constexpr Color Yellow = Color::fromHex(0xf5f06e);
inline constexpr Color DarkGrey = Color::fromHex(0x1c1b18);
inline constexpr Color LightGrey = Color::fromHex(0x636363);
inline constexpr Color White = Color::fromHex(0xffffff);
} // namespace Colors

} // namespace DinerEngine

#endif // COLOR_HPP
