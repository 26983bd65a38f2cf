#pragma once

/**
 * @file color.h
 * @brief RGB color with HSV conversion and display encoding
 *
 * Colors are stored as floats in the 0-1 range. Hue arguments are in
 * degrees, matching the mapper's hue wheel (220 = cool blue, 20 = warm orange).
 *
 * @par Example
 * @code
 * Color c = Color::fromHSV(20.0f, 0.9f, 1.0f);
 * std::string hex = c.toHex();   // "#ff661a"
 * glm::vec3 rgb = c;             // implicit conversion
 * @endcode
 */

#include <glm/glm.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <string>

namespace lavamood {

class Color {
public:
    float r, g, b;

    /// @brief Default constructor (black)
    constexpr Color() : r(0.0f), g(0.0f), b(0.0f) {}

    constexpr Color(float r, float g, float b) : r(r), g(g), b(b) {}

    constexpr Color(const glm::vec3& v) : r(v.r), g(v.g), b(v.b) {}

    constexpr operator glm::vec3() const { return glm::vec3(r, g, b); }

    /**
     * @brief Create color from HSV values
     * @param hueDegrees Hue in degrees (wraps)
     * @param s Saturation (0-1)
     * @param v Value/brightness (0-1)
     */
    static Color fromHSV(float hueDegrees, float s, float v) {
        float h = std::fmod(hueDegrees, 360.0f);
        if (h < 0.0f) h += 360.0f;

        float c = v * s;
        float x = c * (1.0f - std::abs(std::fmod(h / 60.0f, 2.0f) - 1.0f));
        float m = v - c;

        float ri, gi, bi;
        if (h < 60.0f)       { ri = c; gi = x; bi = 0; }
        else if (h < 120.0f) { ri = x; gi = c; bi = 0; }
        else if (h < 180.0f) { ri = 0; gi = c; bi = x; }
        else if (h < 240.0f) { ri = 0; gi = x; bi = c; }
        else if (h < 300.0f) { ri = x; gi = 0; bi = c; }
        else                 { ri = c; gi = 0; bi = x; }

        return Color(ri + m, gi + m, bi + m);
    }

    /// @brief Convert glm HSV triple (hue in degrees) to RGB
    static Color fromHSV(const glm::vec3& hsv) { return fromHSV(hsv.x, hsv.y, hsv.z); }

    /// @brief True if every channel is a finite number
    bool isFinite() const {
        return std::isfinite(r) && std::isfinite(g) && std::isfinite(b);
    }

    /// @brief Channels clamped to 0-1 (non-finite channels become 0)
    Color clamped() const {
        auto c01 = [](float x) { return std::isfinite(x) ? std::clamp(x, 0.0f, 1.0f) : 0.0f; };
        return Color(c01(r), c01(g), c01(b));
    }

    /// @brief 8-bit channel value (0-255) after clamping
    static uint8_t toByte(float channel) {
        float c = std::isfinite(channel) ? std::clamp(channel, 0.0f, 1.0f) : 0.0f;
        return static_cast<uint8_t>(std::lround(c * 255.0f));
    }

    /// @brief Encode as "#rrggbb"
    std::string toHex() const {
        static const char* digits = "0123456789abcdef";
        std::string out = "#";
        for (float ch : {r, g, b}) {
            uint8_t v = toByte(ch);
            out += digits[v >> 4];
            out += digits[v & 0x0F];
        }
        return out;
    }

    bool operator==(const Color& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

} // namespace lavamood
