#pragma once

#include <opencv2/core.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace mapstitch {

/// 8-bit-per-channel RGBA colour. Always stored fully expanded (alpha included).
struct Color {
    std::uint8_t red{0};
    std::uint8_t green{0};
    std::uint8_t blue{0};
    std::uint8_t alpha{255};

    constexpr Color() = default;
    constexpr Color(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a = 255)
        : red{r}, green{g}, blue{b}, alpha{a} {}

    /* Range-checked construction from ints; any channel outside [0,255]
       throws std::invalid_argument. */
    static Color fromInts(int r, int g, int b, int a = 255);

    /// "#RGB", "#RRGGBB" or "#RRGGBBAA" ('#' optional, case-insensitive).
    static Color fromHex(const std::string& hex);

    /// Named colour (clear/transparent, white, black, red, green, blue, yellow, magenta, cyan).
    /// `alpha` overrides the table's alpha when given.
    static Color fromName(const std::string& name, std::optional<std::uint8_t> alpha = std::nullopt);

    /// Hex code or name, whichever parses.
    static Color fromString(const std::string& s);

    /// 8-digit normalized hex ("rrggbbaa") for a valid code, nullopt otherwise.
    static std::optional<std::string> normalizeHex(const std::string& hex);

    [[nodiscard]] std::array<std::uint8_t, 4> asRgba() const { return { red, green, blue, alpha }; }
    [[nodiscard]] std::array<std::uint8_t, 3> asRgb()  const { return { red, green, blue }; }

    /// "rrggbbaa", no leading '#'.
    [[nodiscard]] std::string asHex() const;

    /// BGRA scalar for drawing on CV_8UC4 canvases.
    [[nodiscard]] cv::Scalar toScalar() const { return cv::Scalar(blue, green, red, alpha); }
    [[nodiscard]] cv::Vec4b  toVec4b()  const { return cv::Vec4b(blue, green, red, alpha); }

    [[nodiscard]] bool isClear() const noexcept { return alpha == 0; }

    friend constexpr bool operator==(const Color&, const Color&) = default;
};

std::string toString(const Color& c);

} // namespace mapstitch

template <>
struct std::hash<mapstitch::Color> {
    std::size_t operator()(const mapstitch::Color& c) const noexcept {
        return std::hash<std::uint32_t>{}(
            (std::uint32_t(c.red) << 24) | (std::uint32_t(c.green) << 16) |
            (std::uint32_t(c.blue) << 8) | std::uint32_t(c.alpha));
    }
};
