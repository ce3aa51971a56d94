#include "mapstitch/core/Color.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace mapstitch {

namespace {

struct NamedColor {
    std::string_view name;
    Color color;
};

constexpr NamedColor kNamedColors[] = {
    { "clear",       Color(  0,   0,   0,   0) },
    { "transparent", Color(  0,   0,   0,   0) },
    { "white",       Color(255, 255, 255) },
    { "black",       Color(  0,   0,   0) },
    { "red",         Color(255,   0,   0) },
    { "green",       Color(  0, 255,   0) },
    { "blue",        Color(  0,   0, 255) },
    { "yellow",      Color(255, 255,   0) },
    { "magenta",     Color(255,   0, 255) },
    { "cyan",        Color(  0, 255, 255) },
};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

int hexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace

Color Color::fromInts(int r, int g, int b, int a) {
    for (int v : { r, g, b, a }) {
        if (v < 0 || v > 255) {
            std::ostringstream os;
            os << "Channel values must be between 0 and 255: (" << r << ", " << g << ", " << b << ", " << a << ")";
            throw std::invalid_argument(os.str());
        }
    }
    return Color(std::uint8_t(r), std::uint8_t(g), std::uint8_t(b), std::uint8_t(a));
}

std::optional<std::string> Color::normalizeHex(const std::string& hex) {
    std::string h = lower(hex);
    if (!h.empty() && h.front() == '#') h.erase(0, 1);
    if (h.size() != 3 && h.size() != 6 && h.size() != 8) return std::nullopt;
    for (char c : h) if (hexNibble(c) < 0) return std::nullopt;

    if (h.size() == 3) {
        std::string doubled;
        for (char c : h) { doubled += c; doubled += c; }
        h = std::move(doubled);
    }
    if (h.size() == 6) h += "ff";
    return h;
}

Color Color::fromHex(const std::string& hex) {
    const auto h = normalizeHex(hex);
    if (!h) throw std::invalid_argument("Invalid hex colour '" + hex + "'; expected 3, 6 or 8 hex digits");
    auto channel = [&](std::size_t i) {
        return std::uint8_t(hexNibble((*h)[i]) * 16 + hexNibble((*h)[i + 1]));
    };
    return Color(channel(0), channel(2), channel(4), channel(6));
}

Color Color::fromName(const std::string& name, std::optional<std::uint8_t> alpha) {
    const std::string key = lower(name);
    for (const auto& nc : kNamedColors) {
        if (nc.name == key) {
            Color c = nc.color;
            if (alpha) c.alpha = *alpha;
            return c;
        }
    }
    throw std::invalid_argument("Unknown colour name '" + name + "'");
}

Color Color::fromString(const std::string& s) {
    if (normalizeHex(s)) return fromHex(s);
    return fromName(s);
}

std::string Color::asHex() const {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(8);
    for (std::uint8_t v : asRgba()) {
        out += digits[v >> 4];
        out += digits[v & 0x0F];
    }
    return out;
}

std::string toString(const Color& c) {
    std::ostringstream os;
    os << "Color<#" << c.asHex() << ">(" << int(c.red) << ", " << int(c.green)
       << ", " << int(c.blue) << ", " << int(c.alpha) << ")";
    return os.str();
}

} // namespace mapstitch
