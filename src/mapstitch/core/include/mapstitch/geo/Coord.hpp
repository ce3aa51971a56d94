#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace mapstitch {

/// Деление с округлением к минус бесконечности (как `//` для отрицательных чисел).
[[nodiscard]] constexpr int floorDiv(int a, int b) {
    const int q = a / b;
    return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
}

/// Остаток со знаком делителя, парный к floorDiv: a == floorDiv(a, b) * b + floorMod(a, b).
[[nodiscard]] constexpr int floorMod(int a, int b) {
    return a - floorDiv(a, b) * b;
}

/// Деление с округлением к плюс бесконечности.
[[nodiscard]] constexpr int ceilDiv(int a, int b) {
    return -floorDiv(-a, b);
}

/// Integer power. Negative exponents would leave the integer domain.
[[nodiscard]] constexpr int ipow(int base, int exp) {
    if (exp < 0) throw std::invalid_argument("ipow: negative exponent");
    int r = 1;
    while (exp-- > 0) r *= base;
    return r;
}

/// 2D integer point. Used for tile indices, world block coordinates and
/// canvas pixel coordinates alike; which space a value lives in is decided
/// by the Grid it came from.
struct Coord2i {
    int x{0};
    int y{0};

    constexpr Coord2i() = default;
    constexpr Coord2i(int x_, int y_) : x{x_}, y{y_} {}

    /* Build from floating values that must already be whole numbers
       (3.0 is fine, 3.5 throws std::invalid_argument). No implicit floor. */
    static Coord2i fromWhole(double x, double y);

    template <class Fn>
    [[nodiscard]] Coord2i map(Fn&& fn) const {
        return { static_cast<int>(fn(x)), static_cast<int>(fn(y)) };
    }

    constexpr Coord2i& operator+=(const Coord2i& o) { x += o.x; y += o.y; return *this; }
    constexpr Coord2i& operator-=(const Coord2i& o) { x -= o.x; y -= o.y; return *this; }

    friend constexpr bool operator==(const Coord2i&, const Coord2i&) = default;
    friend constexpr auto operator<=>(const Coord2i&, const Coord2i&) = default;
};

[[nodiscard]] constexpr Coord2i operator+(Coord2i a, Coord2i b) { return { a.x + b.x, a.y + b.y }; }
[[nodiscard]] constexpr Coord2i operator-(Coord2i a, Coord2i b) { return { a.x - b.x, a.y - b.y }; }
[[nodiscard]] constexpr Coord2i operator*(Coord2i a, Coord2i b) { return { a.x * b.x, a.y * b.y }; }

[[nodiscard]] constexpr Coord2i operator+(Coord2i a, int s) { return { a.x + s, a.y + s }; }
[[nodiscard]] constexpr Coord2i operator-(Coord2i a, int s) { return { a.x - s, a.y - s }; }
[[nodiscard]] constexpr Coord2i operator*(Coord2i a, int s) { return { a.x * s, a.y * s }; }
[[nodiscard]] constexpr Coord2i operator+(int s, Coord2i a) { return { s + a.x, s + a.y }; }
[[nodiscard]] constexpr Coord2i operator-(int s, Coord2i a) { return { s - a.x, s - a.y }; }
[[nodiscard]] constexpr Coord2i operator*(int s, Coord2i a) { return { s * a.x, s * a.y }; }
[[nodiscard]] constexpr Coord2i operator-(Coord2i a) { return { -a.x, -a.y }; }

[[nodiscard]] constexpr Coord2i floorDiv(Coord2i a, Coord2i b) { return { floorDiv(a.x, b.x), floorDiv(a.y, b.y) }; }
[[nodiscard]] constexpr Coord2i floorDiv(Coord2i a, int s)     { return { floorDiv(a.x, s), floorDiv(a.y, s) }; }

// `/` and `%` floor like the free functions above, so world blocks divide into
// pixels and tiles the same way on both sides of zero.
[[nodiscard]] constexpr Coord2i operator/(Coord2i a, Coord2i b) { return floorDiv(a, b); }
[[nodiscard]] constexpr Coord2i operator/(Coord2i a, int s)     { return floorDiv(a, s); }
[[nodiscard]] constexpr Coord2i operator%(Coord2i a, Coord2i b) { return { floorMod(a.x, b.x), floorMod(a.y, b.y) }; }
[[nodiscard]] constexpr Coord2i operator%(Coord2i a, int s)     { return { floorMod(a.x, s), floorMod(a.y, s) }; }
[[nodiscard]] constexpr Coord2i pow(Coord2i a, Coord2i e)      { return { ipow(a.x, e.x), ipow(a.y, e.y) }; }
[[nodiscard]] constexpr Coord2i pow(Coord2i a, int e)          { return { ipow(a.x, e), ipow(a.y, e) }; }

/// Floating 2D point. Only used for intermediate ratios (Grid::project).
struct Coord2f {
    double x{0.0};
    double y{0.0};

    constexpr Coord2f() = default;
    constexpr Coord2f(double x_, double y_) : x{x_}, y{y_} {}
    constexpr explicit Coord2f(Coord2i c) : x{double(c.x)}, y{double(c.y)} {}

    /// Truncates both components toward zero.
    [[nodiscard]] constexpr Coord2i asInt() const {
        return { static_cast<int>(x), static_cast<int>(y) };
    }

    /// Rounds both components with `fn` (std::floor, std::round, ...).
    template <class RoundFn>
    [[nodiscard]] Coord2i asInt(RoundFn&& fn) const {
        return { static_cast<int>(fn(x)), static_cast<int>(fn(y)) };
    }

    friend constexpr bool operator==(const Coord2f&, const Coord2f&) = default;
};

[[nodiscard]] constexpr Coord2f operator+(Coord2f a, Coord2f b) { return { a.x + b.x, a.y + b.y }; }
[[nodiscard]] constexpr Coord2f operator-(Coord2f a, Coord2f b) { return { a.x - b.x, a.y - b.y }; }
[[nodiscard]] constexpr Coord2f operator*(Coord2f a, Coord2f b) { return { a.x * b.x, a.y * b.y }; }
[[nodiscard]] constexpr Coord2f operator/(Coord2f a, Coord2f b) { return { a.x / b.x, a.y / b.y }; }
[[nodiscard]] constexpr Coord2f operator*(Coord2f a, double s)  { return { a.x * s, a.y * s }; }
[[nodiscard]] constexpr Coord2f operator/(Coord2f a, double s)  { return { a.x / s, a.y / s }; }

/// "(x, y)"
std::string toString(Coord2i c);
std::ostream& operator<<(std::ostream& os, const Coord2i& c);

} // namespace mapstitch

template <>
struct std::hash<mapstitch::Coord2i> {
    std::size_t operator()(const mapstitch::Coord2i& c) const noexcept {
        const std::size_t hx = std::hash<int>{}(c.x);
        const std::size_t hy = std::hash<int>{}(c.y);
        return hx ^ (hy + 0x9e3779b97f4a7c15ULL + (hx << 6) + (hx >> 2));
    }
};
