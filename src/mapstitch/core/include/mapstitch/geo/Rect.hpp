#pragma once

#include "mapstitch/geo/Coord.hpp"

#include <array>
#include <optional>
#include <ostream>
#include <string>

namespace mapstitch {

/*
  Axis-aligned integer rectangle: (x1, y1) top-left, (x2, y2) bottom-right.

  x1 <= x2 / y1 <= y2 is NOT enforced. Zero-area rects are legal values;
  callers that need a pixel canvas must check isDegenerate() first.
*/
struct Rect {
    int x1{0}, y1{0}, x2{0}, y2{0};

    constexpr Rect() = default;
    constexpr Rect(int x1_, int y1_, int x2_, int y2_) : x1{x1_}, y1{y1_}, x2{x2_}, y2{y2_} {}
    constexpr Rect(Coord2i tl, Coord2i br) : x1{tl.x}, y1{tl.y}, x2{br.x}, y2{br.y} {}

    /// Square (or rectangular) area of `radius` around `center`; radius must be > 0.
    static Rect fromRadius(Coord2i radius, Coord2i center = {0, 0});
    static Rect fromRadius(int radius, Coord2i center = {0, 0}) { return fromRadius(Coord2i{radius, radius}, center); }

    /// Rect of the given size, at (0,0) or centred on `center` (odd sizes extend to the bottom-right).
    static Rect fromSize(int width, int height, std::optional<Coord2i> center = std::nullopt);

    [[nodiscard]] constexpr int width()  const { return x2 - x1; }
    [[nodiscard]] constexpr int height() const { return y2 - y1; }
    [[nodiscard]] constexpr Coord2i size() const { return { width(), height() }; }
    [[nodiscard]] constexpr bool isDegenerate() const { return width() == 0 || height() == 0; }

    [[nodiscard]] constexpr Coord2i topLeft()     const { return { x1, y1 }; }
    [[nodiscard]] constexpr Coord2i bottomRight() const { return { x2, y2 }; }

    /// x1 + width//2, y1 + height//2
    [[nodiscard]] Coord2i center() const;

    /// (top-left, top-right, bottom-left, bottom-right)
    [[nodiscard]] std::array<Coord2i, 4> corners() const;

    /// Inclusive on all four edges.
    [[nodiscard]] bool contains(Coord2i c) const;

    /* Apply fn to x1, y1, x2, y2 independently. Not the same as scaling the
       size: floorDiv(x2) - floorDiv(x1) != floorDiv(x2 - x1) for negatives. */
    template <class Fn>
    [[nodiscard]] Rect map(Fn&& fn) const {
        return { static_cast<int>(fn(x1)), static_cast<int>(fn(y1)),
                 static_cast<int>(fn(x2)), static_cast<int>(fn(y2)) };
    }

    /* Grow by dxdy. Default keeps the top-left fixed and moves the
       bottom-right; fromCenter splits dxdy//2 to each side. */
    [[nodiscard]] Rect resize(Coord2i dxdy, bool fromCenter = false) const;
    [[nodiscard]] Rect resize(int d, bool fromCenter = false) const { return resize(Coord2i{d, d}, fromCenter); }

    [[nodiscard]] Rect translateBy(Coord2i d) const;
    /// Shift so the top-left corner lands on `point`.
    [[nodiscard]] Rect translateTo(Coord2i point) const;

    /// Overlap of two normalized rects; nullopt when they do not overlap.
    [[nodiscard]] std::optional<Rect> intersect(const Rect& other) const;

    friend constexpr bool operator==(const Rect&, const Rect&) = default;
};

std::string toString(const Rect& r);
std::ostream& operator<<(std::ostream& os, const Rect& r);

} // namespace mapstitch
