#pragma once

#include "mapstitch/geo/Coord.hpp"
#include "mapstitch/geo/Rect.hpp"

#include <cmath>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace mapstitch {

/// Snap `num` to a multiple of `mult`, rounding the quotient with `roundFn`
/// (std::floor → lower multiple, std::ceil → upper multiple).
template <class RoundFn>
[[nodiscard]] int snapNum(double num, int mult, RoundFn&& roundFn) {
    return mult * static_cast<int>(roundFn(num / mult));
}

/// Tag for Grid::map(): leave the origin untouched.
struct KeepOrigin {};
inline constexpr KeepOrigin keepOrigin{};

/*
  Rect + step interval + origin.

  The stepped coordinates along an axis are every origin + k*step that falls
  inside [x1, x2] (both ends inclusive). step == 0 means "no steps".
  The same type serves two purposes:
    - tile iteration (step = 1 tile, or 1 tile in pixels),
    - overlay intersections (step = user block interval).
*/
class Grid {
public:
    Grid() = default;
    explicit Grid(const Rect& rect, int step = 0, Coord2i origin = {0, 0});

    /// Smallest rect covering all points (inclusive bounds). Throws on an empty list.
    static Grid fromSteps(const std::vector<Coord2i>& points, int step = 0);

    [[nodiscard]] const Rect& rect() const noexcept { return rect_; }
    [[nodiscard]] int step() const noexcept { return step_; }
    [[nodiscard]] Coord2i origin() const noexcept { return origin_; }

    [[nodiscard]] std::vector<int> stepsX() const;
    [[nodiscard]] std::vector<int> stepsY() const;
    [[nodiscard]] std::size_t stepsCount() const;

    /// Cartesian product stepsX × stepsY, all y for each x.
    [[nodiscard]] std::vector<Coord2i> iterSteps() const;

    /// Same rect and origin; step kept unless overridden.
    [[nodiscard]] Grid copy(std::optional<int> step = std::nullopt) const;

    /* Apply fn to the rect. The origin keeps its relative position between
       the top-left and bottom-right corners (rounded to nearest). */
    template <class Fn>
    [[nodiscard]] Grid map(Fn&& fn) const {
        const Rect mapped = rect_.map(fn);
        return Grid(mapped, step_, relativeOrigin(mapped));
    }

    template <class Fn>
    [[nodiscard]] Grid map(Fn&& fn, KeepOrigin) const {
        return Grid(rect_.map(fn), step_, origin_);
    }

    template <class Fn>
    [[nodiscard]] Grid map(Fn&& fn, Coord2i newOrigin) const {
        return Grid(rect_.map(fn), step_, newOrigin);
    }

    [[nodiscard]] Grid resize(Coord2i dxdy, bool fromCenter = false) const;
    [[nodiscard]] Grid resize(int d, bool fromCenter = false) const { return resize(Coord2i{d, d}, fromCenter); }
    [[nodiscard]] Grid translateBy(Coord2i d) const;
    [[nodiscard]] Grid translateTo(Coord2i point) const;

    /// Nearest step multiple for each component; roundFn defaults to std::round.
    /// A grid without steps returns `c` unchanged.
    [[nodiscard]] Coord2i snapCoord(Coord2i c) const;
    template <class RoundFn>
    [[nodiscard]] Coord2i snapCoord(Coord2i c, RoundFn&& roundFn) const {
        if (step_ == 0) return c;
        return { snapNum(c.x, step_, roundFn), snapNum(c.y, step_, roundFn) };
    }

    /* Point on `other` with the same relative position inside its rect as
       `c` has inside this grid's rect. Linear between the top-left and
       bottom-right corners, truncated to int. */
    [[nodiscard]] Coord2i project(Coord2i c, const Grid& other) const;

    friend bool operator==(const Grid&, const Grid&) = default;

private:
    Coord2i relativeOrigin(const Rect& mapped) const;

    Rect    rect_{};
    int     step_{0};
    Coord2i origin_{};
};

std::string toString(const Grid& g);
std::ostream& operator<<(std::ostream& os, const Grid& g);

} // namespace mapstitch
