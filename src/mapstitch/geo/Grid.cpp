#include "mapstitch/geo/Grid.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace mapstitch {

namespace {

/* All origin + k*step inside [lo, hi], ascending.
   The lower bound snaps up and the upper bound snaps down, both relative to
   origin, so a step at exactly `origin` is always produced when origin is in range. */
std::vector<int> axisSteps(int lo, int hi, int step, int origin) {
    std::vector<int> out;
    if (step <= 0 || lo > hi) return out;
    const int first = origin + ceilDiv(lo - origin, step) * step;
    const int last  = origin + floorDiv(hi - origin, step) * step;
    if (first > last) return out;
    out.reserve(static_cast<std::size_t>((last - first) / step) + 1);
    for (int v = first; v <= last; v += step) out.push_back(v);
    return out;
}

/* Position of v inside [a, b] rescaled to a span of `len`.
   Multiplies before dividing so integer-ratio results stay exact.
   A zero-length source span maps everything to 0. */
double rescale(int v, int a, int b, int len) {
    return (b == a) ? 0.0 : double(v - a) * double(len) / double(b - a);
}

} // namespace

Grid::Grid(const Rect& rect, int step, Coord2i origin)
    : rect_(rect), step_(step), origin_(origin)
{
    if (step < 0) throw std::invalid_argument("Grid step must not be negative: " + std::to_string(step));
}

Grid Grid::fromSteps(const std::vector<Coord2i>& points, int step) {
    if (points.empty()) throw std::invalid_argument("Cannot create a Grid from an empty sequence of steps");
    Rect r{ points.front(), points.front() };
    for (const auto& p : points) {
        r.x1 = std::min(r.x1, p.x);
        r.y1 = std::min(r.y1, p.y);
        r.x2 = std::max(r.x2, p.x);
        r.y2 = std::max(r.y2, p.y);
    }
    return Grid(r, step);
}

std::vector<int> Grid::stepsX() const { return axisSteps(rect_.x1, rect_.x2, step_, origin_.x); }
std::vector<int> Grid::stepsY() const { return axisSteps(rect_.y1, rect_.y2, step_, origin_.y); }

std::size_t Grid::stepsCount() const {
    return stepsX().size() * stepsY().size();
}

std::vector<Coord2i> Grid::iterSteps() const {
    const auto xs = stepsX();
    const auto ys = stepsY();
    std::vector<Coord2i> out;
    out.reserve(xs.size() * ys.size());
    for (int x : xs)
        for (int y : ys)
            out.emplace_back(x, y);
    return out;
}

Grid Grid::copy(std::optional<int> step) const {
    return Grid(rect_, step.value_or(step_), origin_);
}

Grid Grid::resize(Coord2i dxdy, bool fromCenter) const {
    return Grid(rect_.resize(dxdy, fromCenter), step_, origin_);
}

Grid Grid::translateBy(Coord2i d) const {
    return Grid(rect_.translateBy(d), step_, origin_ + d);
}

Grid Grid::translateTo(Coord2i point) const {
    return Grid(rect_.translateTo(point), step_, origin_ - (rect_.topLeft() - point));
}

Coord2i Grid::snapCoord(Coord2i c) const {
    return snapCoord(c, [](double v) { return std::round(v); });
}

Coord2i Grid::project(Coord2i c, const Grid& other) const {
    const Rect& a = rect_;
    const Rect& b = other.rect_;
    const Coord2f offset{ rescale(c.x, a.x1, a.x2, b.width()), rescale(c.y, a.y1, a.y2, b.height()) };
    return (offset + Coord2f(b.topLeft())).asInt();
}

Coord2i Grid::relativeOrigin(const Rect& mapped) const {
    return { static_cast<int>(std::lround(rescale(origin_.x, rect_.x1, rect_.x2, mapped.width())  + mapped.x1)),
             static_cast<int>(std::lround(rescale(origin_.y, rect_.y1, rect_.y2, mapped.height()) + mapped.y1)) };
}

std::string toString(const Grid& g) {
    std::ostringstream os;
    os << "Grid(" << toString(g.rect()) << ", step=" << g.step() << ", origin=" << toString(g.origin()) << ")";
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const Grid& g) {
    return os << toString(g);
}

} // namespace mapstitch
