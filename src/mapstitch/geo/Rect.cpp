#include "mapstitch/geo/Rect.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace mapstitch {

Rect Rect::fromRadius(Coord2i radius, Coord2i center) {
    if (radius.x <= 0 || radius.y <= 0) {
        throw std::invalid_argument("Rect radius must be greater than zero in both directions: " + toString(radius));
    }
    return { center - radius, center + radius };
}

Rect Rect::fromSize(int width, int height, std::optional<Coord2i> center) {
    if (!center) return { 0, 0, width, height };
    return { center->x - width / 2,
             center->y - height / 2,
             center->x + width / 2 + width % 2,
             center->y + height / 2 + height % 2 };
}

Coord2i Rect::center() const {
    return { x1 + floorDiv(width(), 2), y1 + floorDiv(height(), 2) };
}

std::array<Coord2i, 4> Rect::corners() const {
    return { Coord2i{x1, y1}, Coord2i{x2, y1}, Coord2i{x1, y2}, Coord2i{x2, y2} };
}

bool Rect::contains(Coord2i c) const {
    return c.x >= x1 && c.x <= x2 && c.y >= y1 && c.y <= y2;
}

Rect Rect::resize(Coord2i dxdy, bool fromCenter) const {
    if (fromCenter) {
        const Coord2i half = floorDiv(dxdy, 2);
        return { x1 - half.x, y1 - half.y, x2 + half.x, y2 + half.y };
    }
    return { x1, y1, x2 + dxdy.x, y2 + dxdy.y };
}

Rect Rect::translateBy(Coord2i d) const {
    return { x1 + d.x, y1 + d.y, x2 + d.x, y2 + d.y };
}

Rect Rect::translateTo(Coord2i point) const {
    return translateBy(point - topLeft());
}

std::optional<Rect> Rect::intersect(const Rect& other) const {
    const Rect r{ std::max(x1, other.x1), std::max(y1, other.y1),
                  std::min(x2, other.x2), std::min(y2, other.y2) };
    if (r.x1 >= r.x2 || r.y1 >= r.y2) return std::nullopt;
    return r;
}

std::string toString(const Rect& r) {
    std::ostringstream os;
    os << "Rect(" << r.x1 << ", " << r.y1 << ", " << r.x2 << ", " << r.y2
       << ", size=" << r.width() << "x" << r.height() << ")";
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const Rect& r) {
    return os << toString(r);
}

} // namespace mapstitch
