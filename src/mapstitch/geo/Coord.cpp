#include "mapstitch/geo/Coord.hpp"

#include <cmath>
#include <sstream>

namespace mapstitch {

Coord2i Coord2i::fromWhole(double x, double y) {
    if (std::trunc(x) != x || std::trunc(y) != y) {
        std::ostringstream os;
        os << "Coord2i components must be whole numbers: (" << x << ", " << y << ")";
        throw std::invalid_argument(os.str());
    }
    return { static_cast<int>(x), static_cast<int>(y) };
}

std::string toString(Coord2i c) {
    std::ostringstream os;
    os << '(' << c.x << ", " << c.y << ')';
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const Coord2i& c) {
    return os << toString(c);
}

} // namespace mapstitch
