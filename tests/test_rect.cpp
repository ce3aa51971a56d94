// tests/test_rect.cpp

#include <doctest/doctest.h>

#include "mapstitch/geo/Rect.hpp"

#include <stdexcept>

using mapstitch::Coord2i;
using mapstitch::Rect;

TEST_CASE("Rect size and corners")
{
    const Rect r{-2, 1, 4, 9};
    CHECK(r.width() == 6);
    CHECK(r.height() == 8);
    CHECK(r.size() == Coord2i{6, 8});
    CHECK(r.topLeft() == Coord2i{-2, 1});
    CHECK(r.bottomRight() == Coord2i{4, 9});

    const auto c = r.corners();
    CHECK(c[0] == Coord2i{-2, 1});
    CHECK(c[1] == Coord2i{4, 1});
    CHECK(c[2] == Coord2i{-2, 9});
    CHECK(c[3] == Coord2i{4, 9});

    CHECK(Rect(0, 0, 5, 5).center() == Coord2i{2, 2});
    CHECK(Rect(-3, -3, 0, 0).center() == Coord2i{-2, -2});
}

TEST_CASE("Rect degenerate rects are legal values")
{
    CHECK(Rect(3, 3, 3, 7).isDegenerate());
    CHECK(Rect(0, 0, 0, 0).isDegenerate());
    CHECK_FALSE(Rect(0, 0, 1, 1).isDegenerate());
}

TEST_CASE("Rect::fromRadius and Rect::fromSize")
{
    CHECK(Rect::fromRadius(2) == Rect(-2, -2, 2, 2));
    CHECK(Rect::fromRadius(Coord2i{1, 3}, Coord2i{10, 10}) == Rect(9, 7, 11, 13));
    CHECK_THROWS_AS((void)Rect::fromRadius(0), std::invalid_argument);
    CHECK_THROWS_AS((void)Rect::fromRadius(Coord2i{1, -1}), std::invalid_argument);

    CHECK(Rect::fromSize(4, 2) == Rect(0, 0, 4, 2));
    CHECK(Rect::fromSize(4, 4, Coord2i{0, 0}) == Rect(-2, -2, 2, 2));
    // odd sizes grow toward the bottom-right
    CHECK(Rect::fromSize(3, 3, Coord2i{0, 0}) == Rect(-1, -1, 2, 2));
}

TEST_CASE("Rect::contains is inclusive on every edge")
{
    const Rect r{0, 0, 10, 10};
    CHECK(r.contains({0, 0}));
    CHECK(r.contains({10, 10}));
    CHECK(r.contains({5, 10}));
    CHECK_FALSE(r.contains({11, 5}));
    CHECK_FALSE(r.contains({-1, 0}));
}

TEST_CASE("Rect::map applies to each edge separately")
{
    CHECK(Rect(-1, -1, 1, 1).map([](int n) { return n * 512; }) == Rect(-512, -512, 512, 512));
    // floor division of the corners, not of the size
    CHECK(Rect(-1, -1, 1, 1).map([](int n) { return mapstitch::floorDiv(n, 2); }) == Rect(-1, -1, 0, 0));
}

TEST_CASE("Rect::resize grows the far corner or both sides")
{
    const Rect r{0, 0, 10, 10};
    CHECK(r.resize(2) == Rect(0, 0, 12, 12));
    CHECK(r.resize(-1) == Rect(0, 0, 9, 9));
    CHECK(r.resize(Coord2i{4, 0}, true) == Rect(-2, 0, 12, 10));
}

TEST_CASE("Rect translation")
{
    const Rect r{-5, -5, 5, 5};
    CHECK(r.translateBy({5, 1}) == Rect(0, -4, 10, 6));
    CHECK(r.translateTo({0, 0}) == Rect(0, 0, 10, 10));
}

TEST_CASE("Rect::intersect")
{
    const Rect a{0, 0, 10, 10};
    REQUIRE(a.intersect(Rect(5, -5, 20, 5)).has_value());
    CHECK(*a.intersect(Rect(5, -5, 20, 5)) == Rect(5, 0, 10, 5));
    CHECK_FALSE(a.intersect(Rect(10, 0, 20, 10)).has_value());   // touching edges only
    CHECK_FALSE(a.intersect(Rect(30, 30, 40, 40)).has_value());
}

TEST_CASE("Rect toString")
{
    CHECK(mapstitch::toString(Rect(0, 0, 2, 3)) == "Rect(0, 0, 2, 3, size=2x3)");
}

TEST_CASE("Rect::fromRadius is centred and twice the radius wide")
{
    const Coord2i centers[] = { {0, 0}, {-5, 3}, {1000, -1000}, {-4096, -4096} };
    const int radii[] = { 1, 2, 7, 100, 2048 };

    for (const Coord2i c : centers) {
        for (const int r : radii) {
            CAPTURE(c);
            CAPTURE(r);
            const Rect sq = Rect::fromRadius(r, c);
            CHECK(sq.width() == 2 * r);
            CHECK(sq.height() == 2 * r);
            CHECK(sq.center() == c);
        }
        const Rect wide = Rect::fromRadius(Coord2i{3, 8}, c);
        CHECK(wide.size() == Coord2i{6, 16});
        CHECK(wide.center() == c);
    }
}
