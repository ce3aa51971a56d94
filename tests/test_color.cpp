// tests/test_color.cpp

#include <doctest/doctest.h>

#include "mapstitch/core/Color.hpp"

#include <stdexcept>
#include <unordered_set>

using mapstitch::Color;

TEST_CASE("Color::fromHex accepts 3, 6 and 8 digit codes")
{
    CHECK(Color::fromHex("#fff") == Color(255, 255, 255, 255));
    CHECK(Color::fromHex("f00") == Color(255, 0, 0, 255));
    CHECK(Color::fromHex("#00FF00") == Color(0, 255, 0, 255));
    CHECK(Color::fromHex("00ff0080") == Color(0, 255, 0, 128));

    CHECK_THROWS_AS((void)Color::fromHex("#12345"), std::invalid_argument);
    CHECK_THROWS_AS((void)Color::fromHex("xyz"), std::invalid_argument);
    CHECK_THROWS_AS((void)Color::fromHex(""), std::invalid_argument);
}

TEST_CASE("Color::normalizeHex")
{
    CHECK(Color::normalizeHex("#AbC") == std::optional<std::string>("aabbccff"));
    CHECK(Color::normalizeHex("11223344") == std::optional<std::string>("11223344"));
    CHECK_FALSE(Color::normalizeHex("nope").has_value());
}

TEST_CASE("Color::fromName with optional alpha override")
{
    CHECK(Color::fromName("clear").isClear());
    CHECK(Color::fromName("transparent").isClear());
    CHECK(Color::fromName("white") == Color(255, 255, 255));
    CHECK(Color::fromName("Red", 128) == Color(255, 0, 0, 128));
    CHECK_THROWS_AS((void)Color::fromName("chartreuse-ish"), std::invalid_argument);
}

TEST_CASE("Color::fromString tries hex then names")
{
    CHECK(Color::fromString("#000") == Color(0, 0, 0, 255));
    CHECK(Color::fromString("black") == Color(0, 0, 0, 255));
    CHECK(Color::fromString("cyan") == Color(0, 255, 255, 255));
    CHECK_THROWS_AS((void)Color::fromString("not a colour"), std::invalid_argument);
}

TEST_CASE("Color::fromInts range checks every channel")
{
    CHECK(Color::fromInts(1, 2, 3) == Color(1, 2, 3, 255));
    CHECK(Color::fromInts(1, 2, 3, 0).isClear());
    CHECK_THROWS_AS((void)Color::fromInts(256, 0, 0), std::invalid_argument);
    CHECK_THROWS_AS((void)Color::fromInts(0, 0, 0, -1), std::invalid_argument);
}

TEST_CASE("Color output forms")
{
    const Color c(0xab, 0xcd, 0xef);
    CHECK(c.asHex() == "abcdefff");
    CHECK(Color::fromHex(c.asHex()) == c);
    CHECK(c.asRgb()[2] == 0xef);
    CHECK(c.asRgba()[3] == 255);

    // OpenCV order is BGRA
    CHECK(Color(1, 2, 3, 4).toScalar() == cv::Scalar(3, 2, 1, 4));
    CHECK(Color(1, 2, 3, 4).toVec4b() == cv::Vec4b(3, 2, 1, 4));

    std::unordered_set<Color> s{ Color(1, 2, 3), Color(1, 2, 3), Color(1, 2, 3, 0) };
    CHECK(s.size() == 2);
}
