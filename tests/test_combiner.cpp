// tests/test_combiner.cpp
//
// End-to-end combines over synthesized tile directories.
//
// Fixture layout (zoom 3 = 1 block per pixel):
//
//        col -1   col 0
//   row -1  red    green
//   row  0  blue   white
//
// so world block (0, 0) is the centre of a 1024x1024 image.

#include <doctest/doctest.h>

#include "mapstitch/core/Combiner.hpp"
#include "mapstitch/core/Errors.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

#include "test_support/tile_fixture.hpp"

using mapstitch::Color;
using mapstitch::CombineError;
using mapstitch::CombineRequest;
using mapstitch::Combiner;
using mapstitch::ConfigError;
using mapstitch::Coord2i;
using mapstitch::CropSpec;
using mapstitch::Rect;
using testsupport::px;

namespace fs = std::filesystem;

namespace {

const cv::Vec4b kRed   = Color(255, 0, 0).toVec4b();
const cv::Vec4b kGreen = Color(0, 255, 0).toVec4b();
const cv::Vec4b kBlue  = Color(0, 0, 255).toVec4b();
const cv::Vec4b kWhite = Color(255, 255, 255).toVec4b();
const cv::Vec4b kBlack = Color(0, 0, 0).toVec4b();

struct Quadrants {
    testsupport::TempDir dir{"combine"};

    fs::path world() const { return dir.path() / "minecraft_overworld"; }
    fs::path zoom(int z) const { return world() / std::to_string(z); }

    explicit Quadrants(int z = 3, bool withWhite = true) {
        testsupport::writeTile(zoom(z), -1, -1, Color(255, 0, 0));
        testsupport::writeTile(zoom(z),  0, -1, Color(0, 255, 0));
        testsupport::writeTile(zoom(z), -1,  0, Color(0, 0, 255));
        if (withWhite) testsupport::writeTile(zoom(z), 0, 0, Color(255, 255, 255));
    }
};

CombineRequest request(int zoom = 3) {
    CombineRequest r;
    r.world = "minecraft_overworld";
    r.zoom  = zoom;
    return r;
}

Combiner::Options linesOnly(int step) {
    Combiner::Options opt;
    opt.gridStep = step;
    opt.style.gridCoordsFormat.clear();
    return opt;
}

} // namespace

TEST_CASE("Combiner places each tile at its quadrant")
{
    Quadrants q;
    const Combiner c(q.dir.path());
    const auto map = c.combine(request());

    REQUIRE(map.has_value());
    CHECK(map->size() == Coord2i{1024, 1024});
    CHECK(map->worldZero == Coord2i{512, 512});
    CHECK(map->blocksPerPixel == 1);
    CHECK(px(map->image, 256, 256) == kRed);
    CHECK(px(map->image, 768, 256) == kGreen);
    CHECK(px(map->image, 256, 768) == kBlue);
    CHECK(px(map->image, 768, 768) == kWhite);
    CHECK(px(map->image, 511, 511) == kRed);
    CHECK(px(map->image, 512, 512) == kWhite);
}

TEST_CASE("Combiner output is the same with and without the thread pool")
{
    Quadrants q;
    Combiner::Options serial;
    serial.config.parallelTiles = false;
    Combiner::Options pooled;
    pooled.config.tileStripes = 2;

    const auto a = Combiner(q.dir.path(), serial).combine(request());
    const auto b = Combiner(q.dir.path(), pooled).combine(request());
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(cv::norm(a->image, b->image, cv::NORM_INF) == 0.0);
}

TEST_CASE("Combiner crops to an area centred on the origin")
{
    Quadrants q;
    auto r = request();
    r.area = Rect(-256, -256, 256, 256);

    const auto map = Combiner(q.dir.path()).combine(r);
    REQUIRE(map.has_value());
    CHECK(map->size() == Coord2i{512, 512});
    CHECK(map->worldZero == Coord2i{256, 256});
    CHECK(px(map->image, 0, 0) == kRed);
    CHECK(px(map->image, 511, 0) == kGreen);
    CHECK(px(map->image, 0, 511) == kBlue);
    CHECK(px(map->image, 511, 511) == kWhite);
    CHECK(map->toCanvasSpace({0, 0}) == Coord2i{256, 256});
}

TEST_CASE("Combiner area crop at 2 blocks per pixel")
{
    Quadrants q(2);
    auto r = request(2);
    r.area = Rect(-512, -512, 512, 512);

    const auto map = Combiner(q.dir.path()).combine(r);
    REQUIRE(map.has_value());
    CHECK(map->size() == Coord2i{512, 512});
    CHECK(map->blocksPerPixel == 2);
    CHECK(map->worldZero == Coord2i{256, 256});
    CHECK(px(map->image, 255, 255) == kRed);
    CHECK(px(map->image, 256, 256) == kWhite);
}

TEST_CASE("Combiner area that covers a single tile")
{
    Quadrants q;
    auto r = request();
    r.area = Rect(10, 10, 20, 30);

    const auto map = Combiner(q.dir.path()).combine(r);
    REQUIRE(map.has_value());
    CHECK(map->size() == Coord2i{10, 20});
    CHECK(px(map->image, 0, 0) == kWhite);
    CHECK(map->worldZero == Coord2i{-10, -10});
}

TEST_CASE("Combiner rejects areas smaller than one output pixel")
{
    Quadrants q(0);                  // 8 blocks per pixel
    const Combiner c(q.dir.path());
    auto r = request(0);

    r.area = Rect(0, 0, 4, 4);
    CHECK_THROWS_AS((void)c.combine(r), ConfigError);
    r.area = Rect(1, 1, 7, 7);       // 6 blocks wide, but inside one pixel
    CHECK_THROWS_AS((void)c.combine(r), ConfigError);
    r.area = Rect(0, 0, 4, 64);
    CHECK_THROWS_AS((void)c.combine(r), ConfigError);
    CHECK_THROWS_AS((void)Combiner::computeLayout({}, 0, Rect(-7, -7, -1, -1), 0), ConfigError);

    // straddling a pixel boundary is enough
    r.area = Rect(4, 4, 12, 12);
    const auto map = c.combine(r);
    REQUIRE(map.has_value());
    CHECK(map->size() == Coord2i{1, 1});
    CHECK(px(map->image, 0, 0) == kWhite);
}

TEST_CASE("Combiner area outside all tiles is transparent, not an error")
{
    Quadrants q;
    auto r = request();
    r.area = Rect(5000, 5000, 5100, 5100);

    const auto map = Combiner(q.dir.path()).combine(r);
    REQUIRE(map.has_value());
    CHECK(map->size() == Coord2i{100, 100});
    CHECK(cv::countNonZero(map->image.reshape(1)) == 0);
}

TEST_CASE("Combiner leaves missing tiles transparent and fills the background")
{
    Quadrants q(3, /*withWhite=*/false);

    const auto bare = Combiner(q.dir.path()).combine(request());
    REQUIRE(bare.has_value());
    CHECK(bare->size() == Coord2i{1024, 1024});
    CHECK(px(bare->image, 768, 768)[3] == 0);
    CHECK(px(bare->image, 256, 256) == kRed);

    Combiner::Options opt;
    opt.style.bgColor = Color(0, 0, 0);
    const auto filled = Combiner(q.dir.path(), opt).combine(request());
    REQUIRE(filled.has_value());
    CHECK(px(filled->image, 768, 768) == kBlack);
    CHECK(px(filled->image, 256, 256) == kRed);
}

TEST_CASE("Combiner grid lines fall on world multiples of the step")
{
    Quadrants q;
    const auto map = Combiner(q.dir.path(), linesOnly(512)).combine(request());
    REQUIRE(map.has_value());

    // world x = -512, 0 -> pixel columns 0 and 512 (512 is the far edge)
    CHECK(px(map->image, 0, 100) == kBlack);
    CHECK(px(map->image, 512, 100) == kBlack);
    CHECK(px(map->image, 100, 512) == kBlack);
    CHECK(px(map->image, 511, 100) == kRed);
    CHECK(px(map->image, 513, 100) == kGreen);
    CHECK(px(map->image, 1023, 100) == kGreen);
}

TEST_CASE("Combiner grid follows the area crop")
{
    Quadrants q;
    auto r = request();
    r.area = Rect(-300, -300, 300, 300);

    const auto map = Combiner(q.dir.path(), linesOnly(100)).combine(r);
    REQUIRE(map.has_value());
    CHECK(map->size() == Coord2i{600, 600});
    // world x = -200, 0, 100 -> pixel 100, 300, 400
    CHECK(px(map->image, 100, 50) == kBlack);
    CHECK(px(map->image, 300, 50) == kBlack);
    CHECK(px(map->image, 400, 50) == kBlack);
    CHECK(px(map->image, 350, 50) == kGreen);
}

TEST_CASE("Combiner auto crop trims to content and ignores the grid")
{
    testsupport::TempDir dir("autocrop");
    cv::Mat tile(512, 512, CV_8UC4, cv::Scalar(0, 0, 0, 0));
    tile(cv::Rect(100, 100, 100, 100)).setTo(cv::Scalar(0, 0, 255, 255));
    testsupport::writeTileMat(dir.path() / "minecraft_overworld" / "3", 0, 0, tile);

    auto r = request();
    r.crop = CropSpec::autoTrim();

    const auto plain = Combiner(dir.path()).combine(r);
    REQUIRE(plain.has_value());
    CHECK(plain->size() == Coord2i{100, 100});
    CHECK(plain->worldZero == Coord2i{-100, -100});
    CHECK(px(plain->image, 0, 0) == kRed);
    CHECK(px(plain->image, 99, 99) == kRed);

    const auto gridded = Combiner(dir.path(), linesOnly(64)).combine(r);
    REQUIRE(gridded.has_value());
    CHECK(gridded->size() == Coord2i{100, 100});
}

TEST_CASE("Combiner auto crop on an empty image warns and keeps the canvas")
{
    testsupport::TempDir dir("autocrop_empty");
    testsupport::writeTile(dir.path() / "minecraft_overworld" / "3", 0, 0, Color(0, 0, 0, 0));

    auto r = request();
    r.crop = CropSpec::autoTrim();
    const auto map = Combiner(dir.path()).combine(r);
    REQUIRE(map.has_value());
    CHECK(map->size() == Coord2i{512, 512});
}

TEST_CASE("Combiner fixed crop centres and pads")
{
    Quadrants q;
    auto r = request();

    r.crop = CropSpec::fixed(512, 512);
    const auto small = Combiner(q.dir.path()).combine(r);
    REQUIRE(small.has_value());
    CHECK(small->size() == Coord2i{512, 512});
    CHECK(small->worldZero == Coord2i{256, 256});
    CHECK(px(small->image, 0, 0) == kRed);
    CHECK(px(small->image, 511, 511) == kWhite);

    r.crop = CropSpec::fixed(2048, 1024);
    const auto big = Combiner(q.dir.path()).combine(r);
    REQUIRE(big.has_value());
    CHECK(big->size() == Coord2i{2048, 1024});
    CHECK(big->worldZero == Coord2i{1024, 512});
    CHECK(px(big->image, 0, 0)[3] == 0);
    CHECK(px(big->image, 512, 0) == kRed);
}

TEST_CASE("Combiner asks before building very large images")
{
    Quadrants q;
    std::vector<std::string> asked;

    Combiner::Options opt;
    opt.config.largeImageWarnPx = 600;
    opt.confirm = [&](const std::string& m) { asked.push_back(m); return false; };
    CHECK_FALSE(Combiner(q.dir.path(), opt).combine(request()).has_value());
    REQUIRE(asked.size() == 1);
    CHECK(asked[0].find("1024x1024") != std::string::npos);

    opt.confirm = [](const std::string&) { return true; };
    CHECK(Combiner(q.dir.path(), opt).combine(request()).has_value());
}

TEST_CASE("Combiner skips a declined overlay but still returns the map")
{
    Quadrants q;
    auto opt = linesOnly(512);
    opt.config.overlayConfirmSteps = 4;   // 3x3 intersections
    opt.confirm = [](const std::string&) { return false; };

    const auto map = Combiner(q.dir.path(), opt).combine(request());
    REQUIRE(map.has_value());
    CHECK(px(map->image, 512, 100) == kGreen);
}

TEST_CASE("Combiner reports progress to the injected sink")
{
    Quadrants q;
    std::vector<std::pair<double, std::string>> seen;
    Combiner::Options opt;
    opt.progress = [&](double f, const std::string& s) { seen.emplace_back(f, s); };

    REQUIRE(Combiner(q.dir.path(), opt).combine(request()).has_value());
    REQUIRE_FALSE(seen.empty());
    CHECK(seen.back().first == doctest::Approx(1.0));
    CHECK(seen.back().second == "done");
    for (const auto& [f, s] : seen) {
        CHECK(f >= 0.0);
        CHECK(f <= 1.0);
    }
}

TEST_CASE("Combiner resolves short world names and lists worlds")
{
    Quadrants q;
    const Combiner c(q.dir.path());
    CHECK(c.worlds() == std::vector<std::string>{"minecraft_overworld"});
    CHECK(c.resolveWorld("overworld").filename() == "minecraft_overworld");
    CHECK(c.resolveWorld(q.world().string()) == q.world());

    auto r = request();
    r.world = "overworld";
    CHECK(c.combine(r).has_value());
}

TEST_CASE("Combiner configuration errors")
{
    Quadrants q;
    CHECK_THROWS_AS((void)Combiner(q.dir.path() / "missing"), ConfigError);

    const Combiner c(q.dir.path());
    CHECK_THROWS_AS((void)c.combine(request(5)), ConfigError);
    CHECK_THROWS_AS((void)c.combine(request(-1)), ConfigError);

    auto r = request();
    r.world = "the_nether";
    CHECK_THROWS_AS((void)c.combine(r), ConfigError);

    r = request();
    r.area = Rect(10, 10, 10, 20);
    CHECK_THROWS_AS((void)c.combine(r), ConfigError);

    Combiner::Options badFont;
    badFont.style.gridTextFont = "Comic Sans";
    CHECK_THROWS_AS((void)Combiner(q.dir.path(), badFont), ConfigError);

    Combiner::Options badStep;
    badStep.gridStep = -5;
    CHECK_THROWS_AS((void)Combiner(q.dir.path(), badStep), ConfigError);
}

TEST_CASE("Combiner data errors")
{
    Quadrants q;
    const Combiner c(q.dir.path());

    // zoom 1 has no tiles
    CHECK_THROWS_AS((void)c.combine(request(1)), CombineError);

    // extension filter that matches nothing
    auto r = request();
    r.tileExt = "webp";
    CHECK_THROWS_AS((void)c.combine(r), CombineError);

    // a tile that exists but cannot be decoded
    testsupport::writeJunk(testsupport::tilePath(q.zoom(3), 1, 1));
    CHECK_THROWS_AS((void)c.combine(request()), CombineError);

    Combiner::Options serial;
    serial.config.parallelTiles = false;
    CHECK_THROWS_AS((void)Combiner(q.dir.path(), serial).combine(request()), CombineError);
}

TEST_CASE("Combiner::computeLayout keeps the three spaces aligned")
{
    mapstitch::TileMap tiles;
    tiles.emplace(Coord2i{-1, -1}, fs::path("a"));
    tiles.emplace(Coord2i{0, 0}, fs::path("b"));

    const auto l = Combiner::computeLayout(tiles, 3, std::nullopt, 512);
    CHECK(l.tiles.rect() == Rect(-1, -1, 1, 1));
    CHECK(l.world.rect() == Rect(-512, -512, 512, 512));
    CHECK(l.world.origin() == Coord2i{0, 0});
    CHECK(l.world.step() == 512);
    CHECK(l.canvas.rect() == Rect(0, 0, 1024, 1024));
    CHECK(l.canvas.origin() == Coord2i{512, 512});
    CHECK(l.canvas.step() == 512);

    // a one-pixel area inside one zoom-0 tile still yields one whole tile
    const auto one = Combiner::computeLayout({}, 0, Rect(0, 0, 8, 8), 0);
    CHECK(one.tiles.rect() == Rect(0, 0, 1, 1));
    CHECK(one.world.rect() == Rect(0, 0, 4096, 4096));
    CHECK(one.canvas.rect() == Rect(0, 0, 512, 512));
    CHECK(one.blocksPerPixel == 8);

    CHECK_THROWS_AS((void)Combiner::computeLayout({}, 3, std::nullopt, 0), CombineError);
}

TEST_CASE("CropSpec::parse and parseArea")
{
    CHECK(CropSpec::parse("auto") == CropSpec::autoTrim());
    CHECK(CropSpec::parse("800x600") == CropSpec::fixed(800, 600));
    CHECK(CropSpec::parse("256") == CropSpec::fixed(256, 256));
    CHECK_THROWS_AS((void)CropSpec::parse("0x10"), ConfigError);
    CHECK_THROWS_AS((void)CropSpec::parse("-5x5"), ConfigError);
    CHECK_THROWS_AS((void)CropSpec::parse("wide"), ConfigError);

    CHECK(mapstitch::parseArea("-256,-256,256,256") == Rect(-256, -256, 256, 256));
    CHECK(mapstitch::parseArea(" 1, 2 ,3,4") == Rect(1, 2, 3, 4));
    CHECK_THROWS_AS((void)mapstitch::parseArea("1,2,3"), ConfigError);
    CHECK_THROWS_AS((void)mapstitch::parseArea("a,b,c,d"), ConfigError);
}
