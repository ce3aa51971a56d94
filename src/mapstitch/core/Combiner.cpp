#include "mapstitch/core/Combiner.hpp"
#include "mapstitch/compose/Overlay.hpp"
#include "mapstitch/core/Errors.hpp"
#include "mapstitch/core/Log.hpp"

#include <opencv2/core.hpp>
#include <opencv2/core/utility.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <mutex>
#include <regex>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace mapstitch {

// ---------------- parsing ----------------

CropSpec CropSpec::fixed(int width, int height) {
    if (width <= 0 || height <= 0) {
        throw ConfigError("crop size must be positive, got " + std::to_string(width) + "x" + std::to_string(height));
    }
    return { Mode::Fixed, width, height };
}

CropSpec CropSpec::parse(const std::string& text) {
    if (text == "auto") return autoTrim();

    static const std::regex re(R"(^(\d+)(?:[xX](\d+))?$)");
    std::smatch m;
    if (!std::regex_match(text, m, re)) {
        throw ConfigError("invalid crop '" + text + "', expected 'auto', 'WxH' or 'N'");
    }
    try {
        const int w = std::stoi(m[1].str());
        const int h = m[2].matched ? std::stoi(m[2].str()) : w;
        return fixed(w, h);
    } catch (const std::out_of_range&) {
        throw ConfigError("crop size out of range: " + text);
    }
}

Rect parseArea(const std::string& text) {
    static const std::regex re(R"(^\s*(-?\d+)\s*,\s*(-?\d+)\s*,\s*(-?\d+)\s*,\s*(-?\d+)\s*$)");
    std::smatch m;
    if (!std::regex_match(text, m, re)) {
        throw ConfigError("invalid area '" + text + "', expected X1,Y1,X2,Y2");
    }
    try {
        return { std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str()), std::stoi(m[4].str()) };
    } catch (const std::out_of_range&) {
        throw ConfigError("area coordinates out of range: " + text);
    }
}

// ---------------- helpers ----------------

namespace {

using Clock = std::chrono::steady_clock;

/* Lets a progress line through at most once per interval. */
class Throttle {
public:
    explicit Throttle(std::chrono::milliseconds every) : every_(every), last_(Clock::now()) {}
    bool due() {
        const auto now = Clock::now();
        if (now - last_ < every_) return false;
        last_ = now;
        return true;
    }
private:
    std::chrono::milliseconds every_;
    Clock::time_point         last_;
};

/* The area must cover at least one whole output pixel on each axis.
   Tile rects start on multiples of blocksPerPixel, so the cropped width is
   floor(x2 / bpp) - floor(x1 / bpp) whatever tiles surround the area. */
void checkArea(const Rect& area, int blocksPerPixel) {
    if (area.width() <= 0 || area.height() <= 0) {
        throw ConfigError("area must have x1 < x2 and y1 < y2, got " + toString(area));
    }
    const Coord2i px = floorDiv(area.bottomRight(), blocksPerPixel) - floorDiv(area.topLeft(), blocksPerPixel);
    if (px.x <= 0 || px.y <= 0) {
        throw ConfigError("area " + toString(area) + " is smaller than one pixel at " +
                          std::to_string(blocksPerPixel) + " blocks per pixel");
    }
}

std::string sizeText(Coord2i s) {
    return std::to_string(s.x) + "x" + std::to_string(s.y);
}

struct TileJob {
    fs::path path;
    Coord2i  pixel;
};

// tiles per parallel_for_ batch; progress is reported between batches
constexpr std::size_t kTileBatch = 256;

} // namespace

// ---------------- Combiner ----------------

Combiner::Combiner(fs::path tilesDir)
    : Combiner(std::move(tilesDir), Options{}) {}

Combiner::Combiner(fs::path tilesDir, Options opt)
    : tilesDir_(std::move(tilesDir)), opt_(std::move(opt))
{
    if (!fs::is_directory(tilesDir_)) {
        throw ConfigError("tiles directory " + tilesDir_.string() + " does not exist or is not a directory");
    }
    if (opt_.gridStep < 0) {
        throw ConfigError("grid step must not be negative: " + std::to_string(opt_.gridStep));
    }
    validateStyle(opt_.style);
    hersheyFace(opt_.style.gridTextFont); // unknown fonts fail here, not mid-render
}

std::vector<std::string> Combiner::worlds() const {
    return listWorlds(tilesDir_);
}

fs::path Combiner::resolveWorld(const std::string& world) const {
    if (world.empty()) throw ConfigError("no world given");

    const fs::path asGiven(world);
    fs::path dir = asGiven.is_absolute() ? asGiven : tilesDir_ / asGiven;

    if (!fs::is_directory(dir) && !asGiven.is_absolute() && world.rfind("minecraft_", 0) != 0) {
        const fs::path prefixed = tilesDir_ / ("minecraft_" + world);
        if (fs::is_directory(prefixed)) dir = prefixed;
    }

    if (!fs::is_directory(dir)) {
        std::ostringstream os;
        os << "world '" << world << "' not found (" << dir.string() << " is not a directory)";
        const auto known = worlds();
        if (!known.empty()) {
            os << "; available:";
            for (const auto& w : known) os << ' ' << w;
        }
        throw ConfigError(os.str());
    }
    return dir;
}

bool Combiner::confirm(const std::string& message) const {
    if (!opt_.confirm) return true;
    return opt_.confirm(message);
}

void Combiner::report(double fraction, const std::string& status) const {
    fraction = std::clamp(fraction, 0.0, 1.0);
    if (opt_.progress) {
        opt_.progress(fraction, status);
    } else if (opt_.showProgress) {
        logInfo("combine", std::to_string(static_cast<int>(std::lround(fraction * 100.0))) + "% " + status);
    }
}

Combiner::Layout Combiner::computeLayout(const TileMap& tiles, int zoom,
                                         const std::optional<Rect>& area, int gridStep)
{
    const int bpp  = zoomBlocksPerPixel(zoom);
    const int span = kTileBlocks * bpp;      // blocks per tile edge

    // inclusive tile indices
    Rect idx;
    if (area) {
        checkArea(*area, bpp);
        idx = { floorDiv(area->x1, span), floorDiv(area->y1, span),
                floorDiv(area->x2 - 1, span), floorDiv(area->y2 - 1, span) };
    } else {
        if (tiles.empty()) throw CombineError("no tiles to lay out");
        std::vector<Coord2i> keys;
        keys.reserve(tiles.size());
        for (const auto& kv : tiles) keys.push_back(kv.first);
        idx = Grid::fromSteps(keys).rect();
    }

    // A single tile is a zero-area rect here; pushing the far corner out by
    // one tile makes every rect cover whole tiles with an exclusive end.
    const Grid tileGrid(idx.resize(1), 1, {0, 0});

    Layout out;
    out.blocksPerPixel = bpp;
    out.tiles  = tileGrid;
    out.world  = tileGrid.map([span](int n) { return n * span; }, Coord2i{0, 0}).copy(gridStep);
    out.canvas = tileGrid.translateTo({0, 0}).map([](int n) { return n * kTilePixels; }).copy(kTilePixels);
    return out;
}

void Combiner::placeTiles(cv::Mat& canvas, const Layout& layout, const TileMap& tiles) const {
    const auto tileSteps  = layout.tiles.resize(-1).iterSteps();
    const auto pixelSteps = layout.canvas.resize(-kTilePixels).iterSteps();
    if (tileSteps.size() != pixelSteps.size()) {
        throw InternalError("tile grid has " + std::to_string(tileSteps.size()) +
                            " cells but canvas grid has " + std::to_string(pixelSteps.size()) + ".");
    }

    std::vector<TileJob> jobs;
    jobs.reserve(std::min(tiles.size(), tileSteps.size()));
    for (std::size_t i = 0; i < tileSteps.size(); ++i) {
        const auto it = tiles.find(tileSteps[i]);
        if (it == tiles.end()) continue;   // missing tile stays transparent
        jobs.push_back({ it->second, pixelSteps[i] });
    }
    logInfo("combine", "placing " + std::to_string(jobs.size()) + " of " +
                       std::to_string(tileSteps.size()) + " tile slots");

    auto paste = [&canvas](const TileJob& j) {
        const cv::Mat tile = loadTile(j.path);
        alphaComposite(canvas, tile, j.pixel);
    };

    Throttle throttle(opt_.config.progressInterval);
    report(0.0, "placing tiles");

    if (!opt_.config.parallelTiles) {
        for (std::size_t i = 0; i < jobs.size(); ++i) {
            paste(jobs[i]);
            if (throttle.due()) report(double(i + 1) / double(jobs.size()), "placing tiles");
        }
        report(1.0, "placing tiles");
        return;
    }

    // Tiles cover disjoint canvas ROIs, so workers never write the same pixel.
    const double nstripes = opt_.config.tileStripes > 0 ? double(opt_.config.tileStripes) : -1.0;
    std::mutex         errMtx;
    std::exception_ptr firstErr;

    for (std::size_t start = 0; start < jobs.size(); start += kTileBatch) {
        const std::size_t end = std::min(jobs.size(), start + kTileBatch);
        cv::parallel_for_(cv::Range(int(start), int(end)), [&](const cv::Range& r) {
            for (int i = r.start; i < r.end; ++i) {
                {
                    std::lock_guard<std::mutex> lk(errMtx);
                    if (firstErr) return;
                }
                try {
                    paste(jobs[std::size_t(i)]);
                } catch (...) {
                    // handed over to the calling thread below
                    std::lock_guard<std::mutex> lk(errMtx);
                    if (!firstErr) firstErr = std::current_exception();
                    return;
                }
            }
        }, nstripes);

        if (firstErr) std::rethrow_exception(firstErr);
        if (throttle.due()) report(double(end) / double(jobs.size()), "placing tiles");
    }
    report(1.0, "placing tiles");
}

void Combiner::drawOverlay(MapImage& map) const {
    // world-space rect of exactly the current raster
    const Grid canvasGrid(map.bounds());
    const Grid worldGrid(Rect(map.toWorldSpace({0, 0}), map.toWorldSpace(map.size())),
                         opt_.gridStep, {0, 0});

    const std::size_t total = worldGrid.stepsCount();
    if (total == 0) return;
    logInfo("overlay", std::to_string(total) + " grid intersections, step " + std::to_string(opt_.gridStep));

    if (total > opt_.config.overlayConfirmSteps) {
        const std::string msg = "The grid overlay has " + std::to_string(total) +
                                " intersections and may take a long time to draw. Continue?";
        logWarn("overlay", "grid step " + std::to_string(opt_.gridStep) + " gives " +
                           std::to_string(total) + " intersections");
        if (!confirm(msg)) {
            logInfo("overlay", "skipped");
            return;
        }
    }

    Throttle throttle(opt_.config.progressInterval);
    const bool verbose = total >= opt_.config.overlayProgressSteps;
    report(0.0, "drawing grid");

    drawGridOverlay(map.image, worldGrid, canvasGrid, opt_.style,
                    [&](std::size_t done, std::size_t all) {
                        if (verbose && throttle.due()) report(double(done) / double(all), "drawing grid");
                    });
    report(1.0, "drawing grid");
}

std::optional<MapImage> Combiner::combine(const CombineRequest& req) const {
    const auto t0 = Clock::now();

    const int bpp = zoomBlocksPerPixel(req.zoom);
    if (req.area) checkArea(*req.area, bpp);

    const fs::path worldDir = resolveWorld(req.world);
    const fs::path zoomDir  = worldDir / std::to_string(req.zoom);

    report(0.0, "scanning tiles");
    const TileMap tiles = scanTiles(zoomDir, req.tileExt);
    if (tiles.empty()) {
        throw CombineError("no tiles found in " + zoomDir.string() +
                           (req.tileExt == "*" ? std::string() : " with extension '" + req.tileExt + "'"));
    }
    logInfo("combine", "world " + worldDir.filename().string() + ", zoom " + std::to_string(req.zoom) +
                       ": " + std::to_string(tiles.size()) + " tiles");

    const Layout layout = computeLayout(tiles, req.zoom, req.area, opt_.gridStep);
    logDebug("combine", "tiles  " + toString(layout.tiles));
    logDebug("combine", "world  " + toString(layout.world));
    logDebug("combine", "canvas " + toString(layout.canvas));

    const Coord2i size = layout.canvas.rect().size();
    logInfo("combine", "estimated image size: " + sizeText(size));

    const int limit = opt_.config.largeImageWarnPx;
    if (size.x > limit || size.y > limit) {
        logWarn("combine", "image " + sizeText(size) + " exceeds " + std::to_string(limit) +
                           " px and may not open in common viewers");
        if (!confirm("The resulting image will be " + sizeText(size) + " pixels. Continue?")) {
            logInfo("combine", "aborted by user");
            return std::nullopt;
        }
    }

    MapImage map{ makeCanvas(size), layout.canvas.origin(), bpp };
    placeTiles(map.image, layout, tiles);

    if (req.area) {
        const Rect& w = layout.world.rect();
        const Rect& c = layout.canvas.rect();
        const Rect box{ c.topLeft()     + floorDiv(req.area->topLeft()     - w.topLeft(),     bpp),
                        c.bottomRight() + floorDiv(req.area->bottomRight() - w.bottomRight(), bpp) };
        logDebug("combine", "area crop " + toString(box));
        map = map.crop(box);
    }

    // taken before the overlay so grid lines never widen the trim
    std::optional<Rect> content;
    if (req.crop.mode == CropSpec::Mode::Auto) content = contentBounds(map.image);

    if (opt_.gridStep > 0) drawOverlay(map);

    switch (req.crop.mode) {
        case CropSpec::Mode::None:
            break;
        case CropSpec::Mode::Fixed:
            map = map.resizeCanvas(req.crop.width, req.crop.height);
            break;
        case CropSpec::Mode::Auto:
            if (content) map = map.crop(*content);
            else logWarn("combine", "image is fully transparent, auto crop skipped");
            break;
    }

    if (!opt_.style.bgColor.isClear()) fillBackground(map.image, opt_.style.bgColor);

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0).count();
    logInfo("combine", "done: " + sizeText(map.size()) + " in " + std::to_string(ms) + " ms");
    report(1.0, "done");
    return map;
}

} // namespace mapstitch
