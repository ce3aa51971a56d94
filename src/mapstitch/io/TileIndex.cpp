#include "mapstitch/io/TileIndex.hpp"
#include "mapstitch/compose/Mosaic.hpp"
#include "mapstitch/core/Config.hpp"
#include "mapstitch/core/Errors.hpp"
#include "mapstitch/core/Log.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

namespace fs = std::filesystem;

namespace mapstitch {

// ---------------- helpers ----------------

static bool ieq(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i)
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    return true;
}

static std::string ext_of(const fs::path& p) {
    std::string e = p.extension().string();
    if (!e.empty() && e[0] == '.') e.erase(0, 1);
    return e;
}

static std::string strip_dot(std::string e) {
    if (!e.empty() && e[0] == '.') e.erase(0, 1);
    return e;
}

// ---------------- public ----------------

std::optional<Coord2i> parseTileName(const std::string& stem) {
    static const std::regex re(R"(^(-?\d+)_(-?\d+)$)");
    std::smatch m;
    if (!std::regex_match(stem, m, re)) return std::nullopt;
    try {
        return Coord2i{ std::stoi(m[1].str()), std::stoi(m[2].str()) };
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

TileMap scanTiles(const fs::path& zoomDir, const std::string& ext) {
    TileMap tiles;
    if (!fs::is_directory(zoomDir)) return tiles;

    const bool anyExt = (ext == "*");
    const std::string want = strip_dot(ext);

    for (const auto& de : fs::directory_iterator(zoomDir)) {
        if (!de.is_regular_file()) continue;
        if (!anyExt && !ieq(ext_of(de.path()), want)) continue;

        const auto idx = parseTileName(de.path().stem().string());
        if (!idx) {
            logDebug("tiles", "skipping " + de.path().filename().string());
            continue;
        }
        auto [it, fresh] = tiles.emplace(*idx, de.path());
        if (!fresh) {
            // same index with two extensions: keep the lexicographically first path
            logWarn("tiles", "duplicate tile " + toString(*idx) + ": " +
                    it->second.filename().string() + " / " + de.path().filename().string());
            if (de.path() < it->second) it->second = de.path();
        }
    }
    return tiles;
}

cv::Mat loadTile(const fs::path& path) {
    cv::Mat raw;
    try {
        raw = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw CombineError("cannot decode tile " + path.string() + ": " + e.what());
    }
    if (raw.empty()) throw CombineError("cannot decode tile " + path.string());

    cv::Mat bgra;
    try {
        bgra = toBgra8(raw);
    } catch (const std::invalid_argument& e) {
        throw CombineError("unsupported tile format in " + path.string() + ": " + e.what());
    }

    if (bgra.cols != kTilePixels || bgra.rows != kTilePixels) {
        throw CombineError("tile " + path.string() + " is " + std::to_string(bgra.cols) + "x" +
                           std::to_string(bgra.rows) + ", expected " + std::to_string(kTilePixels) +
                           "x" + std::to_string(kTilePixels));
    }
    return bgra;
}

std::vector<std::string> listWorlds(const fs::path& tilesDir) {
    std::vector<std::string> out;
    if (!fs::is_directory(tilesDir)) return out;
    for (const auto& de : fs::directory_iterator(tilesDir)) {
        if (!de.is_directory()) continue;
        const std::string name = de.path().filename().string();
        if (name.rfind("minecraft_", 0) == 0) out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace mapstitch
