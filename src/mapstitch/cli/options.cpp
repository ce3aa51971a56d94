#include "options.hpp"
#include "args.hpp"

#include "mapstitch/core/Color.hpp"
#include "mapstitch/core/Errors.hpp"

#include <stdexcept>

namespace fs = std::filesystem;
using namespace mapstitch;

static std::string required(int argc, char** argv, const std::string& key) {
    auto v = argFind(argc, argv, key);
    if (!v || v->empty()) throw ConfigError("missing required option --" + key + "=...");
    return *v;
}

static std::optional<Color> colorArg(int argc, char** argv, const std::string& key) {
    auto v = argFind(argc, argv, key);
    if (!v) return std::nullopt;
    try {
        return Color::fromString(*v);
    } catch (const std::invalid_argument& e) {
        throw ConfigError("--" + key + ": " + e.what());
    }
}

static std::optional<int> intArg(int argc, char** argv, const std::string& key) {
    if (!argFind(argc, argv, key)) return std::nullopt;
    return argValueInt(argc, argv, key, 0);
}

CombineCliOptions parseCombineArgs(int argc, char** argv) {
    CombineCliOptions o;
    o.tilesDir        = required(argc, argv, "tiles");
    o.request.world   = required(argc, argv, "world");
    o.request.zoom    = argValueInt(argc, argv, "zoom", -1);
    if (o.request.zoom < 0) throw ConfigError("missing required option --zoom=0..3");

    if (auto a = argFind(argc, argv, "area")) o.request.area = parseArea(*a);
    if (auto c = argFind(argc, argv, "crop")) o.request.crop = CropSpec::parse(*c);
    o.request.tileExt = argValue(argc, argv, "ext", "*");

    o.gridStep = argValueInt(argc, argv, "grid", 0);
    if (o.gridStep < 0) throw ConfigError("--grid must be a positive block interval");

    if (auto s = argFind(argc, argv, "style")) o.styleFile = fs::path(*s);
    o.bg           = colorArg(argc, argv, "bg");
    o.gridColor    = colorArg(argc, argv, "grid-color");
    o.textColor    = colorArg(argc, argv, "text-color");
    o.gridWidth    = intArg(argc, argv, "grid-width");
    o.textSize     = intArg(argc, argv, "text-size");
    o.coordsFormat = argFind(argc, argv, "coords-format");

    o.outDir = argValue(argc, argv, "out-dir", ".");
    o.outExt = argValue(argc, argv, "out-ext", "png");
    if (!o.outExt.empty() && o.outExt[0] == '.') o.outExt.erase(0, 1);
    if (o.outExt.empty()) throw ConfigError("--out-ext must not be empty");

    if (auto t = argFind(argc, argv, "timestamp")) o.timestampFormat = t->empty() ? kDefaultTimestampFormat : *t;
    else if (argHas(argc, argv, "timestamp"))     o.timestampFormat = kDefaultTimestampFormat;

    o.overwrite = argHas(argc, argv, "overwrite");
    o.assumeYes = argHas(argc, argv, "yes");
    o.progress  = argHas(argc, argv, "progress");
    o.manifest  = argHas(argc, argv, "manifest");
    return o;
}

CombinerStyle effectiveStyle(const std::optional<fs::path>& styleFile, const CombineCliOptions* ov) {
    CombinerStyle s = styleFile ? loadStyle(*styleFile) : CombinerStyle{};
    if (ov) {
        if (ov->bg)           s.bgColor          = *ov->bg;
        if (ov->gridColor)    s.gridLineColor    = *ov->gridColor;
        if (ov->textColor)    s.gridTextColor    = *ov->textColor;
        if (ov->gridWidth)    s.gridLineWidth    = *ov->gridWidth;
        if (ov->textSize)     s.gridTextSize     = *ov->textSize;
        if (ov->coordsFormat) s.gridCoordsFormat = *ov->coordsFormat;
    }
    validateStyle(s);
    return s;
}

fs::path outputPath(const CombineCliOptions& o, const std::string& timestamp) {
    const fs::path w(o.request.world);
    std::string world = w.is_absolute() ? w.filename().string() : o.request.world;
    if (world == "overworld" || world == "the_nether" || world == "the_end") world = "minecraft_" + world;

    const std::string prefix = timestamp.empty() ? std::string() : timestamp + "_";
    return o.outDir / (prefix + world + "-" + std::to_string(o.request.zoom) + "." + o.outExt);
}

fs::path uniquePath(const fs::path& path, bool overwrite) {
    if (overwrite || !fs::exists(path)) return path;
    const std::string stem = path.stem().string();
    const std::string ext  = path.extension().string();
    for (int n = 1;; ++n) {
        fs::path cand = path.parent_path() / (stem + "_" + std::to_string(n) + ext);
        if (!fs::exists(cand)) return cand;
    }
}
