#include "mapstitch/core/Style.hpp"
#include "mapstitch/core/Errors.hpp"

#include <opencv2/core/persistence.hpp>

#include <fstream>
#include <sstream>
#include <vector>

namespace mapstitch {

namespace {

Color readColor(const cv::FileNode& n, const std::string& key) {
    try {
        if (n.isString()) return Color::fromString(static_cast<std::string>(n));
        if (n.isSeq()) {
            std::vector<int> ch;
            n >> ch;
            if (ch.size() == 3) return Color::fromInts(ch[0], ch[1], ch[2]);
            if (ch.size() == 4) return Color::fromInts(ch[0], ch[1], ch[2], ch[3]);
        }
    } catch (const std::invalid_argument& e) {
        throw ConfigError("style: bad colour for '" + key + "': " + e.what());
    }
    throw ConfigError("style: '" + key + "' must be a colour string or a list of 3-4 integers");
}

int readInt(const cv::FileNode& n, const std::string& key) {
    if (!n.isInt()) throw ConfigError("style: '" + key + "' must be an integer");
    return static_cast<int>(n);
}

std::string readString(const cv::FileNode& n, const std::string& key) {
    if (!n.isString()) throw ConfigError("style: '" + key + "' must be a string");
    return static_cast<std::string>(n);
}

void readInto(const cv::FileStorage& fs, CombinerStyle& s) {
    auto has = [&](const char* key) { return !fs[key].empty(); };

    if (has("background_color"))       s.bgColor             = readColor (fs["background_color"], "background_color");
    if (has("grid_line_color"))        s.gridLineColor       = readColor (fs["grid_line_color"], "grid_line_color");
    if (has("grid_line_width"))        s.gridLineWidth       = readInt   (fs["grid_line_width"], "grid_line_width");
    if (has("grid_text_font"))         s.gridTextFont        = readString(fs["grid_text_font"], "grid_text_font");
    if (has("grid_text_size"))         s.gridTextSize        = readInt   (fs["grid_text_size"], "grid_text_size");
    if (has("grid_text_color"))        s.gridTextColor       = readColor (fs["grid_text_color"], "grid_text_color");
    if (has("grid_text_stroke_width")) s.gridTextStrokeWidth = readInt   (fs["grid_text_stroke_width"], "grid_text_stroke_width");
    if (has("grid_text_stroke_color")) s.gridTextStrokeColor = readColor (fs["grid_text_stroke_color"], "grid_text_stroke_color");
    // an empty format is legal (labels off), so it is read even when blank
    if (has("grid_coords_format"))     s.gridCoordsFormat    = readString(fs["grid_coords_format"], "grid_coords_format");
}

} // namespace

void validateStyle(const CombinerStyle& s) {
    if (s.gridLineWidth < 0)       throw ConfigError("style: grid_line_width must be >= 0");
    if (s.gridTextSize <= 0)       throw ConfigError("style: grid_text_size must be > 0");
    if (s.gridTextStrokeWidth < 0) throw ConfigError("style: grid_text_stroke_width must be >= 0");
}

CombinerStyle styleFromJson(const std::string& json, const CombinerStyle& base) {
    CombinerStyle s = base;
    try {
        cv::FileStorage fs(json, cv::FileStorage::READ | cv::FileStorage::MEMORY | cv::FileStorage::FORMAT_JSON);
        if (!fs.isOpened()) throw ConfigError("style: could not parse JSON");
        readInto(fs, s);
    } catch (const cv::Exception& e) {
        throw ConfigError(std::string("style: invalid JSON: ") + e.what());
    }
    validateStyle(s);
    return s;
}

std::string styleToJson(const CombinerStyle& s) {
    cv::FileStorage fs(".json", cv::FileStorage::WRITE | cv::FileStorage::MEMORY | cv::FileStorage::FORMAT_JSON);
    fs << "background_color"       << s.bgColor.asHex();
    fs << "grid_line_color"        << s.gridLineColor.asHex();
    fs << "grid_line_width"        << s.gridLineWidth;
    fs << "grid_text_font"         << s.gridTextFont;
    fs << "grid_text_size"         << s.gridTextSize;
    fs << "grid_text_color"        << s.gridTextColor.asHex();
    fs << "grid_text_stroke_width" << s.gridTextStrokeWidth;
    fs << "grid_text_stroke_color" << s.gridTextStrokeColor.asHex();
    fs << "grid_coords_format"     << s.gridCoordsFormat;
    return fs.releaseAndGetString();
}

CombinerStyle loadStyle(const std::filesystem::path& path, const CombinerStyle& base) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw ConfigError("style: no file could be found at " + path.string());
    std::ostringstream buf;
    buf << f.rdbuf();
    return styleFromJson(buf.str(), base);
}

void saveStyle(const CombinerStyle& style, const std::filesystem::path& path) {
    std::ofstream f(path, std::ios::binary);
    if (!f) throw ConfigError("style: cannot write " + path.string());
    f << styleToJson(style);
    if (!f) throw ConfigError("style: write failed for " + path.string());
}

} // namespace mapstitch
