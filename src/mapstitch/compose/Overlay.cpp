#include "mapstitch/compose/Overlay.hpp"
#include "mapstitch/core/Errors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <set>
#include <string_view>
#include <utility>

namespace mapstitch {

int hersheyFace(const std::string& name) {
    static const std::pair<std::string_view, int> faces[] = {
        { "simplex",        cv::FONT_HERSHEY_SIMPLEX        },
        { "plain",          cv::FONT_HERSHEY_PLAIN          },
        { "duplex",         cv::FONT_HERSHEY_DUPLEX         },
        { "complex",        cv::FONT_HERSHEY_COMPLEX        },
        { "triplex",        cv::FONT_HERSHEY_TRIPLEX        },
        { "complex_small",  cv::FONT_HERSHEY_COMPLEX_SMALL  },
        { "script_simplex", cv::FONT_HERSHEY_SCRIPT_SIMPLEX },
        { "script_complex", cv::FONT_HERSHEY_SCRIPT_COMPLEX },
    };

    std::string_view base = name;
    int flags = 0;
    constexpr std::string_view kItalic = "_italic";
    if (base.size() > kItalic.size() && base.substr(base.size() - kItalic.size()) == kItalic) {
        base.remove_suffix(kItalic.size());
        flags = cv::FONT_ITALIC;
    }

    for (const auto& [n, face] : faces)
        if (n == base) return face | flags;

    throw ConfigError("unknown font '" + name + "' (expected a Hershey face such as simplex, duplex, complex)");
}

std::string formatCoords(const std::string& fmt, Coord2i world) {
    std::string out;
    out.reserve(fmt.size() + 16);
    for (std::size_t i = 0; i < fmt.size(); ++i) {
        if (fmt[i] == '{' && i + 2 < fmt.size() && fmt[i + 2] == '}') {
            const char k = fmt[i + 1];
            if (k == 'x') { out += std::to_string(world.x); i += 2; continue; }
            if (k == 'y') { out += std::to_string(world.y); i += 2; continue; }
        }
        out += fmt[i];
    }
    return out;
}

namespace {

struct LabelFont {
    int    face{cv::FONT_HERSHEY_SIMPLEX};
    double scale{1.0};
    int    thickness{1};
};

LabelFont labelFont(const CombinerStyle& s) {
    LabelFont f;
    f.face  = hersheyFace(s.gridTextFont);
    f.scale = cv::getFontScaleFromHeight(f.face, s.gridTextSize, f.thickness);
    return f;
}

void drawLabel(cv::Mat& canvas, const std::string& text, cv::Point topLeft,
               const LabelFont& f, const CombinerStyle& s)
{
    int baseline = 0;
    const cv::Size ts = cv::getTextSize(text, f.face, f.scale, f.thickness, &baseline);
    // putText takes the baseline-left point
    const cv::Point org(topLeft.x + s.gridTextStrokeWidth,
                        topLeft.y + ts.height + s.gridTextStrokeWidth);

    if (s.gridTextStrokeWidth > 0 && !s.gridTextStrokeColor.isClear()) {
        cv::putText(canvas, text, org, f.face, f.scale, s.gridTextStrokeColor.toScalar(),
                    f.thickness + 2 * s.gridTextStrokeWidth, cv::LINE_AA);
    }
    cv::putText(canvas, text, org, f.face, f.scale, s.gridTextColor.toScalar(),
                f.thickness, cv::LINE_AA);
}

} // namespace

void drawGridOverlay(cv::Mat& canvas,
                     const Grid& worldGrid,
                     const Grid& canvasGrid,
                     const CombinerStyle& style,
                     const OverlayTick& tick)
{
    if (canvas.empty() || worldGrid.step() <= 0) return;
    validateStyle(style);

    const bool drawLines  = !style.gridLineColor.isClear() && style.gridLineWidth > 0;
    const bool drawLabels = !style.gridTextColor.isClear() && !style.gridCoordsFormat.empty();

    LabelFont font;
    if (drawLabels) font = labelFont(style);

    const cv::Scalar lineColor = style.gridLineColor.toScalar();
    const int W = canvas.cols;
    const int H = canvas.rows;

    // lines already drawn on each axis
    std::set<int> doneX, doneY;

    const auto points = worldGrid.iterSteps();
    const std::size_t total = points.size();
    std::size_t done = 0;

    for (const Coord2i& p : points) {
        const Coord2i px = worldGrid.project(p, canvasGrid);

        if (drawLines) {
            if (doneX.insert(px.x).second)
                cv::line(canvas, {px.x, 0}, {px.x, H}, lineColor, style.gridLineWidth, cv::LINE_8);
            if (doneY.insert(px.y).second)
                cv::line(canvas, {0, px.y}, {W, px.y}, lineColor, style.gridLineWidth, cv::LINE_8);
        }
        if (drawLabels) {
            drawLabel(canvas, formatCoords(style.gridCoordsFormat, p), {px.x, px.y}, font, style);
        }

        ++done;
        if (tick) tick(done, total);
    }
}

} // namespace mapstitch
