#include "mapstitch/compose/Mosaic.hpp"
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace mapstitch {

/* Ensure the matrix is a non-empty 8-bit BGRA image. */
static inline void ensureBgra8(const cv::Mat& m, const char* who) {
    if (m.empty() || m.type() != CV_8UC4) {
        throw std::invalid_argument(std::string(who) + ": expected a non-empty CV_8UC4 image");
    }
}

cv::Mat makeCanvas(Coord2i size, const Color& fill) {
    if (size.x <= 0 || size.y <= 0) {
        throw std::invalid_argument("makeCanvas: size must be positive, got " + toString(size));
    }
    return cv::Mat(size.y, size.x, CV_8UC4, fill.toScalar());
}

cv::Mat toBgra8(const cv::Mat& src) {
    if (src.empty()) throw std::invalid_argument("toBgra8: empty image");

    cv::Mat depth8;
    switch (src.depth()) {
        case CV_8U:  depth8 = src;                                  break;
        case CV_16U: src.convertTo(depth8, CV_8U, 1.0 / 257.0);     break;
        default:
            throw std::invalid_argument("toBgra8: unsupported pixel depth " + std::to_string(src.depth()));
    }

    cv::Mat out;
    switch (depth8.channels()) {
        case 1: cv::cvtColor(depth8, out, cv::COLOR_GRAY2BGRA); break;
        case 3: cv::cvtColor(depth8, out, cv::COLOR_BGR2BGRA);  break;
        case 4: out = depth8;                                   break;
        default:
            throw std::invalid_argument("toBgra8: unsupported channel count " + std::to_string(depth8.channels()));
    }
    return out;
}

/*
  Porter-Duff "over" for straight (non-premultiplied) alpha, 8 bit.

    outA = sA + dA * (1 - sA)
    outC = (sC * sA + dC * dA * (1 - sA)) / outA

  Everything is kept in integers scaled by 255 to stay exact for the
  common opaque / fully transparent cases.
*/
void alphaComposite(cv::Mat& dst, const cv::Mat& src, Coord2i at) {
    ensureBgra8(dst, "alphaComposite(dst)");
    ensureBgra8(src, "alphaComposite(src)");

    const cv::Rect dstR(0, 0, dst.cols, dst.rows);
    const cv::Rect place(at.x, at.y, src.cols, src.rows);
    const cv::Rect hit = dstR & place;
    if (hit.empty()) return;

    const cv::Rect srcR(hit.x - at.x, hit.y - at.y, hit.width, hit.height);

    for (int y = 0; y < hit.height; ++y) {
        const cv::Vec4b* s = src.ptr<cv::Vec4b>(srcR.y + y) + srcR.x;
        cv::Vec4b*       d = dst.ptr<cv::Vec4b>(hit.y + y) + hit.x;
        for (int x = 0; x < hit.width; ++x, ++s, ++d) {
            const int sa = (*s)[3];
            if (sa == 0) continue;
            if (sa == 255) { *d = *s; continue; }

            const int da    = (*d)[3];
            const int dw    = da * (255 - sa);          // dst weight, scaled by 255
            const int outA  = sa * 255 + dw;            // scaled by 255
            if (outA == 0) { *d = cv::Vec4b(0, 0, 0, 0); continue; }

            for (int c = 0; c < 3; ++c) {
                const int v = ((*s)[c] * sa * 255 + (*d)[c] * dw + outA / 2) / outA;
                (*d)[c] = static_cast<uchar>(std::min(v, 255));
            }
            (*d)[3] = static_cast<uchar>((outA + 127) / 255);
        }
    }
}

std::optional<Rect> contentBounds(const cv::Mat& bgra) {
    ensureBgra8(bgra, "contentBounds");

    cv::Mat alpha;
    cv::extractChannel(bgra, alpha, 3);
    if (cv::countNonZero(alpha) == 0) return std::nullopt;

    std::vector<cv::Point> nz;
    cv::findNonZero(alpha, nz);
    const cv::Rect r = cv::boundingRect(nz);
    return Rect{ r.x, r.y, r.x + r.width, r.y + r.height };
}

cv::Mat cropPadded(const cv::Mat& src, const Rect& box) {
    ensureBgra8(src, "cropPadded");
    cv::Mat out = makeCanvas(box.size());

    const Rect srcBounds{ 0, 0, src.cols, src.rows };
    const auto hit = box.intersect(srcBounds);
    if (!hit) return out;

    const cv::Rect from(hit->x1, hit->y1, hit->width(), hit->height());
    const cv::Rect to(hit->x1 - box.x1, hit->y1 - box.y1, hit->width(), hit->height());
    src(from).copyTo(out(to));
    return out;
}

void fillBackground(cv::Mat& bgra, const Color& bg) {
    ensureBgra8(bgra, "fillBackground");
    cv::Mat layer(bgra.rows, bgra.cols, CV_8UC4, bg.toScalar());
    alphaComposite(layer, bgra, {0, 0});
    bgra = layer;
}

MapImage MapImage::crop(const Rect& box) const {
    return { cropPadded(image, box), worldZero - box.topLeft(), blocksPerPixel };
}

MapImage MapImage::resizeCanvas(int width, int height) const {
    const Rect box = Rect::fromSize(width, height, bounds().center());
    return crop(box);
}

} // namespace mapstitch
