#pragma once
#include "mapstitch/core/Color.hpp"
#include "mapstitch/geo/Coord.hpp"
#include "mapstitch/geo/Rect.hpp"

#include <opencv2/core.hpp>
#include <optional>

namespace mapstitch {

/*
  Готовая карта: растр + положение мировой точки (0,0) на нём.

  image          : CV_8UC4, BGRA, straight alpha.
  worldZero      : pixel where world block (0,0) lies; may be outside the raster.
  blocksPerPixel : 8/4/2/1 depending on zoom.
*/
struct MapImage {
    cv::Mat image;
    Coord2i worldZero{};
    int     blocksPerPixel{1};

    [[nodiscard]] int width()  const { return image.cols; }
    [[nodiscard]] int height() const { return image.rows; }
    [[nodiscard]] Coord2i size() const { return { image.cols, image.rows }; }
    [[nodiscard]] Rect bounds() const { return { 0, 0, image.cols, image.rows }; }

    /// World block -> pixel (floor division by blocksPerPixel).
    [[nodiscard]] Coord2i toCanvasSpace(Coord2i world) const {
        return worldZero + floorDiv(world, blocksPerPixel);
    }
    /// Pixel -> world block (top-left block of that pixel).
    [[nodiscard]] Coord2i toWorldSpace(Coord2i pixel) const {
        return (pixel - worldZero) * blocksPerPixel;
    }

    /// Crop to `box` (may extend past the raster; outside is transparent).
    [[nodiscard]] MapImage crop(const Rect& box) const;

    /// Centre the raster inside a new width x height canvas (crops or pads).
    [[nodiscard]] MapImage resizeCanvas(int width, int height) const;

    [[nodiscard]] MapImage withImage(cv::Mat img) const { return { std::move(img), worldZero, blocksPerPixel }; }
};

/// New CV_8UC4 raster of `size` filled with `fill`.
cv::Mat makeCanvas(Coord2i size, const Color& fill = Color(0, 0, 0, 0));

/* Normalize a decoded image to CV_8UC4:
   gray / BGR / BGRA, 8 or 16 bit. Anything else throws std::invalid_argument. */
cv::Mat toBgra8(const cv::Mat& src);

/* Porter-Duff "over": src on top of dst with its top-left at `at`.
   Parts of src outside dst are ignored. Both must be CV_8UC4. */
void alphaComposite(cv::Mat& dst, const cv::Mat& src, Coord2i at);

/// Bounding box (exclusive bottom-right) of pixels with alpha > 0; nullopt if none.
std::optional<Rect> contentBounds(const cv::Mat& bgra);

/// Copy of `box` from `src`; regions outside src are transparent.
cv::Mat cropPadded(const cv::Mat& src, const Rect& box);

/// Composite the raster over a solid `bg` layer (in place).
void fillBackground(cv::Mat& bgra, const Color& bg);

} // namespace mapstitch
