#pragma once
#include "mapstitch/core/Style.hpp"
#include "mapstitch/geo/Coord.hpp"
#include "mapstitch/geo/Grid.hpp"

#include <opencv2/core.hpp>
#include <cstddef>
#include <functional>
#include <string>

namespace mapstitch {

/* Map a style font name to an OpenCV Hershey face.
   Known: simplex, plain, duplex, complex, triplex, complex_small,
   script_simplex, script_complex; an "_italic" suffix adds FONT_ITALIC.
   Unknown names throw ConfigError. */
int hersheyFace(const std::string& name);

/// Replace every "{x}" / "{y}" in `fmt` with the coordinate values.
std::string formatCoords(const std::string& fmt, Coord2i world);

/// Called after each intersection: (done, total).
using OverlayTick = std::function<void(std::size_t, std::size_t)>;

/*
  Рисует сетку координат поверх карты.

  worldGrid  : world-space rect + the user step; its iterSteps() are the
               intersections to mark.
  canvasGrid : pixel-space rect of the same area; points are placed with
               worldGrid.project(p, canvasGrid).

  Per intersection:
    - a full-height vertical and a full-width horizontal line through it
      (gridLineColor alpha > 0 and gridLineWidth > 0);
    - a label from gridCoordsFormat with its top-left corner at the
      intersection (text alpha > 0 and a non-empty format). A stroke is
      drawn underneath first when gridTextStrokeWidth > 0.
  Lines overwrite pixels, they are not blended. Each distinct line is drawn once.
*/
void drawGridOverlay(cv::Mat& canvas,
                     const Grid& worldGrid,
                     const Grid& canvasGrid,
                     const CombinerStyle& style,
                     const OverlayTick& tick = {});

} // namespace mapstitch
