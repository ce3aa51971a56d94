#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace mapstitch {

/* Size of one tile image in pixels. Constant for every zoom level:
   zoom only changes how many blocks a tile pixel covers. */
inline constexpr int kTilePixels = 512;

/* Blocks covered by one tile edge at 1 block per pixel. */
inline constexpr int kTileBlocks = 512;

inline constexpr int kMinZoom = 0;
inline constexpr int kMaxZoom = 3;

/* Blocks per pixel for a zoom level: {0:8, 1:4, 2:2, 3:1}.
   Throws ConfigError for anything outside [kMinZoom, kMaxZoom]. */
int zoomBlocksPerPixel(int zoom);

/* Global tuning knobs for the combine pipeline.
   Passed to Combiner; every field has a usable default. */
struct Config {
    int largeImageWarnPx {16384};            // warn + confirm if canvas W or H exceeds this
    std::size_t overlayConfirmSteps {50000}; // ask before drawing this many overlay points
    std::size_t overlayProgressSteps {5000}; // report overlay progress above this count
    std::chrono::milliseconds progressInterval {1000};

    bool parallelTiles {true};     // decode/paste tiles on the OpenCV thread pool
    // nstripes for cv::parallel_for_: how many chunks each tile batch is split
    // into, not a thread count (cv::setNumThreads owns that). 0 = OpenCV decides.
    int  tileStripes {0};
};

} // namespace mapstitch
