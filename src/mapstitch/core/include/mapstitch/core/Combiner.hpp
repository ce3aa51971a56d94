#pragma once
#include "mapstitch/compose/Mosaic.hpp"
#include "mapstitch/core/Config.hpp"
#include "mapstitch/core/Style.hpp"
#include "mapstitch/geo/Grid.hpp"
#include "mapstitch/geo/Rect.hpp"
#include "mapstitch/io/TileIndex.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mapstitch {

/// Yes/no question to the user; false aborts (or skips) the step.
using ConfirmFn  = std::function<bool(const std::string& message)>;

/// Progress sink: fraction of the current step in [0, 1] + status naming the step.
using ProgressFn = std::function<void(double fraction, const std::string& status)>;

/// Final crop applied after the area crop.
struct CropSpec {
    enum class Mode : std::uint8_t { None, Fixed, Auto };

    Mode mode{Mode::None};
    int  width{0};
    int  height{0};

    static CropSpec none() { return {}; }
    static CropSpec autoTrim() { return { Mode::Auto, 0, 0 }; }
    /// Throws ConfigError unless both sides are positive.
    static CropSpec fixed(int width, int height);

    /// "auto", "WxH" or "N" (square). Throws ConfigError.
    static CropSpec parse(const std::string& text);

    friend bool operator==(const CropSpec&, const CropSpec&) = default;
};

/// "X1,Y1,X2,Y2" in world blocks. Throws ConfigError.
Rect parseArea(const std::string& text);

struct CombineRequest {
    std::string         world;          // "minecraft_overworld", "overworld" or an absolute path
    int                 zoom{3};
    std::optional<Rect> area{};         // world blocks; nullopt = every tile on disk
    CropSpec            crop{};
    std::string         tileExt{"*"};
};

/*
  Склейка тайлов squaremap в одну карту.

  Три системы координат:
    tile space   : tile column/row indices (file names);
    world space  : Minecraft blocks, 512 * blocksPerPixel per tile;
    canvas space : output pixels, 512 per tile, (0,0) = top-left tile corner.
  They are kept as three Grids over the same area (see Layout).

  Pipeline: layout -> canvas -> tiles -> area crop -> overlay -> crop -> background.
*/
class Combiner {
public:
    struct Options {
        int            gridStep{0};       // overlay interval in blocks, 0 = off
        CombinerStyle  style{};
        ConfirmFn      confirm{};         // empty = always yes
        ProgressFn     progress{};        // empty = printed only if showProgress
        bool           showProgress{false};
        Config         config{};
    };

    /// The three coordinate spaces of one combine.
    struct Layout {
        Grid tiles;          // step 1, exclusive far corner
        Grid world;          // step = gridStep, origin = world (0,0)
        Grid canvas;         // step = kTilePixels, origin = pixel of world (0,0)
        int  blocksPerPixel{1};
    };

    // ВАЖНО: без дефолтного аргумента здесь: иначе GCC ругается
    explicit Combiner(std::filesystem::path tilesDir);
    Combiner(std::filesystem::path tilesDir, Options opt);

    /// minecraft_* worlds under the tiles directory, sorted.
    std::vector<std::string> worlds() const;

    /// Directory of a world. Throws ConfigError if it is not a directory.
    std::filesystem::path resolveWorld(const std::string& world) const;

    /* Build the map. Returns nullopt when the user declines the
       large-image confirmation. Throws ConfigError / CombineError. */
    std::optional<MapImage> combine(const CombineRequest& req) const;

    /* Coordinate spaces for the given tiles (or the given area, which wins).
       Throws CombineError if both are empty. */
    static Layout computeLayout(const TileMap& tiles, int zoom,
                                const std::optional<Rect>& area, int gridStep);

    const Options& options() const { return opt_; }
    const std::filesystem::path& tilesDir() const { return tilesDir_; }

private:
    std::filesystem::path tilesDir_;
    Options               opt_;

    bool confirm(const std::string& message) const;
    void report(double fraction, const std::string& status) const;

    void placeTiles(cv::Mat& canvas, const Layout& layout, const TileMap& tiles) const;
    void drawOverlay(MapImage& map) const;
};

} // namespace mapstitch
