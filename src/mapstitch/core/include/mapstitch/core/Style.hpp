#pragma once

#include "mapstitch/core/Color.hpp"

#include <filesystem>
#include <string>

namespace mapstitch {

inline constexpr const char* kDefaultCoordsFormat = "({x}, {y})";

/// Визуальные настройки готовой карты (фон, линии сетки, подписи координат).
struct CombinerStyle {
    Color bgColor             {0, 0, 0, 0};         // composited under the map; clear = keep transparency
    Color gridLineColor       {0, 0, 0, 255};       // alpha 0 disables grid lines
    int   gridLineWidth       {1};
    std::string gridTextFont  {"simplex"};          // Hershey face name, see Overlay.hpp
    int   gridTextSize        {12};                 // cap height in pixels
    Color gridTextColor       {0, 0, 0, 255};
    int   gridTextStrokeWidth {0};                  // outline around labels, 0 = none
    Color gridTextStrokeColor {255, 255, 255, 255};
    std::string gridCoordsFormat {kDefaultCoordsFormat}; // empty disables labels

    friend bool operator==(const CombinerStyle&, const CombinerStyle&) = default;
};

/*
  JSON (de)serialization through cv::FileStorage.

  Keys: background_color, grid_line_color, grid_line_width, grid_text_font,
        grid_text_size, grid_text_color, grid_text_stroke_width,
        grid_text_stroke_color, grid_coords_format.
  Colours are hex/name strings or [r, g, b(, a)] arrays.
  Keys absent from the input keep the value from `base`.
  Malformed JSON or values throw ConfigError.
*/
CombinerStyle styleFromJson(const std::string& json, const CombinerStyle& base = {});
std::string   styleToJson(const CombinerStyle& style);

CombinerStyle loadStyle(const std::filesystem::path& path, const CombinerStyle& base = {});
void          saveStyle(const CombinerStyle& style, const std::filesystem::path& path);

/// Range checks (non-negative widths, positive text size). Throws ConfigError.
void validateStyle(const CombinerStyle& style);

} // namespace mapstitch
