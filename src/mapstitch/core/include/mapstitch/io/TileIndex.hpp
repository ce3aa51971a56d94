#pragma once
#include "mapstitch/geo/Coord.hpp"

#include <opencv2/core.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mapstitch {

/// Tile column/row index -> file on disk.
using TileMap = std::unordered_map<Coord2i, std::filesystem::path>;

/* "{col}_{row}" (signed decimal integers) -> Coord2i.
   Anything else, or values outside int range, gives nullopt. */
std::optional<Coord2i> parseTileName(const std::string& stem);

/* Index the tiles of one zoom directory.
   - only regular files whose stem parses with parseTileName();
   - ext: "*" accepts any extension, otherwise a case-insensitive match
     ("png" and ".png" are the same);
   - a missing directory yields an empty map. */
TileMap scanTiles(const std::filesystem::path& zoomDir, const std::string& ext = "*");

/* Decode one tile to CV_8UC4 (BGRA).
   Throws CombineError when the file cannot be read/decoded or is not
   kTilePixels x kTilePixels. */
cv::Mat loadTile(const std::filesystem::path& path);

/// Sorted names of subdirectories starting with "minecraft_".
std::vector<std::string> listWorlds(const std::filesystem::path& tilesDir);

} // namespace mapstitch
