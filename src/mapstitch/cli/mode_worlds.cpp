// src/mapstitch/cli/mode_worlds.cpp
#include "modes.hpp"
#include "args.hpp"

#include "mapstitch/core/Combiner.hpp"
#include "mapstitch/core/Config.hpp"
#include "mapstitch/core/Log.hpp"
#include "mapstitch/io/TileIndex.hpp"

#include <iostream>
#include <string>

using namespace mapstitch;

int run_worlds(int argc, char** argv)
{
    const std::string tiles = argValue(argc, argv, "tiles", "");
    if (tiles.empty()) throw ConfigError("missing required option --tiles=...");

    const Combiner combiner(tiles);
    const auto names = combiner.worlds();
    if (names.empty()) {
        logWarn("cli", "no minecraft_* worlds under " + tiles);
        return 1;
    }

    // one line per world: name and the tile count of each zoom level present
    for (const auto& w : names) {
        std::cout << w;
        for (int z = kMinZoom; z <= kMaxZoom; ++z) {
            const auto n = scanTiles(combiner.tilesDir() / w / std::to_string(z)).size();
            if (n) std::cout << "  zoom " << z << ": " << n;
        }
        std::cout << "\n";
    }
    return 0;
}
