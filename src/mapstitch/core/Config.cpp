#include "mapstitch/core/Config.hpp"
#include "mapstitch/core/Errors.hpp"

#include <string>

namespace mapstitch {

int zoomBlocksPerPixel(int zoom) {
    switch (zoom) {
        case 0: return 8;
        case 1: return 4;
        case 2: return 2;
        case 3: return 1;
        default:
            throw ConfigError("Invalid zoom level " + std::to_string(zoom) +
                              ", expected one of: 0, 1, 2, 3");
    }
}

} // namespace mapstitch
