#include "modes.hpp"
#include "args.hpp"

#include "mapstitch/core/Errors.hpp"
#include "mapstitch/core/Log.hpp"

#include <opencv2/core.hpp>

#include <filesystem>
#include <iostream>
#include <string>

/*
  CLI entry point.

  Modes:
    - combine : stitch the tiles of one world/zoom into an image.
    - worlds  : list worlds of a tiles directory.
    - style   : print or save the effective style JSON.

  Exit codes: 0 ok, 1 runtime failure or cancelled, 2 bad arguments/config.
*/
static void print_usage() {
    std::cout
        << "Usage:\n"
        << "  mapstitch-cli combine --tiles=DIR --world=NAME --zoom=0..3\n"
        << "                        [--area=X1,Y1,X2,Y2] [--crop=auto|WxH] [--grid=STEP] [--ext=png]\n"
        << "                        [--style=FILE.json] [--bg=COLOR] [--grid-color=COLOR] [--grid-width=N]\n"
        << "                        [--text-color=COLOR] [--text-size=N] [--coords-format=FMT]\n"
        << "                        [--out-dir=DIR] [--out-ext=png] [--timestamp[=FMT]] [--overwrite]\n"
        << "                        [--yes] [--progress] [--manifest] [--quiet|--verbose]\n"
        << "  mapstitch-cli worlds  --tiles=DIR\n"
        << "  mapstitch-cli style   [--style=FILE.json] [--save=FILE.json]\n"
        << "     colours are hex (#rgb, #rrggbb, #rrggbbaa) or names (clear, white, black, red, ...);\n"
        << "     FMT for --coords-format uses {x} and {y}.\n";
}

int main(int argc, char** argv)
{
    if (argc < 2) { print_usage(); return 0; }
    const std::string mode = argv[1];

    if (argHas(argc, argv, "quiet"))   mapstitch::setLogLevel(mapstitch::LogLevel::Warn);
    if (argHas(argc, argv, "verbose")) mapstitch::setLogLevel(mapstitch::LogLevel::Debug);

    try {
        if      (mode == "combine") return run_combine(argc, argv);
        else if (mode == "worlds")  return run_worlds (argc, argv);
        else if (mode == "style")   return run_style  (argc, argv);
    } catch (const mapstitch::ConfigError& e) {
        mapstitch::logError("cli", e.what());
        return 2;
    } catch (const mapstitch::Error& e) {
        mapstitch::logError("cli", e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        mapstitch::logError("cli", e.what());
        return 2;
    } catch (const std::filesystem::filesystem_error& e) {
        mapstitch::logError("cli", e.what());
        return 1;
    } catch (const cv::Exception& e) {
        mapstitch::logError("cli", std::string("OpenCV: ") + e.what());
        return 1;
    } catch (const std::runtime_error& e) {
        mapstitch::logError("cli", e.what());
        return 1;
    }

    std::cout << "Unknown mode: " << mode << "\n";
    print_usage();
    return 2;
}
