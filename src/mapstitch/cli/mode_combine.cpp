// src/mapstitch/cli/mode_combine.cpp
#include "modes.hpp"
#include "manifest.hpp"
#include "options.hpp"
#include "utils.hpp"

#include "mapstitch/core/Combiner.hpp"
#include "mapstitch/core/Log.hpp"

#include <sstream>
#include <string>

using namespace mapstitch;

static const char* image_kind(const std::string& ext) {
    if (ext == "png")                  return "image/png";
    if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if (ext == "webp")                 return "image/webp";
    if (ext == "tif" || ext == "tiff") return "image/tiff";
    if (ext == "bmp")                  return "image/bmp";
    return "image";
}

static std::string manifest_json(int argc, char** argv, const CombineCliOptions& o,
                                 const MapImage& map, const manifest::Artifact& out)
{
    const auto& r = o.request;
    std::ostringstream js;
    js << "{\n"
       << "  \"tool\": \"mapstitch-cli\",\n"
       << "  \"created_utc\": \"" << manifest::iso_utc_now() << "\",\n"
       << "  \"platform\": \"" << manifest::json_escape(manifest::platform()) << "\",\n"
       << "  \"command\": \"" << manifest::json_escape(manifest::command_line(argc, argv)) << "\",\n"
       << "  \"tiles_dir\": \"" << manifest::json_escape(o.tilesDir.string()) << "\",\n"
       << "  \"world\": \"" << manifest::json_escape(r.world) << "\",\n"
       << "  \"zoom\": " << r.zoom << ",\n";
    if (r.area) {
        js << "  \"area\": [" << r.area->x1 << ", " << r.area->y1 << ", "
           << r.area->x2 << ", " << r.area->y2 << "],\n";
    }
    js << "  \"grid_step\": " << o.gridStep << ",\n"
       << "  \"image\": {\"width\": " << map.width() << ", \"height\": " << map.height()
       << ", \"world_zero\": [" << map.worldZero.x << ", " << map.worldZero.y << "]"
       << ", \"blocks_per_pixel\": " << map.blocksPerPixel << "},\n"
       << "  \"output\": {\"path\": \"" << manifest::json_escape(out.path) << "\", \"size\": " << out.bytes
       << ", \"crc32\": \"" << out.crc32 << "\", \"kind\": \"" << out.kind << "\"}\n"
       << "}\n";
    return js.str();
}

int run_combine(int argc, char** argv)
{
    const CombineCliOptions o = parseCombineArgs(argc, argv);

    Combiner::Options opt;
    opt.gridStep     = o.gridStep;
    opt.style        = effectiveStyle(o.styleFile, &o);
    opt.showProgress = o.progress;
    if (!o.assumeYes) opt.confirm = ask_yes_no;

    const Combiner combiner(o.tilesDir, opt);

    const std::string stamp = o.timestampFormat ? manifest::format_time(*o.timestampFormat, false) : "";
    const auto target = uniquePath(outputPath(o, stamp), o.overwrite);
    if (target != outputPath(o, stamp)) {
        logInfo("cli", "output exists and --overwrite was not given, writing " + target.filename().string());
    }

    logInfo("cli", "starting");
    const auto map = combiner.combine(o.request);
    if (!map) {
        logInfo("cli", "cancelled");
        return 1;
    }

    if (!save_map_image(map->image, target)) return 1;

    if (o.manifest) {
        const auto art = manifest::describe_file(target, image_kind(o.outExt));
        const std::filesystem::path mpath = target.string() + ".manifest.json";
        manifest::write_text_file(mpath, manifest_json(argc, argv, o, *map, art));
        logInfo("cli", "manifest written to " + mpath.string());
    }
    return 0;
}
