#pragma once
#include "mapstitch/core/Combiner.hpp"
#include "mapstitch/core/Style.hpp"

#include <filesystem>
#include <optional>
#include <string>

/* Default strftime pattern for --timestamp without a value. */
inline constexpr const char* kDefaultTimestampFormat = "%Y-%m-%d_%H-%M-%S";

/* Everything `mapstitch-cli combine` reads from argv. */
struct CombineCliOptions {
    std::filesystem::path tilesDir;
    mapstitch::CombineRequest request;
    int gridStep{0};

    std::optional<std::filesystem::path> styleFile;
    // per-field overrides applied on top of the style file
    std::optional<mapstitch::Color> bg, gridColor, textColor;
    std::optional<int>              gridWidth, textSize;
    std::optional<std::string>      coordsFormat;

    std::filesystem::path outDir{"."};
    std::string outExt{"png"};
    std::optional<std::string> timestampFormat;   // set => prefix the file name
    bool overwrite{false};
    bool assumeYes{false};
    bool progress{false};
    bool manifest{false};
};

/* Parse `combine` arguments. Missing --tiles / --world / --zoom and
   malformed values throw mapstitch::ConfigError. */
CombineCliOptions parseCombineArgs(int argc, char** argv);

/* Style file (if any) + overrides, validated. Throws mapstitch::ConfigError. */
mapstitch::CombinerStyle effectiveStyle(const std::optional<std::filesystem::path>& styleFile,
                                        const CombineCliOptions* overrides = nullptr);

/* "{timestamp_}{world}-{zoom}.{ext}" inside outDir. World short names are
   expanded to minecraft_*; absolute world paths use their last component. */
std::filesystem::path outputPath(const CombineCliOptions& o, const std::string& timestamp);

/* `path` itself if free (or overwrite), else the first free "<stem>_N<ext>". */
std::filesystem::path uniquePath(const std::filesystem::path& path, bool overwrite);
