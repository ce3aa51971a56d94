// src/mapstitch/cli/mode_style.cpp
#include "modes.hpp"
#include "args.hpp"
#include "options.hpp"

#include "mapstitch/core/Log.hpp"
#include "mapstitch/core/Style.hpp"

#include <iostream>
#include <optional>

using namespace mapstitch;

int run_style(int argc, char** argv)
{
    std::optional<std::filesystem::path> base;
    if (auto s = argFind(argc, argv, "style")) base = std::filesystem::path(*s);

    const CombinerStyle style = effectiveStyle(base);

    if (auto out = argFind(argc, argv, "save")) {
        saveStyle(style, *out);
        logInfo("cli", "style saved to " + *out);
        return 0;
    }
    std::cout << styleToJson(style);
    return 0;
}
