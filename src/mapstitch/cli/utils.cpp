#include "utils.hpp"
#include "mapstitch/core/Log.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>

using mapstitch::logError;
using mapstitch::logInfo;

static bool ext_has_alpha(std::string e) {
    if (!e.empty() && e[0] == '.') e.erase(0, 1);
    std::transform(e.begin(), e.end(), e.begin(), [](unsigned char c){ return std::tolower(c); });
    return !(e == "jpg" || e == "jpeg" || e == "bmp");
}

/*
  Save a map image.

  - An empty map is not written (message only).
  - Parent directories are created.
  - On success/failure, print a log line with the path and size.
*/
bool save_map_image(const cv::Mat& m, const std::filesystem::path& path) {
    if (m.empty()) {
        logError("save", "map is empty, nothing to save");
        return false;
    }

    std::error_code ec;
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        logError("save", "cannot create " + path.parent_path().string() + ": " + ec.message());
        return false;
    }

    cv::Mat out = m;
    if (m.channels() == 4 && !ext_has_alpha(path.extension().string())) {
        cv::cvtColor(m, out, cv::COLOR_BGRA2BGR);
    }

    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), out);
    } catch (const cv::Exception& e) {
        logError("save", std::string("encoder failed: ") + e.what());
    }

    if (ok) {
        logInfo("save", "map saved to " + path.string() + " (" +
                        std::to_string(m.cols) + "x" + std::to_string(m.rows) + ")");
    } else {
        logError("save", "failed to save " + path.string());
    }
    return ok;
}

bool ask_yes_no(const std::string& question) {
    for (;;) {
        std::cout << question << " [y/n] " << std::flush;
        std::string line;
        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            return false;
        }
        std::transform(line.begin(), line.end(), line.begin(), [](unsigned char c){ return std::tolower(c); });
        if (line == "y" || line == "yes") return true;
        if (line == "n" || line == "no")  return false;
    }
}
