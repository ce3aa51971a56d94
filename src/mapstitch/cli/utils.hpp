#pragma once
#include <opencv2/core.hpp>
#include <filesystem>
#include <string>

/*
  Helpers for saving maps and talking to the user on the terminal.
*/

/* Save a BGRA map to 'path'; the encoder is picked from the extension.
   Formats without alpha (jpg, jpeg, bmp) get the alpha channel dropped.
   Prints a short message and returns false on failure. */
bool save_map_image(const cv::Mat& m, const std::filesystem::path& path);

/* Ask a y/n question on stdin. End of input counts as "no". */
bool ask_yes_no(const std::string& question);
