#pragma once
#include <zlib.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

/*
  Run manifest for `mapstitch-cli combine --manifest`.

  Written next to the output image as "<image>.manifest.json": what was run,
  when, and a checksum of the written image so a later copy can be checked.
*/
namespace manifest {

/* The written image as recorded in the manifest. */
struct Artifact {
    std::string    path;
    std::uintmax_t bytes{0};
    std::string    crc32;   // zlib CRC-32, 8 upper-case hex digits
    std::string    kind;    // MIME type, "image/png" etc.
};

/* Now, formatted with a strftime pattern, in UTC or local time. */
inline std::string format_time(const std::string& pattern, bool utc) {
    const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm parts{};
#if defined(_WIN32)
    if (utc) gmtime_s(&parts, &t); else localtime_s(&parts, &t);
#else
    if (utc) gmtime_r(&t, &parts); else localtime_r(&t, &parts);
#endif
    std::ostringstream out;
    out << std::put_time(&parts, pattern.c_str());
    return out.str();
}

inline std::string iso_utc_now() { return format_time("%Y-%m-%dT%H:%M:%SZ", true); }

/* Body of a JSON string literal (no surrounding quotes). */
inline std::string json_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (const unsigned char c : text) {
        if (c == '"' || c == '\\') { out += '\\'; out += char(c); }
        else if (c == '\n')       out += "\\n";
        else if (c == '\t')       out += "\\t";
        else if (c < 0x20) {
            char u[8];
            std::snprintf(u, sizeof(u), "\\u%04x", unsigned(c));
            out += u;
        } else {
            out += char(c);
        }
    }
    return out;
}

/* argv as one line; arguments with spaces are double-quoted. */
inline std::string command_line(int argc, char** argv) {
    std::string line;
    for (int i = 0; i < argc; ++i) {
        const std::string a = argv[i];
        if (i) line += ' ';
        line += a.find(' ') == std::string::npos ? a : '"' + a + '"';
    }
    return line;
}

/* "<os>, <compiler>" of this build. */
inline std::string platform() {
#if defined(_WIN32)
    std::string os = "windows";
#elif defined(__APPLE__)
    std::string os = "macos";
#elif defined(__linux__)
    std::string os = "linux";
#else
    std::string os = "unknown";
#endif
#if defined(__clang__)
    return os + ", clang " + __clang_version__;
#elif defined(__GNUC__)
    return os + ", gcc " + __VERSION__;
#elif defined(_MSC_VER)
    return os + ", msvc " + std::to_string(_MSC_VER);
#else
    return os;
#endif
}

/* Size and zlib CRC-32 of a file, read in 1 MiB chunks.
   Throws std::runtime_error if it cannot be read. */
inline Artifact describe_file(const std::filesystem::path& file, const std::string& kind) {
    std::ifstream in(file, std::ios::binary);
    if (!in) throw std::runtime_error("manifest: cannot read " + file.string());

    std::vector<char> chunk(std::size_t(1) << 20);
    uLong crc = ::crc32(0L, Z_NULL, 0);
    std::uintmax_t total = 0;
    while (in.read(chunk.data(), std::streamsize(chunk.size())) || in.gcount() > 0) {
        const auto n = in.gcount();
        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(chunk.data()), uInt(n));
        total += std::uintmax_t(n);
    }

    std::ostringstream hex;
    hex << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << (crc & 0xFFFFFFFFu);
    return { file.string(), total, hex.str(), kind };
}

/* Write `text` to `file`, creating parent directories.
   Throws std::runtime_error on failure. */
inline void write_text_file(const std::filesystem::path& file, const std::string& text) {
    if (file.has_parent_path()) std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!(out << text)) throw std::runtime_error("manifest: cannot write " + file.string());
}

} // namespace manifest
