#include "mapstitch/core/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace mapstitch {

namespace {
std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_out;
} // namespace

void setLogLevel(LogLevel level) noexcept { g_level.store(level); }
LogLevel logLevel() noexcept { return g_level.load(); }

void logLine(LogLevel level, std::string_view tag, const std::string& message) {
    if (level == LogLevel::Off || level < g_level.load()) return;

    std::lock_guard<std::mutex> lk(g_out);
    switch (level) {
        case LogLevel::Warn:
            std::cerr << '[' << tag << "] warning: " << message << '\n';
            break;
        case LogLevel::Error:
            std::cerr << '[' << tag << "] error: " << message << '\n';
            break;
        default:
            std::cout << '[' << tag << "] " << message << '\n';
            break;
    }
}

} // namespace mapstitch
