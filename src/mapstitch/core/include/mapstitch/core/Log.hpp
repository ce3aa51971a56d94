#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace mapstitch {

enum class LogLevel : std::uint8_t {
    Debug = 0,
    Info,
    Warn,
    Error,
    Off
};

/* Process-wide threshold. Lines below it are dropped.
   Default: Info. */
void     setLogLevel(LogLevel level) noexcept;
LogLevel logLevel() noexcept;

/*
  Write one "[tag] message" line.
    Debug/Info -> std::cout
    Warn/Error -> std::cerr, with "warning:" / "error:" after the tag
  Lines from different threads are not interleaved.
*/
void logLine(LogLevel level, std::string_view tag, const std::string& message);

inline void logDebug(std::string_view tag, const std::string& m) { logLine(LogLevel::Debug, tag, m); }
inline void logInfo (std::string_view tag, const std::string& m) { logLine(LogLevel::Info,  tag, m); }
inline void logWarn (std::string_view tag, const std::string& m) { logLine(LogLevel::Warn,  tag, m); }
inline void logError(std::string_view tag, const std::string& m) { logLine(LogLevel::Error, tag, m); }

} // namespace mapstitch
