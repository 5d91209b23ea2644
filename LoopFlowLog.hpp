// LoopFlow logging helpers
//
// Thin leveled wrapper over fmt::print. Messages go to stderr with a
// "[loopflow:<level>]" tag so stdout stays free for result JSON.
#pragma once
#include <fmt/core.h>
#include <atomic>
#include <cstdio>
#include <string>
#include <utility>

namespace LoopFlow {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

void setLogLevel(LogLevel level);
LogLevel logLevel();
// Accepts "error", "warn", "info", "debug"; throws ConfigurationError otherwise
LogLevel parseLogLevel(const std::string& text);
const char* logLevelName(LogLevel level);

inline bool logEnabled(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(logLevel());
}

template <typename... Args>
void log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
    if (!logEnabled(level)) return;
    fmt::print(stderr, "[loopflow:{}] {}\n", logLevelName(level),
               fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void logDebug(fmt::format_string<Args...> format, Args&&... args) {
    log(LogLevel::Debug, format, std::forward<Args>(args)...);
}

template <typename... Args>
void logInfo(fmt::format_string<Args...> format, Args&&... args) {
    log(LogLevel::Info, format, std::forward<Args>(args)...);
}

template <typename... Args>
void logWarn(fmt::format_string<Args...> format, Args&&... args) {
    log(LogLevel::Warn, format, std::forward<Args>(args)...);
}

template <typename... Args>
void logError(fmt::format_string<Args...> format, Args&&... args) {
    log(LogLevel::Error, format, std::forward<Args>(args)...);
}

} // namespace LoopFlow
