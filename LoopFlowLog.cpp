// LoopFlowLog.cpp
//
// Process-wide log threshold. This is the only global in the library; the
// engine itself keeps no state between runs.
#include "LoopFlowLog.hpp"
#include "LoopFlowErrors.hpp"

namespace LoopFlow {

namespace {
std::atomic<int> currentLevel(static_cast<int>(LogLevel::Warn));
}

void setLogLevel(LogLevel level) {
    currentLevel.store(static_cast<int>(level));
}

LogLevel logLevel() {
    return static_cast<LogLevel>(currentLevel.load());
}

LogLevel parseLogLevel(const std::string& text) {
    if (text == "error") return LogLevel::Error;
    if (text == "warn") return LogLevel::Warn;
    if (text == "info") return LogLevel::Info;
    if (text == "debug") return LogLevel::Debug;
    throw ConfigurationError(fmt::format("Unknown log level '{}' (expected error|warn|info|debug)", text));
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn: return "warn";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
    }
    return "?";
}

} // namespace LoopFlow
