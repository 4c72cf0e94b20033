// Minimal console logger with a replaceable sink.
#pragma once

#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace Engine {

enum class LogLevel { Debug, Info, Warning, Error };

class Logger {
public:
    using Sink = std::function<void(LogLevel, std::string_view)>;

    static void log(LogLevel level, std::string_view message);

    // Messages below this level are dropped before reaching the sink.
    static void setMinLevel(LogLevel level);
    static LogLevel minLevel();

    // Replaces console output; pass an empty sink to restore it.
    static void setSink(Sink sink);
};

inline void logDebug(std::string_view msg) { Logger::log(LogLevel::Debug, msg); }
inline void logInfo(std::string_view msg) { Logger::log(LogLevel::Info, msg); }
inline void logWarn(std::string_view msg) { Logger::log(LogLevel::Warning, msg); }
inline void logError(std::string_view msg) { Logger::log(LogLevel::Error, msg); }

}  // namespace Engine
