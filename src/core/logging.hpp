// File: src/core/logging.hpp
#pragma once

#include <cstdint>
#include <string>

namespace stocklens {

enum class LogLevel : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4,
};

const char* ToString(LogLevel level);

/// @throws std::invalid_argument for unknown names
LogLevel ParseLogLevel(const std::string& str);

/// Process-wide line logger writing to std::cerr
///
/// Output format: "[LEVEL] component: message". Lines from concurrent
/// threads (the correlation worker, the caller) never interleave.
class Logger {
public:
    static void SetLevel(LogLevel level);
    static LogLevel GetLevel();

    static bool IsEnabled(LogLevel level);

    static void Write(LogLevel level, const std::string& component, const std::string& message);
};

inline void LogDebug(const std::string& component, const std::string& message) {
    if (Logger::IsEnabled(LogLevel::DEBUG)) Logger::Write(LogLevel::DEBUG, component, message);
}

inline void LogInfo(const std::string& component, const std::string& message) {
    if (Logger::IsEnabled(LogLevel::INFO)) Logger::Write(LogLevel::INFO, component, message);
}

inline void LogWarn(const std::string& component, const std::string& message) {
    if (Logger::IsEnabled(LogLevel::WARN)) Logger::Write(LogLevel::WARN, component, message);
}

inline void LogError(const std::string& component, const std::string& message) {
    if (Logger::IsEnabled(LogLevel::ERROR)) Logger::Write(LogLevel::ERROR, component, message);
}

} // namespace stocklens
