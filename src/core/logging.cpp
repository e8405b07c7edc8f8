// File: src/core/logging.cpp
#include "core/logging.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace stocklens {

namespace {

std::atomic<LogLevel> g_level{LogLevel::INFO};
std::mutex g_write_mutex;

} // namespace

const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF: return "OFF";
        default: return "UNKNOWN";
    }
}

LogLevel ParseLogLevel(const std::string& str) {
    if (str == "DEBUG" || str == "debug") return LogLevel::DEBUG;
    if (str == "INFO" || str == "info") return LogLevel::INFO;
    if (str == "WARN" || str == "warn") return LogLevel::WARN;
    if (str == "ERROR" || str == "error") return LogLevel::ERROR;
    if (str == "OFF" || str == "off") return LogLevel::OFF;
    throw std::invalid_argument("Unknown LogLevel: " + str);
}

void Logger::SetLevel(LogLevel level) {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel Logger::GetLevel() {
    return g_level.load(std::memory_order_relaxed);
}

bool Logger::IsEnabled(LogLevel level) {
    LogLevel current = GetLevel();
    return current != LogLevel::OFF && level >= current;
}

void Logger::Write(LogLevel level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << "[" << ToString(level) << "] " << component << ": " << message << std::endl;
}

} // namespace stocklens
