#include "wsproxy/common/Logger.h"

#include <iostream>
#include <chrono>
#include <iomanip>
#include <ctime>
#include <cstring>
#include <unistd.h>

namespace wsproxy {
namespace common {

namespace {

std::string GetCurrentTime() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    struct tm tmBuf;
    ::localtime_r(&in_time_t, &tmBuf);
    std::stringstream ss;
    ss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

const char* LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

// ANSI Color codes
const char* LevelToColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m"; // Cyan
        case LogLevel::INFO:  return "\033[32m"; // Green
        case LogLevel::WARN:  return "\033[33m"; // Yellow
        case LogLevel::ERROR: return "\033[31m"; // Red
        case LogLevel::FATAL: return "\033[35m"; // Magenta
        default: return "\033[0m";
    }
}

// Strip directories so lines stay readable.
const char* BaseName(const char* file) {
    const char* slash = std::strrchr(file, '/');
    return slash ? slash + 1 : file;
}

} // namespace

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::SetLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::ParseLevel(const std::string& levelStr) {
    if (levelStr == "DEBUG") return LogLevel::DEBUG;
    if (levelStr == "INFO") return LogLevel::INFO;
    if (levelStr == "WARN") return LogLevel::WARN;
    if (levelStr == "ERROR") return LogLevel::ERROR;
    if (levelStr == "FATAL") return LogLevel::FATAL;
    return LogLevel::INFO;
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    static const bool colored = ::isatty(STDOUT_FILENO) != 0;

    std::lock_guard<std::mutex> lock(mutex_);

    // Format: [Time] [Level] [File:Line] Message
    if (colored) std::cout << LevelToColor(level);
    std::cout << "[" << GetCurrentTime() << "] "
              << "[" << LevelToString(level) << "] "
              << "[" << BaseName(file) << ":" << line << "] "
              << msg;
    if (colored) std::cout << "\033[0m";
    std::cout << std::endl;
}

} // namespace common
} // namespace wsproxy
