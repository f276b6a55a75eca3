#pragma once

#include <string>
#include <mutex>
#include <atomic>
#include <sstream>

namespace wsproxy {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_.load(std::memory_order_relaxed); }
    // Unknown names map to INFO.
    LogLevel ParseLevel(const std::string& levelStr);
    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::mutex mutex_;
};

// Stream wrapper to allow usage like: LOG_INFO << "Message " << 123;
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}

    ~LogStream() {
        Logger::Instance().Log(level_, file_, line_, ss_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::stringstream ss_;
};

} // namespace common
} // namespace wsproxy

#define LOG_DEBUG \
    if (wsproxy::common::LogLevel::DEBUG >= wsproxy::common::Logger::Instance().GetLevel()) \
    wsproxy::common::LogStream(wsproxy::common::LogLevel::DEBUG, __FILE__, __LINE__)

#define LOG_INFO \
    if (wsproxy::common::LogLevel::INFO >= wsproxy::common::Logger::Instance().GetLevel()) \
    wsproxy::common::LogStream(wsproxy::common::LogLevel::INFO, __FILE__, __LINE__)

#define LOG_WARN \
    if (wsproxy::common::LogLevel::WARN >= wsproxy::common::Logger::Instance().GetLevel()) \
    wsproxy::common::LogStream(wsproxy::common::LogLevel::WARN, __FILE__, __LINE__)

#define LOG_ERROR \
    if (wsproxy::common::LogLevel::ERROR >= wsproxy::common::Logger::Instance().GetLevel()) \
    wsproxy::common::LogStream(wsproxy::common::LogLevel::ERROR, __FILE__, __LINE__)

#define LOG_FATAL \
    if (wsproxy::common::LogLevel::FATAL >= wsproxy::common::Logger::Instance().GetLevel()) \
    wsproxy::common::LogStream(wsproxy::common::LogLevel::FATAL, __FILE__, __LINE__)
