#pragma once

#include <string>
#include <mutex>
#include <sstream>

namespace vrcproxy {
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
    LogLevel GetLevel() const { return level_; }
    // Unknown names fall back to INFO. Matching is case-insensitive.
    static LogLevel ParseLevel(const std::string& levelStr);

    void SetColor(bool on);
    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::INFO;
    bool color_ = false;
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
    std::ostringstream ss_;
};

} // namespace common
} // namespace vrcproxy

// Macros for easy usage
#define LOG_DEBUG \
    if (vrcproxy::common::LogLevel::DEBUG >= vrcproxy::common::Logger::Instance().GetLevel()) \
    vrcproxy::common::LogStream(vrcproxy::common::LogLevel::DEBUG, __FILE__, __LINE__)

#define LOG_INFO \
    if (vrcproxy::common::LogLevel::INFO >= vrcproxy::common::Logger::Instance().GetLevel()) \
    vrcproxy::common::LogStream(vrcproxy::common::LogLevel::INFO, __FILE__, __LINE__)

#define LOG_WARN \
    if (vrcproxy::common::LogLevel::WARN >= vrcproxy::common::Logger::Instance().GetLevel()) \
    vrcproxy::common::LogStream(vrcproxy::common::LogLevel::WARN, __FILE__, __LINE__)

#define LOG_ERROR \
    if (vrcproxy::common::LogLevel::ERROR >= vrcproxy::common::Logger::Instance().GetLevel()) \
    vrcproxy::common::LogStream(vrcproxy::common::LogLevel::ERROR, __FILE__, __LINE__)

#define LOG_FATAL \
    if (vrcproxy::common::LogLevel::FATAL >= vrcproxy::common::Logger::Instance().GetLevel()) \
    vrcproxy::common::LogStream(vrcproxy::common::LogLevel::FATAL, __FILE__, __LINE__)
