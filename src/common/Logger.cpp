#include "vrcproxy/common/Logger.h"

#include <unistd.h>
#include <sys/syscall.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace vrcproxy {
namespace common {

namespace {

std::string FormatNow() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tmBuf;
    ::localtime_r(&in_time_t, &tmBuf);

    std::ostringstream ss;
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

const char* LevelToColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35m";
        default: return "\033[0m";
    }
}

// Strip directories so lines stay short: "src/pipeline/RequestPipeline.cpp" -> "RequestPipeline.cpp".
const char* BaseName(const char* path) {
    const char* slash = nullptr;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') slash = p;
    }
    return slash ? slash + 1 : path;
}

thread_local long t_tid = 0;

long CurrentTid() {
    if (t_tid == 0) {
        t_tid = static_cast<long>(::syscall(SYS_gettid));
    }
    return t_tid;
}

} // namespace

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : color_(::isatty(STDOUT_FILENO) == 1) {
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

void Logger::SetColor(bool on) {
    std::lock_guard<std::mutex> lock(mutex_);
    color_ = on;
}

LogLevel Logger::ParseLevel(const std::string& levelStr) {
    std::string s = levelStr;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (s == "DEBUG") return LogLevel::DEBUG;
    if (s == "INFO") return LogLevel::INFO;
    if (s == "WARN" || s == "WARNING") return LogLevel::WARN;
    if (s == "ERROR") return LogLevel::ERROR;
    if (s == "FATAL") return LogLevel::FATAL;
    return LogLevel::INFO;
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    const std::string ts = FormatNow();
    const long tid = CurrentTid();

    std::lock_guard<std::mutex> lock(mutex_);

    // Format: [Time] [Level] [tid] [File:Line] Message
    if (color_) std::cout << LevelToColor(level);
    std::cout << "[" << ts << "] "
              << "[" << LevelToString(level) << "] "
              << "[" << tid << "] "
              << "[" << BaseName(file) << ":" << line << "] "
              << msg;
    if (color_) std::cout << "\033[0m";
    std::cout << std::endl;
}

} // namespace common
} // namespace vrcproxy
