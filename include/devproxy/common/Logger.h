#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace devproxy {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

// Process-wide sink shared by every event loop thread. Records look like
// "[2026-01-02 03:04:05.678] [INFO ] [t1234] [DevServer.cpp:42] message".
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
    LogLevel GetLevel() const { return level_.load(std::memory_order_relaxed); }

    // Case-insensitive; "WARNING" is accepted. Unknown names map to INFO.
    static LogLevel ParseLevel(const std::string& name);

    // Mirror every record into a plain-text file (no colors).
    // An empty path closes the file. Returns false if the file cannot be opened.
    bool SetOutputFile(const std::string& path);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_;
    // Colors only when stdout is a terminal.
    const bool colorize_;
    std::ofstream file_;
    std::mutex mutex_;
};

// LOG_INFO << "upstream " << host << " refused";
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
} // namespace devproxy

// The empty if-branch keeps a following else bound to the caller's if.
#define LOG_DEBUG \
    if (devproxy::common::LogLevel::DEBUG < devproxy::common::Logger::Instance().GetLevel()) { \
    } else \
    devproxy::common::LogStream(devproxy::common::LogLevel::DEBUG, __FILE__, __LINE__)

#define LOG_INFO \
    if (devproxy::common::LogLevel::INFO < devproxy::common::Logger::Instance().GetLevel()) { \
    } else \
    devproxy::common::LogStream(devproxy::common::LogLevel::INFO, __FILE__, __LINE__)

#define LOG_WARN \
    if (devproxy::common::LogLevel::WARN < devproxy::common::Logger::Instance().GetLevel()) { \
    } else \
    devproxy::common::LogStream(devproxy::common::LogLevel::WARN, __FILE__, __LINE__)

#define LOG_ERROR \
    if (devproxy::common::LogLevel::ERROR < devproxy::common::Logger::Instance().GetLevel()) { \
    } else \
    devproxy::common::LogStream(devproxy::common::LogLevel::ERROR, __FILE__, __LINE__)

#define LOG_FATAL \
    if (devproxy::common::LogLevel::FATAL < devproxy::common::Logger::Instance().GetLevel()) { \
    } else \
    devproxy::common::LogStream(devproxy::common::LogLevel::FATAL, __FILE__, __LINE__)
