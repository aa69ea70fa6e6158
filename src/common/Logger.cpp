#include "devproxy/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sys/syscall.h>
#include <unistd.h>

namespace devproxy {
namespace common {

namespace {

std::string FormatNow() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tmv;
    localtime_r(&secs, &tmv);
    char buf[32];
    const size_t n = std::strftime(buf, sizeof buf, "%Y-%m-%d %H:%M:%S", &tmv);
    std::ostringstream ss;
    ss.write(buf, static_cast<std::streamsize>(n));
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

const char* LevelName(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO ";
    case LogLevel::WARN: return "WARN ";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::FATAL: return "FATAL";
    }
    return "?????";
}

const char* LevelColor(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG: return "\033[36m";
    case LogLevel::INFO: return "\033[32m";
    case LogLevel::WARN: return "\033[33m";
    case LogLevel::ERROR: return "\033[31m";
    case LogLevel::FATAL: return "\033[35m";
    }
    return "";
}

const char* BaseName(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

// Kernel thread id, cached per thread, so worker loops can be told apart.
long ThreadTag() {
    thread_local const long tid = static_cast<long>(::syscall(SYS_gettid));
    return tid;
}

} // namespace

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : level_(LogLevel::INFO), colorize_(::isatty(STDOUT_FILENO) == 1) {}

LogLevel Logger::ParseLevel(const std::string& name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    return LogLevel::INFO;
}

bool Logger::SetOutputFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) file_.close();
    if (path.empty()) return true;
    file_.open(path, std::ios::out | std::ios::app);
    return file_.is_open();
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    std::ostringstream record;
    record << '[' << FormatNow() << "] [" << LevelName(level) << "] [t" << ThreadTag() << "] ["
           << BaseName(file) << ':' << line << "] " << msg;
    const std::string text = record.str();

    std::lock_guard<std::mutex> lock(mutex_);
    if (colorize_) {
        std::cout << LevelColor(level) << text << "\033[0m\n";
    } else {
        std::cout << text << '\n';
    }
    std::cout.flush();
    if (file_.is_open()) {
        file_ << text << '\n';
        file_.flush();
    }
}

} // namespace common
} // namespace devproxy
