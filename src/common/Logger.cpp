#include "portico/common/Logger.h"

#include <unistd.h>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iostream>
#include <strings.h>

namespace portico {
namespace common {

namespace {

struct LevelStyle {
    const char* name;
    const char* color;
};

const LevelStyle kStyles[] = {
    {"DEBUG", "\033[36m"},
    {"INFO ", "\033[32m"},
    {"WARN ", "\033[33m"},
    {"ERROR", "\033[31m"},
    {"FATAL", "\033[35m"},
};

const char kReset[] = "\033[0m";

// 2026-01-31 12:00:00.123
std::string Timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm local;
    localtime_r(&secs, &local);
    char buf[32];
    const size_t n = std::strftime(buf, sizeof buf, "%Y-%m-%d %H:%M:%S", &local);
    std::snprintf(buf + n, sizeof buf - n, ".%03d", static_cast<int>(millis));
    return buf;
}

const char* Basename(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

} // namespace

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : colorTerminal_(::isatty(STDOUT_FILENO) == 1) {}

LogLevel Logger::ParseLevel(const std::string& name) const {
    static const struct {
        const char* name;
        LogLevel level;
    } kNames[] = {
        {"debug", LogLevel::DEBUG}, {"info", LogLevel::INFO}, {"warn", LogLevel::WARN},
        {"warning", LogLevel::WARN}, {"error", LogLevel::ERROR}, {"fatal", LogLevel::FATAL},
    };
    for (const auto& entry : kNames) {
        if (::strcasecmp(name.c_str(), entry.name) == 0) {
            return entry.level;
        }
    }
    return LogLevel::INFO;
}

void Logger::SetOutput(std::ostream* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out;
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    const LevelStyle& style = kStyles[static_cast<int>(level)];
    std::string text;
    text.reserve(msg.size() + 64);
    text += '[';
    text += Timestamp();
    text += "] [";
    text += style.name;
    text += "] [";
    text += Basename(file);
    text += ':';
    text += std::to_string(line);
    text += "] ";
    text += msg;

    std::lock_guard<std::mutex> lock(mutex_);
    if (out_ != nullptr) {
        *out_ << text << '\n';
        out_->flush();
        return;
    }
    if (colorTerminal_) {
        std::cout << style.color << text << kReset << '\n';
    } else {
        std::cout << text << '\n';
    }
    std::cout.flush();
}

} // namespace common
} // namespace portico
