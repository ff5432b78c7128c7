#pragma once

#include <atomic>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace portico {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

// Process-wide line logger: [time] [LEVEL] [file:line] message.
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level) { level_ = level; }
    LogLevel GetLevel() const { return level_; }
    bool Enabled(LogLevel level) const { return level >= level_; }
    // Case-insensitive; unknown names give INFO.
    LogLevel ParseLevel(const std::string& name) const;

    // nullptr restores stdout. Lines are colored only on a stdout terminal.
    void SetOutput(std::ostream* out);
    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::ostream* out_ = nullptr;
    bool colorTerminal_;
    std::mutex mutex_;
};

// Collects one message and hands it to the Logger when the statement ends.
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}
    ~LogStream() { Logger::Instance().Log(level_, file_, line_, buf_.str()); }

    template <typename T>
    LogStream& operator<<(const T& val) {
        buf_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::ostringstream buf_;
};

} // namespace common
} // namespace portico

#define PORTICO_LOG(level)                                                          \
    if (!portico::common::Logger::Instance().Enabled(portico::common::LogLevel::level)) \
        ;                                                                           \
    else                                                                            \
        portico::common::LogStream(portico::common::LogLevel::level, __FILE__, __LINE__)

#define LOG_DEBUG PORTICO_LOG(DEBUG)
#define LOG_INFO PORTICO_LOG(INFO)
#define LOG_WARN PORTICO_LOG(WARN)
#define LOG_ERROR PORTICO_LOG(ERROR)
#define LOG_FATAL PORTICO_LOG(FATAL)
