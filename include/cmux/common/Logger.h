#pragma once

#include <string>
#include <mutex>
#include <sstream>

namespace cmux {
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
    // Unknown names map to INFO.
    static LogLevel ParseLevel(const std::string& levelStr);

    // Colour is on by default only when stderr is a terminal.
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
    std::stringstream ss_;
};

} // namespace common
} // namespace cmux

#define CMUX_LOG_AT(lvl) \
    if (cmux::common::LogLevel::lvl >= cmux::common::Logger::Instance().GetLevel()) \
    cmux::common::LogStream(cmux::common::LogLevel::lvl, __FILE__, __LINE__)

#define LOG_DEBUG CMUX_LOG_AT(DEBUG)
#define LOG_INFO  CMUX_LOG_AT(INFO)
#define LOG_WARN  CMUX_LOG_AT(WARN)
#define LOG_ERROR CMUX_LOG_AT(ERROR)
#define LOG_FATAL CMUX_LOG_AT(FATAL)
