#pragma once
#include <cstdarg>
#include <mutex>

enum class LogLevel { TRACE = 0, DEBUG, INFO, WARN, ERROR };

// Process wide logger on stderr. Sessions tag their lines themselves,
// e.g. "[Host 0] ...".
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel lvl);
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

private:
    Logger() = default;
    std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    static const char* levelStr(LogLevel lvl);
};
