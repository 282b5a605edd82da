#include "logger.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::setLevel(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(mtx_);
    level_ = lvl;
}

const char* Logger::levelStr(LogLevel lvl) {
    switch (lvl) {
    case LogLevel::TRACE:
        return "TRACE";
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARN:
        return "WARN";
    default:
        return "ERROR";
    }
}

void Logger::log(LogLevel lvl, const char* fmt, ...) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (lvl < level_)
        return;
    using namespace std::chrono;
    auto t = system_clock::to_time_t(system_clock::now());
    std::tm local{};
    localtime_r(&t, &local);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &local);
    std::fprintf(stderr, "%s [%s] ", ts, levelStr(lvl));
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}
