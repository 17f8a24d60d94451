#pragma once
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>
#include <optional>
#include <string>

namespace downlink
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // operator-facing transfer events (finalized, abandoned, acked)
};

inline Level &global_level()
{
    static Level lv = Level::Info;
    return lv;
}

// sender workers log concurrently; one line per lock
inline std::mutex &log_mutex()
{
    static std::mutex m;
    return m;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

inline std::optional<Level> parse_level(const char *name)
{
    if (!name)
        return std::nullopt;
    const std::string level(name);
    if (level == "debug" || level == "DEBUG")
        return Level::Debug;
    if (level == "info" || level == "INFO")
        return Level::Info;
    if (level == "warn" || level == "warning" || level == "WARN" || level == "WARNING")
        return Level::Warning;
    if (level == "error" || level == "err" || level == "ERROR" || level == "ERR")
        return Level::Error;
    if (level == "system" || level == "SYSTEM")
        return Level::System;
    return std::nullopt;
}

// Unknown names fall back to Info.
inline void set_log_level_by_name(const char *name)
{
    set_log_level(parse_level(name).value_or(Level::Info));
}

inline const char *level_name(Level lv)
{
    switch (lv)
    {
        case Level::Debug:
            return "[DEBUG]";
        case Level::Info:
            return "[INFO]";
        case Level::Warning:
            return "[WARN]";
        case Level::Error:
            return "[ERROR]";
        case Level::System:
            return "[SYSTEM]";
    }
    return "?";
}

inline void timestamp(char *buf, size_t n)
{
    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    std::snprintf(buf, n, "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                  (int)ms.count());
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    std::lock_guard<std::mutex> lk(log_mutex());
    std::fprintf(stderr, "%s %s %s: ", ts, level_name(lv), func ? func : "?");

    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', stderr);
}

#define LOG_DEBUG(...) ::downlink::logf(::downlink::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::downlink::logf(::downlink::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::downlink::logf(::downlink::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::downlink::logf(::downlink::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::downlink::logf(::downlink::Level::System, __func__, __VA_ARGS__)

}  // namespace downlink
