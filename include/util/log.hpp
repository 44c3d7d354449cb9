#pragma once
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <string>

namespace chunksync
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // run banners and summaries, never filtered
};

inline Level &global_level()
{
    static Level lv = Level::Info;
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

inline void set_log_level_by_name(const char *name)
{
    std::string level = std::string(name);
    if (level == "debug" || level == "DEBUG")
        set_log_level(Level::Debug);
    else if (level == "info" || level == "INFO")
        set_log_level(Level::Info);
    else if (level == "warn" || level == "warning" || level == "WARN" || level == "WARNING")
        set_log_level(Level::Warning);
    else if (level == "error" || level == "err" || level == "ERROR" || level == "ERR")
        set_log_level(Level::Error);
    else
        set_log_level(Level::Info);  // default
}

// Catch-all sink: receives every message regardless of the console threshold.
inline std::FILE *&log_file()
{
    static std::FILE *f = nullptr;
    return f;
}

inline bool open_log_file(const std::string &path)
{
    std::FILE *f = std::fopen(path.c_str(), "a");
    if (!f)
        return false;
    if (log_file())
        std::fclose(log_file());
    log_file() = f;
    return true;
}

inline void close_log_file()
{
    if (log_file())
    {
        std::fclose(log_file());
        log_file() = nullptr;
    }
}

inline std::atomic<unsigned> &error_count()
{
    static std::atomic<unsigned> n{0};
    return n;
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

inline void write_line(std::FILE *out, const char *ts, Level lv, const char *func,
                       const char *fmt, va_list ap)
{
    std::fprintf(out, "%s %s %s: ", ts, level_name(lv), func ? func : "?");
    std::vfprintf(out, fmt, ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', out);
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if (lv == Level::Error)
        error_count().fetch_add(1, std::memory_order_relaxed);

    const bool to_console = (int)lv >= (int)global_level();
    if (!to_console && !log_file())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    if (to_console)
    {
        va_list ap;
        va_start(ap, fmt);
        write_line(stderr, ts, lv, func, fmt, ap);
        va_end(ap);
    }
    if (log_file())
    {
        va_list ap;
        va_start(ap, fmt);
        write_line(log_file(), ts, lv, func, fmt, ap);
        va_end(ap);
        std::fflush(log_file());
    }
}

#define LOG_DEBUG(...) ::chunksync::logf(::chunksync::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::chunksync::logf(::chunksync::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::chunksync::logf(::chunksync::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::chunksync::logf(::chunksync::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::chunksync::logf(::chunksync::Level::System, __func__, __VA_ARGS__)

}  // namespace chunksync
