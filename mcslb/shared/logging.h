#pragma once
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <chrono>
#include <mutex>
#include <string_view>

#include "keyword_hash.h"

enum log_level : uint8_t
{
    log_debug = 0,
    log_info  = 1,
    log_warn  = 2,
    log_error = 3
};

struct logger
{
    static inline log_level g_level = log_info;

    static bool parse_level(std::string_view str, log_level& level)
    {
        switch (keyword_fold(str))
        {
            case keyword_hash("debug"): level = log_debug; return true;
            case keyword_hash("info"):  level = log_info;  return true;
            case keyword_hash("warn"):  level = log_warn;  return true;
            case keyword_hash("error"): level = log_error; return true;
            default: return false;
        }
    }

    // Short name of the calling thread ("main", "registry", "conn"...)
    static inline thread_local const char* t_thread = "main";

    static const char* level_name(log_level level)
    {
        static constexpr const char* names[] = { "DEBUG", "INFO", "WARN", "ERROR" };
        return level <= log_error ? names[level] : "?";
    }

    __attribute__((format(printf, 2, 3)))
    static void log(log_level level, const char* fmt, ...)
    {
        if (level < g_level)
            return;

        char msg[1024];
        va_list ap;
        va_start(ap, fmt);
        std::vsnprintf(msg, sizeof(msg), fmt, ap);
        va_end(ap);

        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        int ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000);
        std::tm tm{};
        localtime_r(&t, &tm);

        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);

        static std::mutex mtx;
        std::lock_guard<std::mutex> lock(mtx);
        std::fprintf(stderr, "%s.%03d %-5s [%s] %s\n", stamp, ms, level_name(level), t_thread, msg);
    }
};

#define LOG_DEBUG(...) do { if (logger::g_level <= log_debug) logger::log(log_debug, __VA_ARGS__); } while(0)
#define LOG_INFO(...)  do { if (logger::g_level <= log_info)  logger::log(log_info,  __VA_ARGS__); } while(0)
#define LOG_WARN(...)  do { if (logger::g_level <= log_warn)  logger::log(log_warn,  __VA_ARGS__); } while(0)
#define LOG_ERROR(...) do { if (logger::g_level <= log_error) logger::log(log_error, __VA_ARGS__); } while(0)
