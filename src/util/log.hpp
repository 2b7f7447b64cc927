#pragma once

#include <atomic>
#include <cstdio>
#include <cstdarg>
#include <mutex>

namespace util {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Fatal };

inline const char* level_name(LogLevel lvl) noexcept {
    switch (lvl) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Fatal: return "FATAL";
    }
    return "UNKNOWN";
}

namespace detail {
inline std::mutex& log_mutex() {
    static std::mutex mtx;
    return mtx;
}

inline std::atomic<LogLevel>& min_level() {
    static std::atomic<LogLevel> lvl{LogLevel::Info};
    return lvl;
}

inline void log_impl(LogLevel lvl, const char* fmt, va_list args) {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::fprintf(stderr, "%s: ", level_name(lvl));
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
}
} // namespace detail

// Records below the threshold are discarded. Defaults to Info.
inline void set_min_level(LogLevel lvl) noexcept {
    detail::min_level().store(lvl, std::memory_order_relaxed);
}

inline LogLevel min_level() noexcept {
    return detail::min_level().load(std::memory_order_relaxed);
}

inline bool log_enabled(LogLevel lvl) noexcept {
    return static_cast<int>(lvl) >= static_cast<int>(min_level());
}

inline void log(LogLevel lvl, const char* fmt, ...) {
    if (!log_enabled(lvl)) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    detail::log_impl(lvl, fmt, args);
    va_end(args);
}

} // namespace util

#define RECON_LOG_TRACE(FMT, ...) ::util::log(::util::LogLevel::Trace, (FMT) __VA_OPT__(, __VA_ARGS__))
#define RECON_LOG_DEBUG(FMT, ...) ::util::log(::util::LogLevel::Debug, (FMT) __VA_OPT__(, __VA_ARGS__))
#define RECON_LOG_INFO(FMT, ...)  ::util::log(::util::LogLevel::Info,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define RECON_LOG_WARN(FMT, ...)  ::util::log(::util::LogLevel::Warn,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define RECON_LOG_ERROR(FMT, ...) ::util::log(::util::LogLevel::Error, (FMT) __VA_OPT__(, __VA_ARGS__))
#define RECON_LOG_FATAL(FMT, ...) ::util::log(::util::LogLevel::Fatal, (FMT) __VA_OPT__(, __VA_ARGS__))
