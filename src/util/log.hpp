#pragma once

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <optional>
#include <string_view>

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

inline std::optional<LogLevel> parse_log_level(std::string_view s) noexcept {
    constexpr LogLevel all[] = {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                                LogLevel::Warn,  LogLevel::Error, LogLevel::Fatal};
    for (const LogLevel lvl : all) {
        const std::string_view name = level_name(lvl);
        if (s.size() != name.size()) {
            continue;
        }
        bool same = true;
        for (std::size_t i = 0; i < s.size() && same; ++i) {
            const char c = (s[i] >= 'a' && s[i] <= 'z') ? static_cast<char>(s[i] - 'a' + 'A') : s[i];
            same = c == name[i];
        }
        if (same) {
            return lvl;
        }
    }
    return std::nullopt;
}

namespace detail {

// ICRECON_LOG_LEVEL seeds the threshold before any config has been read.
inline LogLevel initial_threshold() noexcept {
    const char* env = std::getenv("ICRECON_LOG_LEVEL");
    return env ? parse_log_level(env).value_or(LogLevel::Info) : LogLevel::Info;
}

struct SlowLogState {
    std::mutex mu;
    std::atomic<LogLevel> threshold{initial_threshold()};
};

inline SlowLogState& slow_log_state() {
    static SlowLogState state;
    return state;
}

} // namespace detail

inline void set_log_threshold(LogLevel lvl) noexcept {
    detail::slow_log_state().threshold.store(lvl, std::memory_order_relaxed);
}

inline bool slow_log_enabled(LogLevel lvl) noexcept {
    return lvl >= detail::slow_log_state().threshold.load(std::memory_order_relaxed);
}

// Synchronous, mutex-serialised stderr logging for startup, recovery and shutdown
// paths. Worker threads use the async logger in async_log.hpp instead.
[[gnu::format(printf, 2, 3)]] inline void slow_log(LogLevel lvl, const char* fmt, ...) {
    if (!slow_log_enabled(lvl)) {
        return;
    }
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto millis = static_cast<unsigned>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &tm_utc);

    va_list args;
    va_start(args, fmt);
    {
        std::lock_guard<std::mutex> lock(detail::slow_log_state().mu);
        std::fprintf(stderr, "%s.%03uZ icrecon %s: ", stamp, millis, level_name(lvl));
        std::vfprintf(stderr, fmt, args);
        std::fputc('\n', stderr);
    }
    va_end(args);
}

} // namespace util

#define LOG_SLOW_TRACE(FMT, ...) ::util::slow_log(::util::LogLevel::Trace, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_DEBUG(FMT, ...) ::util::slow_log(::util::LogLevel::Debug, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_INFO(FMT, ...)  ::util::slow_log(::util::LogLevel::Info,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_WARN(FMT, ...)  ::util::slow_log(::util::LogLevel::Warn,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_ERROR(FMT, ...) ::util::slow_log(::util::LogLevel::Error, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_FATAL(FMT, ...) ::util::slow_log(::util::LogLevel::Fatal, (FMT) __VA_OPT__(, __VA_ARGS__))
