#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "util/log.hpp"

namespace util {

// Subsystem a worker log line comes from. Drop counts and filtering are per category.
enum class LogCategory : std::uint8_t { Ingest, Recon, Feed };

inline constexpr std::size_t log_category_count = 3;

inline constexpr std::uint32_t category_bit(LogCategory c) noexcept {
    return 1u << static_cast<std::uint32_t>(c);
}

inline constexpr std::uint32_t all_log_categories = (1u << log_category_count) - 1;

const char* log_category_name(LogCategory c) noexcept;
std::optional<LogCategory> parse_log_category(std::string_view s) noexcept;

struct LogRecord {
    std::uint64_t timestamp_ns{0};
    std::uint64_t subject_id{0}; // transaction the line is about, 0 if none
    std::uint32_t thread_id_hash{0};
    LogLevel level{LogLevel::Info};
    LogCategory category{LogCategory::Recon};
    std::uint16_t message_len{0};
    char message[216]{};
};

// Bounded multi-producer log queue drained by one consumer thread. Producers never
// block: a full ring drops the record and counts it against its category.
class AsyncLogger {
public:
    struct Config {
        std::size_t capacity_pow2{1u << 12};
        LogLevel min_level{LogLevel::Info};
        std::uint32_t category_mask{all_log_categories};
        bool flush_on_warn{true};
        std::size_t flush_every{256};
        std::string file_path{}; // stderr when empty
        std::uint64_t consumer_sleep_ns{50'000};
    };

    AsyncLogger() = default;
    ~AsyncLogger();

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    bool start(const Config& cfg) noexcept;
    void stop() noexcept;
    bool running() const noexcept { return !stop_.load(std::memory_order_acquire); }

    // Filtered records (level or category) report success without queueing.
    bool try_log(LogLevel lvl,
                 LogCategory category,
                 std::uint64_t subject_id,
                 const char* msg,
                 std::size_t len) noexcept;
    [[gnu::format(printf, 5, 6)]] bool try_logf(LogLevel lvl,
                                                LogCategory category,
                                                std::uint64_t subject_id,
                                                const char* fmt,
                                                ...) noexcept;

    bool enabled(LogLevel lvl, LogCategory category) const noexcept {
        return lvl >= config_.min_level && (config_.category_mask & category_bit(category)) != 0;
    }

    std::uint64_t dropped() const noexcept;
    std::uint64_t dropped(LogCategory category) const noexcept {
        return dropped_[static_cast<std::size_t>(category)].load(std::memory_order_relaxed);
    }
    std::uint64_t written() const noexcept { return written_.load(std::memory_order_relaxed); }

private:
    struct Slot {
        std::atomic<std::uint64_t> sequence{0};
        LogRecord record{};
    };

    bool claim(std::uint64_t& pos) noexcept;
    bool try_pop(LogRecord& out) noexcept;
    bool open_sink(const std::string& path) noexcept;
    void close_sink() noexcept;
    void consumer_loop() noexcept;
    void write_record(const LogRecord& rec) noexcept;

    std::atomic<std::uint64_t> head_{0};
    std::uint64_t tail_{0};
    std::size_t mask_{0};
    std::unique_ptr<Slot[]> slots_{};

    std::atomic<bool> stop_{true};
    std::thread consumer_{};
    Config config_{};

    FILE* sink_{stderr};
    bool owns_file_{false};

    std::array<std::atomic<std::uint64_t>, log_category_count> dropped_{};
    std::atomic<std::uint64_t> written_{0};
};

// Process-wide logger shared by feed workers, the gateway and the reconciliation engine.
AsyncLogger& worker_logger() noexcept;
bool init_worker_logger(const AsyncLogger::Config& cfg) noexcept;
void shutdown_worker_logger() noexcept;

} // namespace util

// Formats on the calling thread; keep off tight loops.
#define LOG_WARM_TX(LVL, CAT, TX, FMT, ...) \
    ::util::worker_logger().try_logf((LVL), (CAT), (TX), (FMT) __VA_OPT__(, __VA_ARGS__))

#define LOG_WARM_DEBUG(CAT, FMT, ...) LOG_WARM_TX(::util::LogLevel::Debug, (CAT), 0, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_WARM_INFO(CAT, FMT, ...)  LOG_WARM_TX(::util::LogLevel::Info,  (CAT), 0, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_WARM_WARN(CAT, FMT, ...)  LOG_WARM_TX(::util::LogLevel::Warn,  (CAT), 0, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_WARM_ERROR(CAT, FMT, ...) LOG_WARM_TX(::util::LogLevel::Error, (CAT), 0, (FMT) __VA_OPT__(, __VA_ARGS__))

#define LOG_WARM_TX_DEBUG(CAT, TX, FMT, ...) LOG_WARM_TX(::util::LogLevel::Debug, (CAT), (TX), (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_WARM_TX_INFO(CAT, TX, FMT, ...)  LOG_WARM_TX(::util::LogLevel::Info,  (CAT), (TX), (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_WARM_TX_WARN(CAT, TX, FMT, ...)  LOG_WARM_TX(::util::LogLevel::Warn,  (CAT), (TX), (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_WARM_TX_ERROR(CAT, TX, FMT, ...) LOG_WARM_TX(::util::LogLevel::Error, (CAT), (TX), (FMT) __VA_OPT__(, __VA_ARGS__))
