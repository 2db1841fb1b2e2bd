#include "util/async_log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdarg>
#include <cstring>
#include <ctime>
#include <functional>
#include <new>
#include <system_error>

namespace util {
namespace {

AsyncLogger& global_worker_logger() {
    static AsyncLogger logger;
    return logger;
}

std::uint64_t wall_clock_ns() noexcept {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

std::uint32_t this_thread_hash() noexcept {
    static thread_local const std::uint32_t hash =
        static_cast<std::uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    return hash;
}

constexpr bool is_power_of_two(std::size_t v) noexcept { return v != 0 && (v & (v - 1)) == 0; }

} // namespace

const char* log_category_name(LogCategory c) noexcept {
    switch (c) {
    case LogCategory::Ingest: return "ingest";
    case LogCategory::Recon: return "recon";
    case LogCategory::Feed: return "feed";
    }
    return "unknown";
}

std::optional<LogCategory> parse_log_category(std::string_view s) noexcept {
    for (std::size_t i = 0; i < log_category_count; ++i) {
        const auto c = static_cast<LogCategory>(i);
        if (s == log_category_name(c)) {
            return c;
        }
    }
    return std::nullopt;
}

AsyncLogger::~AsyncLogger() { stop(); }

bool AsyncLogger::start(const Config& cfg) noexcept {
    if (cfg.capacity_pow2 < 2 || !is_power_of_two(cfg.capacity_pow2)) {
        return false;
    }
    if (running()) {
        return true;
    }

    std::unique_ptr<Slot[]> slots(new (std::nothrow) Slot[cfg.capacity_pow2]);
    if (!slots) {
        return false;
    }
    for (std::size_t i = 0; i < cfg.capacity_pow2; ++i) {
        slots[i].sequence.store(i, std::memory_order_relaxed);
    }
    if (!open_sink(cfg.file_path)) {
        return false;
    }

    config_ = cfg;
    slots_ = std::move(slots);
    mask_ = cfg.capacity_pow2 - 1;
    head_.store(0, std::memory_order_relaxed);
    tail_ = 0;

    stop_.store(false, std::memory_order_release);
    try {
        consumer_ = std::thread([this] { consumer_loop(); });
    } catch (const std::system_error&) {
        stop_.store(true, std::memory_order_release);
        close_sink();
        return false;
    }
    return true;
}

void AsyncLogger::stop() noexcept {
    if (stop_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (consumer_.joinable()) {
        consumer_.join();
    }
    close_sink();
}

bool AsyncLogger::open_sink(const std::string& path) noexcept {
    if (path.empty()) {
        sink_ = stderr;
        owns_file_ = false;
        return true;
    }
    FILE* f = std::fopen(path.c_str(), "a");
    if (!f) {
        return false;
    }
    sink_ = f;
    owns_file_ = true;
    return true;
}

void AsyncLogger::close_sink() noexcept {
    if (owns_file_ && sink_) {
        std::fclose(sink_);
    }
    sink_ = stderr;
    owns_file_ = false;
}

std::uint64_t AsyncLogger::dropped() const noexcept {
    std::uint64_t total = 0;
    for (const auto& d : dropped_) {
        total += d.load(std::memory_order_relaxed);
    }
    return total;
}

bool AsyncLogger::claim(std::uint64_t& pos) noexcept {
    pos = head_.load(std::memory_order_relaxed);
    for (;;) {
        const std::uint64_t seq = slots_[pos & mask_].sequence.load(std::memory_order_acquire);
        const auto dif = static_cast<std::int64_t>(seq) - static_cast<std::int64_t>(pos);
        if (dif == 0) {
            if (head_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed, std::memory_order_relaxed)) {
                return true;
            }
        } else if (dif < 0) {
            return false;
        } else {
            pos = head_.load(std::memory_order_relaxed);
        }
    }
}

bool AsyncLogger::try_log(LogLevel lvl,
                          LogCategory category,
                          std::uint64_t subject_id,
                          const char* msg,
                          std::size_t len) noexcept {
    if (!running() || !slots_) {
        return false;
    }
    if (!enabled(lvl, category)) {
        return true;
    }

    std::uint64_t pos = 0;
    if (!claim(pos)) {
        dropped_[static_cast<std::size_t>(category)].fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    Slot& slot = slots_[pos & mask_];
    LogRecord& rec = slot.record;
    rec.timestamp_ns = wall_clock_ns();
    rec.subject_id = subject_id;
    rec.thread_id_hash = this_thread_hash();
    rec.level = lvl;
    rec.category = category;
    rec.message_len = static_cast<std::uint16_t>(std::min(sizeof(rec.message), len));
    if (rec.message_len > 0) {
        std::memcpy(rec.message, msg, rec.message_len);
    }
    slot.sequence.store(pos + 1, std::memory_order_release);
    return true;
}

bool AsyncLogger::try_logf(LogLevel lvl,
                           LogCategory category,
                           std::uint64_t subject_id,
                           const char* fmt,
                           ...) noexcept {
    // Skip formatting for lines that would be filtered anyway.
    if (running() && !enabled(lvl, category)) {
        return true;
    }
    char buffer[sizeof(LogRecord::message)];
    va_list args;
    va_start(args, fmt);
    const int n = std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);
    const std::size_t len = n < 0 ? 0u : std::min(static_cast<std::size_t>(n), sizeof(buffer) - 1);
    return try_log(lvl, category, subject_id, buffer, len);
}

bool AsyncLogger::try_pop(LogRecord& out) noexcept {
    Slot& slot = slots_[tail_ & mask_];
    const std::uint64_t seq = slot.sequence.load(std::memory_order_acquire);
    if (seq != tail_ + 1) {
        return false;
    }
    out = slot.record;
    slot.sequence.store(tail_ + mask_ + 1, std::memory_order_release);
    ++tail_;
    return true;
}

void AsyncLogger::write_record(const LogRecord& rec) noexcept {
    const auto secs = static_cast<std::time_t>(rec.timestamp_ns / 1'000'000'000ull);
    const auto micros = static_cast<unsigned>((rec.timestamp_ns / 1'000ull) % 1'000'000ull);
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &tm_utc);
    std::fprintf(sink_, "%s.%06uZ [%s][%08x][%s] ", stamp, micros, level_name(rec.level),
                 static_cast<unsigned>(rec.thread_id_hash), log_category_name(rec.category));
    if (rec.subject_id != 0) {
        std::fprintf(sink_, "tx=%llu ", static_cast<unsigned long long>(rec.subject_id));
    }
    std::fwrite(rec.message, 1, rec.message_len, sink_);
    std::fputc('\n', sink_);
}

void AsyncLogger::consumer_loop() noexcept {
    std::size_t since_flush = 0;
    std::uint32_t idle_spins = 0;
    LogRecord rec{};
    while (!stop_.load(std::memory_order_acquire) || tail_ != head_.load(std::memory_order_acquire)) {
        if (!try_pop(rec)) {
            if (since_flush > 0) {
                std::fflush(sink_);
                since_flush = 0;
            }
            if (idle_spins < 256 || config_.consumer_sleep_ns == 0) {
                ++idle_spins;
                std::this_thread::yield();
            } else {
                idle_spins = 0;
                std::this_thread::sleep_for(std::chrono::nanoseconds(config_.consumer_sleep_ns));
            }
            continue;
        }
        write_record(rec);
        written_.fetch_add(1, std::memory_order_relaxed);
        idle_spins = 0;
        ++since_flush;
        if ((config_.flush_on_warn && rec.level >= LogLevel::Warn) ||
            (config_.flush_every > 0 && since_flush >= config_.flush_every)) {
            std::fflush(sink_);
            since_flush = 0;
        }
    }
    std::fflush(sink_);
}

AsyncLogger& worker_logger() noexcept { return global_worker_logger(); }

bool init_worker_logger(const AsyncLogger::Config& cfg) noexcept { return global_worker_logger().start(cfg); }

void shutdown_worker_logger() noexcept { global_worker_logger().stop(); }

} // namespace util
