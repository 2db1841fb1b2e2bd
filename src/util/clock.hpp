#pragma once

#include <chrono>
#include <cstdint>

namespace util {

// Wall-clock source used to stamp ingestion time. Tests substitute a manual clock
// so created_at tie-breaks are reproducible.
class WallClock {
public:
    virtual ~WallClock() = default;

    [[nodiscard]] virtual std::uint64_t now_ns() const noexcept {
        const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count());
    }
};

[[nodiscard]] inline std::uint64_t get_monotonic_ns() noexcept {
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch()
        ).count()
    );
}

} // namespace util
