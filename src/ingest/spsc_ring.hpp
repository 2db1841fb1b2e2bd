#pragma once

#include <atomic>
#include <cstddef>
#include <type_traits>

namespace ingest {

// Single-producer/single-consumer ring between a feed subscriber and its worker.
// Positions increase monotonically and are masked on access, so all Capacity slots
// are usable. Each side keeps a cached copy of the other side's position and only
// reloads it when the cache says full (producer) or empty (consumer).
template <typename T, std::size_t Capacity>
class alignas(64) SpscRing {
    static_assert(Capacity != 0 && (Capacity & (Capacity - 1)) == 0, "Capacity must be power of two");
    static_assert(std::is_trivially_copyable_v<T>, "SpscRing elements are copied by value");

public:
    using value_type = T;

    SpscRing() = default;
    SpscRing(const SpscRing&) = delete;
    SpscRing& operator=(const SpscRing&) = delete;

    bool try_push(const T& v) noexcept {
        const std::size_t head = head_.load(std::memory_order_relaxed);
        if (head - cached_tail_ == Capacity) {
            cached_tail_ = tail_.load(std::memory_order_acquire);
            if (head - cached_tail_ == Capacity) {
                return false; // full
            }
        }
        buffer_[head & mask] = v;
        head_.store(head + 1, std::memory_order_release);
        return true;
    }

    bool try_pop(T& out) noexcept {
        const std::size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == cached_head_) {
            cached_head_ = head_.load(std::memory_order_acquire);
            if (tail == cached_head_) {
                return false; // empty
            }
        }
        out = buffer_[tail & mask];
        tail_.store(tail + 1, std::memory_order_release);
        return true;
    }

    std::size_t size_approx() const noexcept {
        const std::size_t tail = tail_.load(std::memory_order_acquire);
        const std::size_t head = head_.load(std::memory_order_acquire);
        return head - tail;
    }

    bool empty_approx() const noexcept { return size_approx() == 0; }

    static constexpr std::size_t capacity() noexcept { return Capacity; }

private:
    static constexpr std::size_t mask = Capacity - 1;

    alignas(64) std::atomic<std::size_t> head_{0};
    std::size_t cached_tail_{0}; // producer only
    alignas(64) std::atomic<std::size_t> tail_{0};
    std::size_t cached_head_{0}; // consumer only
    alignas(64) T buffer_[Capacity];
};

} // namespace ingest
