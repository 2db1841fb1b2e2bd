#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace util {

// Table-driven software CRC32C (Castagnoli). Journal frames are checksummed with it.
namespace detail {

// Reflected Castagnoli polynomial
inline constexpr std::uint32_t crc32c_poly = 0x82F63B78u;

constexpr std::array<std::uint32_t, 256> make_crc32c_table() noexcept {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t i = 0; i < 256; ++i) {
        std::uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1u) ? (crc32c_poly ^ (c >> 1)) : (c >> 1);
        }
        table[i] = c;
    }
    return table;
}

inline constexpr auto crc32c_table = make_crc32c_table();

} // namespace detail

class Crc32c {
public:
    static constexpr std::uint32_t initial = 0xFFFFFFFFu;
    static constexpr std::uint32_t xor_out = 0xFFFFFFFFu;

    static std::uint32_t update(std::uint32_t crc, std::span<const std::byte> data) noexcept {
        std::uint32_t c = crc;
        for (const std::byte b : data) {
            c = (c >> 8) ^ detail::crc32c_table[(c ^ static_cast<std::uint8_t>(b)) & 0xFFu];
        }
        return c;
    }

    static std::uint32_t compute(std::span<const std::byte> data) noexcept {
        return finalize(update(initial, data));
    }

    static constexpr std::uint32_t finalize(std::uint32_t crc) noexcept { return crc ^ xor_out; }
};

} // namespace util
