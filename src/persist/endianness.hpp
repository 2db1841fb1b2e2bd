#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

namespace persist {

// Journal integers are little-endian on disk regardless of host order.
template <typename U>
inline constexpr U byteswap_unsigned(U v) noexcept {
    static_assert(std::is_unsigned_v<U>, "byteswap_unsigned expects an unsigned type");
    U out = 0;
    for (std::size_t i = 0; i < sizeof(U); ++i) {
        out = static_cast<U>((out << 8) | ((v >> (8 * i)) & 0xFFu));
    }
    return out;
}

template <typename U>
inline constexpr U to_le(U v) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        return v;
    }
    return byteswap_unsigned(v);
}

template <typename U>
inline constexpr U from_le(U v) noexcept { return to_le(v); }

template <typename U>
inline void store_le(U v, std::byte* p) noexcept {
    const U le = to_le(v);
    std::memcpy(p, &le, sizeof(le));
}

template <typename U>
inline U load_le(const std::byte* p) noexcept {
    U v{};
    std::memcpy(&v, p, sizeof(v));
    return from_le(v);
}

} // namespace persist
