#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>
#include <vector>

#include "core/transaction.hpp"
#include "persist/endianness.hpp"
#include "util/crc32c.hpp"

namespace persist {

// Journal file layout:
//   header (16 bytes): "ICRJRNL1" | u32 version_le | u32 reserved
//   records:           [u32 payload_len_le][payload bytes][u32 crc32c_le]
// The checksum covers the little-endian length prefix followed by the payload.
//
// Payload = u8 kind followed by the kind's body (all integers little-endian):
//   TxCreated (kind 1), serialized Transaction, 155 bytes:
//     offset size field
//          0   8   id
//          8   1   provider
//          9   1   status
//         10   8   amount_cents
//         18   3   currency
//         21   4   transaction_date (days since epoch, i32)
//         25   8   matched_transaction_id
//         33   8   created_at_ns
//         41  48   external_id[48]
//         89   1   external_id_len
//         90  64   description[64]
//        154   1   description_len
//   PairMatched (kind 2), 16 bytes: u64 first_id | u64 second_id

inline constexpr std::array<char, 8> journal_magic{'I', 'C', 'R', 'J', 'R', 'N', 'L', '1'};
inline constexpr std::uint32_t journal_version = 1;
inline constexpr std::size_t journal_header_size = 16;
inline constexpr std::size_t transaction_serialized_size = 155;
inline constexpr std::size_t pair_matched_serialized_size = 16;
inline constexpr std::size_t max_journal_payload_size = 4 * 1024;

enum class JournalRecordKind : std::uint8_t { TxCreated = 1, PairMatched = 2 };

struct JournalRecord {
    JournalRecordKind kind{JournalRecordKind::TxCreated};
    core::Transaction tx{};                          // TxCreated
    core::TransactionId first{core::no_transaction}; // PairMatched
    core::TransactionId second{core::no_transaction};
};

struct JournalFrameView {
    std::uint32_t payload_length{0};
    std::span<const std::byte> payload{};
    std::uint32_t checksum{0};
};

inline constexpr std::size_t framed_size(std::size_t payload_len) noexcept {
    return sizeof(std::uint32_t) + payload_len + sizeof(std::uint32_t);
}

inline std::array<std::byte, journal_header_size> make_journal_header() noexcept {
    std::array<std::byte, journal_header_size> out{};
    std::memcpy(out.data(), journal_magic.data(), journal_magic.size());
    store_le<std::uint32_t>(journal_version, out.data() + 8);
    store_le<std::uint32_t>(0, out.data() + 12);
    return out;
}

inline bool parse_journal_header(std::span<const std::byte> data) noexcept {
    if (data.size() < journal_header_size) {
        return false;
    }
    if (std::memcmp(data.data(), journal_magic.data(), journal_magic.size()) != 0) {
        return false;
    }
    return load_le<std::uint32_t>(data.data() + 8) == journal_version;
}

inline std::uint32_t compute_frame_crc(std::uint32_t payload_len, std::span<const std::byte> payload) noexcept {
    std::array<std::byte, sizeof(std::uint32_t)> len_le{};
    store_le<std::uint32_t>(payload_len, len_le.data());
    std::uint32_t crc = util::Crc32c::initial;
    crc = util::Crc32c::update(crc, len_le);
    crc = util::Crc32c::update(crc, payload);
    return util::Crc32c::finalize(crc);
}

// Appends one framed record to out.
inline void append_frame(std::span<const std::byte> payload, std::vector<std::byte>& out) {
    const auto len = static_cast<std::uint32_t>(payload.size());
    const std::size_t base = out.size();
    out.resize(base + framed_size(payload.size()));
    std::byte* p = out.data() + base;
    store_le<std::uint32_t>(len, p);
    if (!payload.empty()) {
        std::memcpy(p + sizeof(std::uint32_t), payload.data(), payload.size());
    }
    store_le<std::uint32_t>(compute_frame_crc(len, payload), p + sizeof(std::uint32_t) + payload.size());
}

// Splits the frame at the front of data. False when data is too short for the
// declared length or the length is out of range.
inline bool parse_frame(std::span<const std::byte> data, JournalFrameView& out) noexcept {
    if (data.size() < framed_size(0)) {
        return false;
    }
    const std::uint32_t payload_len = load_le<std::uint32_t>(data.data());
    if (payload_len == 0 || payload_len > max_journal_payload_size) {
        return false;
    }
    if (framed_size(payload_len) > data.size()) {
        return false;
    }
    out.payload_length = payload_len;
    out.payload = data.subspan(sizeof(std::uint32_t), payload_len);
    out.checksum = load_le<std::uint32_t>(data.data() + sizeof(std::uint32_t) + payload_len);
    return true;
}

inline bool validate_frame(const JournalFrameView& frame) noexcept {
    return compute_frame_crc(frame.payload_length, frame.payload) == frame.checksum;
}

// True when data opens with a checksum-valid frame of payload_len bytes, whatever
// its length prefix says. Used to tell a damaged prefix from a torn write.
inline bool frame_intact_as(std::span<const std::byte> data, std::uint32_t payload_len) noexcept {
    if (data.size() < framed_size(payload_len)) {
        return false;
    }
    const auto payload = data.subspan(sizeof(std::uint32_t), payload_len);
    return compute_frame_crc(payload_len, payload) ==
           load_le<std::uint32_t>(data.data() + sizeof(std::uint32_t) + payload_len);
}

void serialize_transaction(const core::Transaction& tx, std::byte* out) noexcept;
bool deserialize_transaction(std::span<const std::byte> data, core::Transaction& out) noexcept;

// Serialized payload (kind byte + body) for a record.
std::vector<std::byte> encode_record_payload(const JournalRecord& rec);
bool decode_record_payload(std::span<const std::byte> payload, JournalRecord& out) noexcept;

} // namespace persist
