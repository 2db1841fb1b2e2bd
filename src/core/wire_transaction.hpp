#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

#include "core/transaction.hpp"

namespace core {

// Fixed-layout transaction record published on a provider feed, one per message.
// The provider is implied by the stream it arrives on. Fields are host byte order;
// publishers and subscribers run on the same architecture.
#pragma pack(push, 1)
struct WireTransaction {
    static constexpr std::size_t external_id_capacity = Transaction::external_id_capacity;
    static constexpr std::size_t description_capacity = Transaction::description_capacity;

    std::int64_t amount_cents{0};
    char currency[3]{};
    std::int32_t transaction_date{0}; // days since 1970-01-01

    char external_id[external_id_capacity]{};
    std::uint8_t external_id_len{0};

    char description[description_capacity]{};
    std::uint8_t description_len{0};
};
#pragma pack(pop)

static_assert(std::is_trivially_copyable_v<WireTransaction>, "WireTransaction must be trivial");
static_assert(sizeof(WireTransaction) == 129, "WireTransaction layout is expected to be packed and fixed-size");

// Builds an unvalidated draft; id, status and created_at are left for the gateway.
inline Transaction from_wire(const WireTransaction& w, Provider provider) noexcept {
    Transaction tx{};
    tx.provider = provider;
    tx.amount_cents = w.amount_cents;
    std::memcpy(tx.currency.letters.data(), w.currency, sizeof(w.currency));
    tx.transaction_date = w.transaction_date;

    const auto ext_len = std::min<std::size_t>(w.external_id_len, WireTransaction::external_id_capacity);
    std::memcpy(tx.external_id, w.external_id, ext_len);
    tx.external_id_len = static_cast<std::uint8_t>(ext_len);

    const auto desc_len = std::min<std::size_t>(w.description_len, WireTransaction::description_capacity);
    std::memcpy(tx.description, w.description, desc_len);
    tx.description_len = static_cast<std::uint8_t>(desc_len);
    return tx;
}

inline WireTransaction to_wire(const Transaction& tx) noexcept {
    WireTransaction w{};
    w.amount_cents = tx.amount_cents;
    std::memcpy(w.currency, tx.currency.letters.data(), sizeof(w.currency));
    w.transaction_date = tx.transaction_date;
    std::memcpy(w.external_id, tx.external_id, tx.external_id_len);
    w.external_id_len = tx.external_id_len;
    std::memcpy(w.description, tx.description, tx.description_len);
    w.description_len = tx.description_len;
    return w;
}

} // namespace core
