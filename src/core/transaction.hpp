#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace core {

using TransactionId = std::uint64_t;
using AmountCents = std::int64_t; // fixed-point, two decimal places
using DayNumber = std::int32_t;   // days since 1970-01-01

inline constexpr TransactionId no_transaction = 0; // ids are assigned from 1

enum class Provider : std::uint8_t { Xero = 0, QuickBooks = 1 };
enum class TxStatus : std::uint8_t { Pending = 0, Matched = 1 };

inline constexpr std::size_t provider_count = 2;

[[nodiscard]] inline constexpr Provider opposite(Provider p) noexcept {
    return p == Provider::Xero ? Provider::QuickBooks : Provider::Xero;
}

// ISO 4217 alphabetic code. Only constructed through make_currency().
struct CurrencyCode {
    std::array<char, 3> letters{};

    std::string_view view() const noexcept { return {letters.data(), letters.size()}; }

    friend bool operator==(const CurrencyCode&, const CurrencyCode&) = default;
    friend auto operator<=>(const CurrencyCode&, const CurrencyCode&) = default;
};

struct Transaction {
    static constexpr std::size_t external_id_capacity = 48;
    static constexpr std::size_t description_capacity = 64;

    TransactionId id{no_transaction};
    Provider provider{Provider::Xero};
    AmountCents amount_cents{0};
    CurrencyCode currency{};
    DayNumber transaction_date{0};
    TxStatus status{TxStatus::Pending};
    TransactionId matched_transaction_id{no_transaction};
    std::uint64_t created_at_ns{0};

    // Provider-side identifier, e.g. a Xero BankTransactionID.
    char external_id[external_id_capacity]{};
    std::uint8_t external_id_len{0};
    char description[description_capacity]{};
    std::uint8_t description_len{0};

    void set_external_id(std::string_view s) noexcept {
        const auto len = s.size() > external_id_capacity ? external_id_capacity : s.size();
        std::memcpy(external_id, s.data(), len);
        external_id_len = static_cast<std::uint8_t>(len);
    }
    void set_description(std::string_view s) noexcept {
        const auto len = s.size() > description_capacity ? description_capacity : s.size();
        std::memcpy(description, s.data(), len);
        description_len = static_cast<std::uint8_t>(len);
    }

    std::string_view external_id_view() const noexcept { return {external_id, external_id_len}; }
    std::string_view description_view() const noexcept { return {description, description_len}; }

    bool is_pending() const noexcept { return status == TxStatus::Pending; }
    bool is_matched() const noexcept { return status == TxStatus::Matched; }
};

static_assert(std::is_trivially_copyable_v<Transaction>, "Transaction must remain trivially copyable");

const char* provider_name(Provider p) noexcept;
const char* status_name(TxStatus s) noexcept;
std::optional<Provider> parse_provider(std::string_view s) noexcept;
std::optional<TxStatus> parse_status(std::string_view s) noexcept;

// Exactly three upper-case ASCII letters.
std::optional<CurrencyCode> make_currency(std::string_view s) noexcept;

// Decimal with at most two fractional digits, optional leading '-': "100", "100.1", "-0.01".
std::optional<AmountCents> parse_amount(std::string_view s) noexcept;
std::string format_amount(AmountCents cents);

// Proleptic Gregorian calendar.
std::optional<DayNumber> make_day(int year, unsigned month, unsigned day) noexcept;
std::optional<DayNumber> parse_date(std::string_view iso) noexcept; // "YYYY-MM-DD"
std::string format_date(DayNumber day);

} // namespace core
