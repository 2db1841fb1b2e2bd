#include "core/transaction.hpp"

#include <charconv>
#include <chrono>
#include <cstdio>
#include <limits>

namespace core {

const char* provider_name(Provider p) noexcept {
    switch (p) {
    case Provider::Xero: return "xero";
    case Provider::QuickBooks: return "quickbooks";
    }
    return "unknown";
}

const char* status_name(TxStatus s) noexcept {
    switch (s) {
    case TxStatus::Pending: return "pending";
    case TxStatus::Matched: return "matched";
    }
    return "unknown";
}

std::optional<Provider> parse_provider(std::string_view s) noexcept {
    if (s == "xero") return Provider::Xero;
    if (s == "quickbooks" || s == "qb") return Provider::QuickBooks;
    return std::nullopt;
}

std::optional<TxStatus> parse_status(std::string_view s) noexcept {
    if (s == "pending") return TxStatus::Pending;
    if (s == "matched") return TxStatus::Matched;
    return std::nullopt;
}

std::optional<CurrencyCode> make_currency(std::string_view s) noexcept {
    if (s.size() != 3) {
        return std::nullopt;
    }
    CurrencyCode out{};
    for (std::size_t i = 0; i < 3; ++i) {
        const char c = s[i];
        if (c < 'A' || c > 'Z') {
            return std::nullopt;
        }
        out.letters[i] = c;
    }
    return out;
}

std::optional<AmountCents> parse_amount(std::string_view s) noexcept {
    bool negative = false;
    if (!s.empty() && s.front() == '-') {
        negative = true;
        s.remove_prefix(1);
    }
    const auto dot = s.find('.');
    const std::string_view whole = s.substr(0, dot);
    const std::string_view frac = dot == std::string_view::npos ? std::string_view{} : s.substr(dot + 1);
    if (whole.empty() || (dot != std::string_view::npos && frac.empty()) || frac.size() > 2) {
        return std::nullopt;
    }
    if (whole.front() < '0' || whole.front() > '9') {
        return std::nullopt;
    }

    std::int64_t units = 0;
    const auto conv = std::from_chars(whole.data(), whole.data() + whole.size(), units);
    if (conv.ec != std::errc() || conv.ptr != whole.data() + whole.size()) {
        return std::nullopt;
    }
    if (units > std::numeric_limits<std::int64_t>::max() / 100 - 1) {
        return std::nullopt;
    }

    std::int64_t cents = 0;
    for (std::size_t i = 0; i < 2; ++i) {
        cents *= 10;
        if (i < frac.size()) {
            const char c = frac[i];
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            cents += c - '0';
        }
    }

    const std::int64_t total = units * 100 + cents;
    return negative ? -total : total;
}

std::string format_amount(AmountCents cents) {
    const bool negative = cents < 0;
    const auto magnitude = negative ? -static_cast<unsigned long long>(cents) : static_cast<unsigned long long>(cents);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s%llu.%02llu", negative ? "-" : "", magnitude / 100, magnitude % 100);
    return buf;
}

std::optional<DayNumber> make_day(int year, unsigned month, unsigned day) noexcept {
    const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return static_cast<DayNumber>(std::chrono::sys_days{ymd}.time_since_epoch().count());
}

std::optional<DayNumber> parse_date(std::string_view iso) noexcept {
    if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-') {
        return std::nullopt;
    }
    auto read_field = [&](std::size_t pos, std::size_t len, unsigned& out) {
        const char* first = iso.data() + pos;
        const char* last = first + len;
        const auto conv = std::from_chars(first, last, out);
        return conv.ec == std::errc() && conv.ptr == last;
    };
    unsigned year = 0;
    unsigned month = 0;
    unsigned day = 0;
    if (!read_field(0, 4, year) || !read_field(5, 2, month) || !read_field(8, 2, day)) {
        return std::nullopt;
    }
    return make_day(static_cast<int>(year), month, day);
}

std::string format_date(DayNumber day) {
    const std::chrono::year_month_day ymd{std::chrono::sys_days{std::chrono::days{day}}};
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
    return buf;
}

} // namespace core
