#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

#include "core/transaction.hpp"
#include "persist/transaction_store.hpp"
#include "util/clock.hpp"

namespace test {

// Clock that only moves when told to; every read advances by step_ns so records
// ingested back to back still get distinct, increasing created_at values.
class ManualClock final : public util::WallClock {
public:
    explicit ManualClock(std::uint64_t start_ns = 1'700'000'000'000'000'000ULL, std::uint64_t step_ns = 1'000)
        : now_(start_ns), step_(step_ns) {}

    std::uint64_t now_ns() const noexcept override { return now_.fetch_add(step_, std::memory_order_relaxed); }

    void advance(std::uint64_t ns) noexcept { now_.fetch_add(ns, std::memory_order_relaxed); }

private:
    mutable std::atomic<std::uint64_t> now_;
    std::uint64_t step_;
};

inline core::DayNumber day(std::string_view iso) {
    return core::parse_date(iso).value();
}

// Fluent draft builder. Defaults: xero, 100.00 USD on 2024-01-01.
class TxBuilder {
public:
    TxBuilder() {
        tx_.provider = core::Provider::Xero;
        tx_.amount_cents = 10'000;
        tx_.currency = core::make_currency("USD").value();
        tx_.transaction_date = day("2024-01-01");
        tx_.set_external_id("EXT-" + std::to_string(next_external_id()));
    }

    TxBuilder& xero() { tx_.provider = core::Provider::Xero; return *this; }
    TxBuilder& quickbooks() { tx_.provider = core::Provider::QuickBooks; return *this; }
    TxBuilder& provider(core::Provider p) { tx_.provider = p; return *this; }
    TxBuilder& cents(core::AmountCents c) { tx_.amount_cents = c; return *this; }
    TxBuilder& amount(std::string_view s) { tx_.amount_cents = core::parse_amount(s).value(); return *this; }
    TxBuilder& currency(std::string_view s) { tx_.currency = core::make_currency(s).value(); return *this; }
    TxBuilder& date(std::string_view iso) { tx_.transaction_date = day(iso); return *this; }
    TxBuilder& external_id(std::string_view s) { tx_.set_external_id(s); return *this; }
    TxBuilder& description(std::string_view s) { tx_.set_description(s); return *this; }
    TxBuilder& created_at(std::uint64_t ns) { tx_.created_at_ns = ns; return *this; }

    const core::Transaction& draft() const noexcept { return tx_; }

    // Creates the record directly in the store, bypassing the gateway.
    core::TransactionId create_in(persist::TransactionStore& store) const {
        core::TransactionId id = core::no_transaction;
        core::TransactionId existing = core::no_transaction;
        if (store.create(tx_, id, existing) != persist::StoreStatus::Ok) {
            return core::no_transaction;
        }
        return id;
    }

private:
    static std::uint64_t next_external_id() {
        static std::atomic<std::uint64_t> counter{1};
        return counter.fetch_add(1, std::memory_order_relaxed);
    }

    core::Transaction tx_{};
};

} // namespace test
