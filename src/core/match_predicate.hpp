#pragma once

#include <cstdint>
#include <cstdlib>
#include <tuple>

#include "core/recon_config.hpp"
#include "core/transaction.hpp"

namespace core {

[[nodiscard]] inline std::int64_t amount_distance(const Transaction& a, const Transaction& b) noexcept {
    return std::llabs(a.amount_cents - b.amount_cents);
}

[[nodiscard]] inline std::int32_t date_distance(const Transaction& a, const Transaction& b) noexcept {
    return std::abs(a.transaction_date - b.transaction_date);
}

enum class PredicateFailure : std::uint8_t {
    None,
    SameTransaction,
    SameProvider,
    CurrencyMismatch,
    DateOutOfWindow,
    AmountOutOfTolerance,
    NotPending,
};

// Evaluated over loaded snapshots; no I/O. Checks are ordered cheapest first.
[[nodiscard]] inline PredicateFailure check_match(const Transaction& subject,
                                                  const Transaction& candidate,
                                                  const ReconConfig& cfg) noexcept {
    if (subject.id == candidate.id) {
        return PredicateFailure::SameTransaction;
    }
    if (subject.provider == candidate.provider) {
        return PredicateFailure::SameProvider;
    }
    if (subject.currency != candidate.currency) {
        return PredicateFailure::CurrencyMismatch;
    }
    if (date_distance(subject, candidate) > cfg.date_window_days) {
        return PredicateFailure::DateOutOfWindow;
    }
    if (amount_distance(subject, candidate) > cfg.amount_tolerance_cents) {
        return PredicateFailure::AmountOutOfTolerance;
    }
    if (!subject.is_pending() || !candidate.is_pending()) {
        return PredicateFailure::NotPending;
    }
    return PredicateFailure::None;
}

[[nodiscard]] inline bool is_match(const Transaction& subject,
                                   const Transaction& candidate,
                                   const ReconConfig& cfg) noexcept {
    return check_match(subject, candidate, cfg) == PredicateFailure::None;
}

// Same checks minus the status requirement: what a stored matched pair must satisfy.
[[nodiscard]] inline bool pair_within_tolerance(const Transaction& a,
                                                const Transaction& b,
                                                const ReconConfig& cfg) noexcept {
    const auto failure = check_match(a, b, cfg);
    return failure == PredicateFailure::None || failure == PredicateFailure::NotPending;
}

// Candidate preference: closest date, then closest amount, then earliest created.
// The id breaks any remaining tie so the order is total.
struct CandidateRank {
    std::int32_t date_gap{0};
    std::int64_t amount_gap{0};
    std::uint64_t created_at_ns{0};
    TransactionId id{no_transaction};

    friend bool operator<(const CandidateRank& l, const CandidateRank& r) noexcept {
        return std::tie(l.date_gap, l.amount_gap, l.created_at_ns, l.id) <
               std::tie(r.date_gap, r.amount_gap, r.created_at_ns, r.id);
    }
};

inline const char* predicate_failure_name(PredicateFailure f) noexcept {
    switch (f) {
    case PredicateFailure::None: return "none";
    case PredicateFailure::SameTransaction: return "same_transaction";
    case PredicateFailure::SameProvider: return "same_provider";
    case PredicateFailure::CurrencyMismatch: return "currency_mismatch";
    case PredicateFailure::DateOutOfWindow: return "date_out_of_window";
    case PredicateFailure::AmountOutOfTolerance: return "amount_out_of_tolerance";
    case PredicateFailure::NotPending: return "not_pending";
    }
    return "unknown";
}

} // namespace core
