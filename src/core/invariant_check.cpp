#include "core/invariant_check.hpp"

#include <unordered_map>

#include "core/match_predicate.hpp"

namespace core {

const char* violation_kind_name(ViolationKind k) noexcept {
    switch (k) {
    case ViolationKind::MissingLink: return "missing_link";
    case ViolationKind::DanglingLink: return "dangling_link";
    case ViolationKind::AsymmetricLink: return "asymmetric_link";
    case ViolationKind::OutsideTolerance: return "outside_tolerance";
    case ViolationKind::PendingWithLink: return "pending_with_link";
    }
    return "unknown";
}

persist::StoreStatus verify_store_invariants(const persist::TransactionStore& store, InvariantReport& out) {
    constexpr ReconConfig limits = pairing_limits();
    out = InvariantReport{};
    std::vector<Transaction> all;
    const persist::StoreStatus st = store.list(persist::TransactionFilter{}, all);
    if (st != persist::StoreStatus::Ok) {
        return st;
    }

    std::unordered_map<TransactionId, const Transaction*> by_id;
    by_id.reserve(all.size());
    for (const auto& tx : all) {
        by_id.emplace(tx.id, &tx);
    }

    for (const auto& tx : all) {
        ++out.transactions_checked;
        const TransactionId other_id = tx.matched_transaction_id;
        if (tx.is_pending()) {
            if (other_id != no_transaction) {
                out.violations.push_back({ViolationKind::PendingWithLink, tx.id, other_id});
            }
            continue;
        }
        if (other_id == no_transaction || other_id == tx.id) {
            out.violations.push_back({ViolationKind::MissingLink, tx.id, other_id});
            continue;
        }
        const auto it = by_id.find(other_id);
        if (it == by_id.end()) {
            out.violations.push_back({ViolationKind::DanglingLink, tx.id, other_id});
            continue;
        }
        const Transaction& other = *it->second;
        if (!other.is_matched() || other.matched_transaction_id != tx.id) {
            out.violations.push_back({ViolationKind::AsymmetricLink, tx.id, other_id});
            continue;
        }
        // Each pair is seen from both sides; judge it once, from the lower id.
        if (tx.id < other.id) {
            ++out.matched_pairs;
            if (!pair_within_tolerance(tx, other, limits)) {
                out.violations.push_back({ViolationKind::OutsideTolerance, tx.id, other_id});
            }
        }
    }
    return persist::StoreStatus::Ok;
}

} // namespace core
