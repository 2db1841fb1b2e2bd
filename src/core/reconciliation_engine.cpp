#include "core/reconciliation_engine.hpp"

#include <new>
#include <stdexcept>

#include "core/match_predicate.hpp"
#include "util/async_log.hpp"
#include "util/log.hpp"

namespace core {

namespace {

inline void bump(std::atomic<std::uint64_t>& c) noexcept { c.fetch_add(1, std::memory_order_relaxed); }

inline unsigned long long ull(TransactionId id) noexcept { return static_cast<unsigned long long>(id); }

constexpr auto log_category = util::LogCategory::Recon;

} // namespace

const char* reconcile_status_name(ReconcileStatus s) noexcept {
    switch (s) {
    case ReconcileStatus::Ok: return "ok";
    case ReconcileStatus::NotFound: return "not_found";
    case ReconcileStatus::ConstraintViolation: return "constraint_violation";
    case ReconcileStatus::StoreUnavailable: return "store_unavailable";
    }
    return "unknown";
}

ReconciliationEngine::ReconciliationEngine(persist::TransactionStore& store,
                                           MatchIndex& index,
                                           ReconCounters& counters,
                                           ReconConfig cfg)
    : store_(store), index_(index), counters_(counters), cfg_(cfg) {
    if (!within_pairing_limits(cfg_)) {
        throw std::invalid_argument("ReconConfig tolerances must lie within 0..1 cents and 0..3 days");
    }
    if (index_.date_window_days() < cfg_.date_window_days) {
        throw std::invalid_argument("MatchIndex date window narrower than ReconConfig date window");
    }
}

ReconcileResult ReconciliationEngine::reconcile(TransactionId id) noexcept {
    bump(counters_.reconcile_calls);

    Transaction subject{};
    const persist::StoreStatus st = store_.get(id, subject);
    if (st == persist::StoreStatus::NotFound) {
        bump(counters_.not_found);
        return ReconcileResult{ReconcileStatus::NotFound, TxStatus::Pending, no_transaction};
    }
    if (st != persist::StoreStatus::Ok) {
        bump(counters_.store_unavailable);
        return ReconcileResult{ReconcileStatus::StoreUnavailable, TxStatus::Pending, no_transaction};
    }
    if (subject.is_matched()) {
        return existing_match(subject);
    }

    try {
        return search(subject);
    } catch (const std::bad_alloc&) {
        bump(counters_.store_unavailable);
        LOG_WARM_TX_ERROR(log_category, id, "candidate snapshot allocation failed");
        return ReconcileResult{ReconcileStatus::StoreUnavailable, TxStatus::Pending, no_transaction};
    }
}

ReconcileResult ReconciliationEngine::existing_match(const Transaction& subject) noexcept {
    const TransactionId other_id = subject.matched_transaction_id;
    if (!cfg_.verify_counterpart_on_idempotent && other_id != no_transaction) {
        bump(counters_.already_matched);
        return ReconcileResult{ReconcileStatus::Ok, TxStatus::Matched, other_id};
    }

    bool broken = other_id == no_transaction || other_id == subject.id;
    if (!broken) {
        Transaction other{};
        const persist::StoreStatus st = store_.get(other_id, other);
        if (st == persist::StoreStatus::Unavailable) {
            bump(counters_.store_unavailable);
            return ReconcileResult{ReconcileStatus::StoreUnavailable, TxStatus::Matched, other_id};
        }
        broken = st != persist::StoreStatus::Ok || !other.is_matched() || other.matched_transaction_id != subject.id;
    }
    if (broken) {
        bump(counters_.constraint_violations);
        LOG_SLOW_ERROR("constraint violation: tx=%llu is matched to %llu but the link is not mutual",
                       ull(subject.id),
                       ull(other_id));
        return ReconcileResult{ReconcileStatus::ConstraintViolation, TxStatus::Matched, other_id};
    }

    bump(counters_.already_matched);
    return ReconcileResult{ReconcileStatus::Ok, TxStatus::Matched, other_id};
}

ReconcileResult ReconciliationEngine::search(const Transaction& subject) {
    CandidateCursor cursor = index_.query(subject);
    TransactionId candidate_id = no_transaction;
    while (cursor.next(candidate_id)) {
        Transaction candidate{};
        const persist::StoreStatus st = store_.get(candidate_id, candidate);
        if (st == persist::StoreStatus::NotFound) {
            bump(counters_.stale_candidates);
            continue;
        }
        if (st != persist::StoreStatus::Ok) {
            bump(counters_.store_unavailable);
            return ReconcileResult{ReconcileStatus::StoreUnavailable, TxStatus::Pending, no_transaction};
        }
        if (!candidate.is_pending()) {
            // Claimed since the index snapshot, or the winner has not yet removed it.
            bump(counters_.stale_candidates);
            drop_stale(candidate);
            continue;
        }
        if (!is_match(subject, candidate, cfg_)) {
            continue;
        }

        switch (try_pair(subject, candidate)) {
        case Attempt::Matched:
            return ReconcileResult{ReconcileStatus::Ok, TxStatus::Matched, candidate.id};
        case Attempt::Skipped:
            continue;
        case Attempt::Unavailable:
            return ReconcileResult{ReconcileStatus::StoreUnavailable, TxStatus::Pending, no_transaction};
        case Attempt::Corrupt:
            return ReconcileResult{ReconcileStatus::ConstraintViolation, TxStatus::Pending, no_transaction};
        case Attempt::Lost:
            break;
        }

        // Lost the pair. If the subject itself was claimed, report that match;
        // otherwise move on to the next candidate.
        Transaction current{};
        const persist::StoreStatus reload = store_.get(subject.id, current);
        if (reload != persist::StoreStatus::Ok) {
            bump(counters_.store_unavailable);
            return ReconcileResult{ReconcileStatus::StoreUnavailable, TxStatus::Pending, no_transaction};
        }
        if (current.is_matched()) {
            return existing_match(current);
        }
    }

    bump(counters_.no_match);
    LOG_WARM_TX_DEBUG(log_category, subject.id, "no counterpart; stays pending");
    return ReconcileResult{ReconcileStatus::Ok, TxStatus::Pending, no_transaction};
}

ReconciliationEngine::Attempt ReconciliationEngine::try_pair(const Transaction& subject,
                                                             const Transaction& candidate) noexcept {
    Transaction new_subject = subject;
    new_subject.status = TxStatus::Matched;
    new_subject.matched_transaction_id = candidate.id;
    Transaction new_candidate = candidate;
    new_candidate.status = TxStatus::Matched;
    new_candidate.matched_transaction_id = subject.id;

    const persist::StoreStatus st = store_.atomic_update_pair(subject.id,
                                                              candidate.id,
                                                              TxStatus::Pending,
                                                              TxStatus::Pending,
                                                              new_subject,
                                                              new_candidate);
    switch (st) {
    case persist::StoreStatus::Ok:
        index_.remove_pair(new_subject, new_candidate);
        bump(counters_.matched);
        LOG_WARM_TX_INFO(log_category,
                         subject.id,
                         "(%s) matched tx=%llu (%s) amount=%lld/%lld",
                         provider_name(subject.provider),
                         ull(candidate.id),
                         provider_name(candidate.provider),
                         static_cast<long long>(subject.amount_cents),
                         static_cast<long long>(candidate.amount_cents));
        return Attempt::Matched;
    case persist::StoreStatus::Conflict:
        bump(counters_.races_lost);
        LOG_WARM_TX_DEBUG(log_category, subject.id, "lost tx=%llu to a concurrent match", ull(candidate.id));
        return Attempt::Lost;
    case persist::StoreStatus::NotFound:
        bump(counters_.stale_candidates);
        return Attempt::Skipped;
    case persist::StoreStatus::Unavailable:
        bump(counters_.store_unavailable);
        LOG_WARM_TX_WARN(log_category, subject.id, "store unavailable during pair update");
        return Attempt::Unavailable;
    case persist::StoreStatus::Duplicate:
    case persist::StoreStatus::Invalid:
        break;
    }
    bump(counters_.constraint_violations);
    LOG_SLOW_ERROR("constraint violation: store rejected pair tx=%llu <-> tx=%llu (%s)",
                   ull(subject.id),
                   ull(candidate.id),
                   persist::store_status_name(st));
    return Attempt::Corrupt;
}

void ReconciliationEngine::drop_stale(const Transaction& candidate) noexcept {
    if (cfg_.prune_stale_candidates && index_.remove(candidate)) {
        LOG_WARM_TX_DEBUG(log_category, candidate.id, "pruned stale candidate");
    }
}

} // namespace core
