#pragma once

#include <atomic>
#include <cstdint>

#include "core/match_index.hpp"
#include "core/recon_config.hpp"
#include "core/transaction.hpp"
#include "persist/transaction_store.hpp"

namespace core {

enum class ReconcileStatus : std::uint8_t {
    Ok = 0,              // tx_status says whether a match exists
    NotFound,
    ConstraintViolation, // stored link is not mutual; nothing was changed
    StoreUnavailable,    // retryable
};

const char* reconcile_status_name(ReconcileStatus s) noexcept;

struct ReconcileResult {
    ReconcileStatus status{ReconcileStatus::NotFound};
    TxStatus tx_status{TxStatus::Pending};
    TransactionId matched_transaction_id{no_transaction};

    bool ok() const noexcept { return status == ReconcileStatus::Ok; }
    bool matched() const noexcept { return ok() && tx_status == TxStatus::Matched; }
};

// Shared by every thread calling into one engine.
struct ReconCounters {
    std::atomic<std::uint64_t> reconcile_calls{0};
    std::atomic<std::uint64_t> matched{0};
    std::atomic<std::uint64_t> no_match{0};
    std::atomic<std::uint64_t> already_matched{0};
    std::atomic<std::uint64_t> not_found{0};
    std::atomic<std::uint64_t> races_lost{0};
    std::atomic<std::uint64_t> stale_candidates{0};
    std::atomic<std::uint64_t> constraint_violations{0};
    std::atomic<std::uint64_t> store_unavailable{0};
};

// Decides and applies at most one match for a transaction. Holds no state of its own
// besides the injected handles, so any number of threads may call reconcile() at once.
class ReconciliationEngine {
public:
    // Throws std::invalid_argument if cfg is outside within_pairing_limits() or the index
    // window is narrower than cfg's date window.
    ReconciliationEngine(persist::TransactionStore& store,
                         MatchIndex& index,
                         ReconCounters& counters,
                         ReconConfig cfg = default_recon_config());

    ReconciliationEngine(const ReconciliationEngine&) = delete;
    ReconciliationEngine& operator=(const ReconciliationEngine&) = delete;

    [[nodiscard]] ReconcileResult reconcile(TransactionId id) noexcept;

    const ReconConfig& config() const noexcept { return cfg_; }

private:
    enum class Attempt : std::uint8_t { Matched, Lost, Skipped, Unavailable, Corrupt };

    ReconcileResult existing_match(const Transaction& subject) noexcept;
    ReconcileResult search(const Transaction& subject);
    Attempt try_pair(const Transaction& subject, const Transaction& candidate) noexcept;
    void drop_stale(const Transaction& candidate) noexcept;

    persist::TransactionStore& store_;
    MatchIndex& index_;
    ReconCounters& counters_;
    const ReconConfig cfg_;
};

} // namespace core
