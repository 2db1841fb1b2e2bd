#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <shared_mutex>
#include <tuple>
#include <unordered_set>
#include <vector>

#include "core/match_predicate.hpp"
#include "core/transaction.hpp"

namespace core {

class MatchIndex;

// Ordered, finite view of the counterparts a MatchIndex holds for one transaction.
// Nothing is read until the first next(); the snapshot is taken under the index's
// shared lock in one pass. reset() discards it so the following next() re-reads.
// Holds a plain pointer to its index and must not outlive it.
class CandidateCursor {
public:
    bool next(TransactionId& out);
    void reset() noexcept;

    // Number of candidates in the current snapshot; loads it if needed.
    std::size_t remaining();

private:
    friend class MatchIndex;
    CandidateCursor(const MatchIndex& index, const Transaction& subject) noexcept;

    void load();

    const MatchIndex* index_;
    Transaction subject_;
    std::vector<CandidateRank> ranked_;
    std::size_t pos_{0};
    bool loaded_{false};
};

// Index of Pending transactions partitioned by (currency, provider). Each partition is
// ordered by transaction date, then amount, then created_at, so a date window is a
// contiguous range. Internally synchronized: writers take the exclusive lock, queries
// the shared one.
//
// The index trails the store. A pair is removed only after the store has committed it,
// so for a moment a query can still return a transaction that is already Matched.
// Callers re-read each candidate from the store and treat a non-Pending one as stale.
class MatchIndex {
public:
    explicit MatchIndex(std::int32_t date_window_days = default_recon_config().date_window_days);

    MatchIndex(const MatchIndex&) = delete;
    MatchIndex& operator=(const MatchIndex&) = delete;

    // Rejects (returns false) a transaction that is not Pending, has no id, or is
    // already indexed.
    bool insert(const Transaction& tx);

    // Returns false if the transaction was not indexed.
    bool remove(const Transaction& tx) noexcept;

    // Removes both sides of a freshly matched pair in one critical section.
    void remove_pair(const Transaction& a, const Transaction& b) noexcept;

    // The cursor refers back to this index; it is valid only while the index is alive.
    [[nodiscard]] CandidateCursor query(const Transaction& subject) const noexcept;

    bool contains(TransactionId id) const;
    std::size_t size() const;
    std::size_t partition_size(const CurrencyCode& currency, Provider provider) const;
    std::int32_t date_window_days() const noexcept { return date_window_days_; }
    void clear() noexcept;

private:
    friend class CandidateCursor;

    struct Entry {
        DayNumber date{0};
        AmountCents amount_cents{0};
        std::uint64_t created_at_ns{0};
        TransactionId id{no_transaction};

        friend bool operator<(const Entry& l, const Entry& r) noexcept {
            return std::tie(l.date, l.amount_cents, l.created_at_ns, l.id) <
                   std::tie(r.date, r.amount_cents, r.created_at_ns, r.id);
        }
    };

    struct PartitionKey {
        CurrencyCode currency{};
        Provider provider{Provider::Xero};

        friend auto operator<=>(const PartitionKey&, const PartitionKey&) = default;
    };

    using Partition = std::set<Entry>;

    static Entry make_entry(const Transaction& tx) noexcept;
    bool remove_locked(const Transaction& tx) noexcept;
    void collect_candidates(const Transaction& subject, std::vector<CandidateRank>& out) const;

    const std::int32_t date_window_days_;
    mutable std::shared_mutex mutex_;
    std::map<PartitionKey, Partition> partitions_;
    std::unordered_set<TransactionId> indexed_ids_;
};

} // namespace core
