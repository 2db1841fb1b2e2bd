#include "core/match_index.hpp"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <mutex>
#include <new>
#include <stdexcept>

namespace core {

CandidateCursor::CandidateCursor(const MatchIndex& index, const Transaction& subject) noexcept
    : index_(&index), subject_(subject) {}

void CandidateCursor::load() {
    ranked_.clear();
    pos_ = 0;
    index_->collect_candidates(subject_, ranked_);
    std::sort(ranked_.begin(), ranked_.end());
    loaded_ = true;
}

bool CandidateCursor::next(TransactionId& out) {
    if (!loaded_) {
        load();
    }
    if (pos_ >= ranked_.size()) {
        return false;
    }
    out = ranked_[pos_++].id;
    return true;
}

void CandidateCursor::reset() noexcept {
    loaded_ = false;
    pos_ = 0;
}

std::size_t CandidateCursor::remaining() {
    if (!loaded_) {
        load();
    }
    return ranked_.size() - pos_;
}

MatchIndex::MatchIndex(std::int32_t date_window_days) : date_window_days_(date_window_days) {
    if (date_window_days < 0) {
        throw std::invalid_argument("MatchIndex date_window_days must be >= 0");
    }
}

MatchIndex::Entry MatchIndex::make_entry(const Transaction& tx) noexcept {
    return Entry{tx.transaction_date, tx.amount_cents, tx.created_at_ns, tx.id};
}

bool MatchIndex::insert(const Transaction& tx) {
    if (!tx.is_pending() || tx.id == no_transaction) {
        return false;
    }
    std::unique_lock lock(mutex_);
    if (!indexed_ids_.insert(tx.id).second) {
        return false;
    }
    try {
        partitions_[PartitionKey{tx.currency, tx.provider}].insert(make_entry(tx));
    } catch (const std::bad_alloc&) {
        indexed_ids_.erase(tx.id);
        throw;
    }
    return true;
}

bool MatchIndex::remove_locked(const Transaction& tx) noexcept {
    if (indexed_ids_.erase(tx.id) == 0) {
        return false;
    }
    const auto it = partitions_.find(PartitionKey{tx.currency, tx.provider});
    if (it == partitions_.end()) {
        return false;
    }
    it->second.erase(make_entry(tx));
    if (it->second.empty()) {
        partitions_.erase(it);
    }
    return true;
}

bool MatchIndex::remove(const Transaction& tx) noexcept {
    std::unique_lock lock(mutex_);
    return remove_locked(tx);
}

void MatchIndex::remove_pair(const Transaction& a, const Transaction& b) noexcept {
    std::unique_lock lock(mutex_);
    remove_locked(a);
    remove_locked(b);
}

CandidateCursor MatchIndex::query(const Transaction& subject) const noexcept {
    return CandidateCursor(*this, subject);
}

void MatchIndex::collect_candidates(const Transaction& subject, std::vector<CandidateRank>& out) const {
    std::shared_lock lock(mutex_);
    const auto part = partitions_.find(PartitionKey{subject.currency, opposite(subject.provider)});
    if (part == partitions_.end()) {
        return;
    }
    const Partition& entries = part->second;
    const DayNumber lo = subject.transaction_date - date_window_days_;
    const DayNumber hi = subject.transaction_date + date_window_days_;

    const Entry window_start{lo, std::numeric_limits<AmountCents>::min(), 0, no_transaction};
    for (auto it = entries.lower_bound(window_start); it != entries.end() && it->date <= hi; ++it) {
        if (it->id == subject.id) {
            continue;
        }
        out.push_back(CandidateRank{std::abs(it->date - subject.transaction_date),
                                    std::llabs(it->amount_cents - subject.amount_cents),
                                    it->created_at_ns,
                                    it->id});
    }
}

bool MatchIndex::contains(TransactionId id) const {
    std::shared_lock lock(mutex_);
    return indexed_ids_.count(id) != 0;
}

std::size_t MatchIndex::size() const {
    std::shared_lock lock(mutex_);
    return indexed_ids_.size();
}

std::size_t MatchIndex::partition_size(const CurrencyCode& currency, Provider provider) const {
    std::shared_lock lock(mutex_);
    const auto it = partitions_.find(PartitionKey{currency, provider});
    return it == partitions_.end() ? 0 : it->second.size();
}

void MatchIndex::clear() noexcept {
    std::unique_lock lock(mutex_);
    partitions_.clear();
    indexed_ids_.clear();
}

} // namespace core
