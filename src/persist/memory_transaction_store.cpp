#include "persist/memory_transaction_store.hpp"

#include <algorithm>
#include <new>

namespace persist {

bool same_immutable_fields(const core::Transaction& a, const core::Transaction& b) noexcept {
    return a.id == b.id && a.provider == b.provider && a.amount_cents == b.amount_cents &&
           a.currency == b.currency && a.transaction_date == b.transaction_date &&
           a.created_at_ns == b.created_at_ns && a.external_id_view() == b.external_id_view();
}

MemoryTransactionStore::PairLock::PairLock(const MemoryTransactionStore& store,
                                           core::TransactionId a,
                                           core::TransactionId b) {
    const std::size_t sa = stripe_of(a);
    const std::size_t sb = stripe_of(b);
    const std::size_t lo = std::min(sa, sb);
    const std::size_t hi = std::max(sa, sb);
    first_ = std::unique_lock<std::mutex>(store.stripes_[lo]);
    if (hi != lo) {
        second_ = std::unique_lock<std::mutex>(store.stripes_[hi]);
    }
}

StoreStatus MemoryTransactionStore::get(core::TransactionId id, core::Transaction& out) const noexcept {
    std::shared_lock table_lock(table_mutex_);
    const auto it = records_.find(id);
    if (it == records_.end()) {
        return StoreStatus::NotFound;
    }
    std::lock_guard<std::mutex> stripe_lock(stripes_[stripe_of(id)]);
    out = it->second;
    return StoreStatus::Ok;
}

StoreStatus MemoryTransactionStore::list(const TransactionFilter& filter,
                                         std::vector<core::Transaction>& out) const {
    // Exclusive: pair updates run under the shared lock, so this sees none in flight.
    std::unique_lock table_lock(table_mutex_);
    const std::size_t first = out.size();
    for (const auto& [id, tx] : records_) {
        if (filter.accepts(tx)) {
            out.push_back(tx);
        }
    }
    std::sort(out.begin() + static_cast<std::ptrdiff_t>(first), out.end(),
              [](const core::Transaction& l, const core::Transaction& r) { return l.id < r.id; });
    return StoreStatus::Ok;
}

StoreStatus MemoryTransactionStore::insert_locked(const core::Transaction& tx) {
    const auto ext = tx.external_id_view();
    if (!ext.empty()) {
        ExternalKey key{tx.provider, std::string(ext)};
        if (by_external_id_.count(key) != 0) {
            return StoreStatus::Duplicate;
        }
        if (!records_.emplace(tx.id, tx).second) {
            return StoreStatus::Duplicate;
        }
        by_external_id_.emplace(std::move(key), tx.id);
    } else if (!records_.emplace(tx.id, tx).second) {
        return StoreStatus::Duplicate;
    }
    return StoreStatus::Ok;
}

StoreStatus MemoryTransactionStore::create(const core::Transaction& draft,
                                           core::TransactionId& assigned_id,
                                           core::TransactionId& existing_id) noexcept {
    assigned_id = core::no_transaction;
    existing_id = core::no_transaction;
    try {
        std::unique_lock table_lock(table_mutex_);
        const auto ext = draft.external_id_view();
        if (!ext.empty()) {
            const auto it = by_external_id_.find(ExternalKey{draft.provider, std::string(ext)});
            if (it != by_external_id_.end()) {
                existing_id = it->second;
                return StoreStatus::Duplicate;
            }
        }
        core::Transaction tx = draft;
        tx.id = next_id_.load(std::memory_order_relaxed);
        tx.status = core::TxStatus::Pending;
        tx.matched_transaction_id = core::no_transaction;
        const StoreStatus st = insert_locked(tx);
        if (st != StoreStatus::Ok) {
            return st;
        }
        next_id_.store(tx.id + 1, std::memory_order_release);
        assigned_id = tx.id;
        return StoreStatus::Ok;
    } catch (const std::bad_alloc&) {
        return StoreStatus::Unavailable;
    }
}

StoreStatus MemoryTransactionStore::restore(const core::Transaction& tx) noexcept {
    if (tx.id == core::no_transaction) {
        return StoreStatus::Invalid;
    }
    try {
        std::unique_lock table_lock(table_mutex_);
        const StoreStatus st = insert_locked(tx);
        if (st != StoreStatus::Ok) {
            return st;
        }
        if (tx.id >= next_id_.load(std::memory_order_relaxed)) {
            next_id_.store(tx.id + 1, std::memory_order_release);
        }
        return StoreStatus::Ok;
    } catch (const std::bad_alloc&) {
        return StoreStatus::Unavailable;
    }
}

StoreStatus MemoryTransactionStore::atomic_update_pair(core::TransactionId a,
                                                       core::TransactionId b,
                                                       core::TxStatus expected_a,
                                                       core::TxStatus expected_b,
                                                       const core::Transaction& new_a,
                                                       const core::Transaction& new_b) noexcept {
    if (a == b || new_a.id != a || new_b.id != b) {
        return StoreStatus::Invalid;
    }

    std::shared_lock table_lock(table_mutex_);
    const auto it_a = records_.find(a);
    const auto it_b = records_.find(b);
    if (it_a == records_.end() || it_b == records_.end()) {
        return StoreStatus::NotFound;
    }

    PairLock pair_lock(*this, a, b);
    core::Transaction& rec_a = it_a->second;
    core::Transaction& rec_b = it_b->second;
    if (rec_a.status != expected_a || rec_b.status != expected_b) {
        return StoreStatus::Conflict;
    }
    if (!same_immutable_fields(rec_a, new_a) || !same_immutable_fields(rec_b, new_b)) {
        return StoreStatus::Invalid;
    }
    rec_a = new_a;
    rec_b = new_b;
    return StoreStatus::Ok;
}

std::size_t MemoryTransactionStore::size() const noexcept {
    std::shared_lock table_lock(table_mutex_);
    return records_.size();
}

core::TransactionId MemoryTransactionStore::find_external(core::Provider provider,
                                                          std::string_view external_id) const {
    std::shared_lock table_lock(table_mutex_);
    const auto it = by_external_id_.find(ExternalKey{provider, std::string(external_id)});
    return it == by_external_id_.end() ? core::no_transaction : it->second;
}

} // namespace persist
