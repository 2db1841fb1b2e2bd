#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "persist/transaction_store.hpp"

namespace persist {

// Process-local TransactionStore. The record table is guarded by a reader/writer lock
// for structural changes (create, list); per-record state changes take one of a fixed
// set of lock stripes, always in ascending stripe order, so two pair updates racing on
// the same records from opposite directions cannot deadlock.
class MemoryTransactionStore final : public TransactionStore {
public:
    static constexpr std::size_t stripe_count = 64;

    MemoryTransactionStore() = default;

    MemoryTransactionStore(const MemoryTransactionStore&) = delete;
    MemoryTransactionStore& operator=(const MemoryTransactionStore&) = delete;

    StoreStatus get(core::TransactionId id, core::Transaction& out) const noexcept override;
    StoreStatus list(const TransactionFilter& filter, std::vector<core::Transaction>& out) const override;
    StoreStatus create(const core::Transaction& draft,
                       core::TransactionId& assigned_id,
                       core::TransactionId& existing_id) noexcept override;
    StoreStatus atomic_update_pair(core::TransactionId a,
                                   core::TransactionId b,
                                   core::TxStatus expected_a,
                                   core::TxStatus expected_b,
                                   const core::Transaction& new_a,
                                   const core::Transaction& new_b) noexcept override;
    std::size_t size() const noexcept override;

    // Inserts a record exactly as given (id included). Used when rebuilding from a
    // journal; advances the id sequence past the restored id.
    StoreStatus restore(const core::Transaction& tx) noexcept;

    // Id the next create() will assign.
    core::TransactionId peek_next_id() const noexcept { return next_id_.load(std::memory_order_acquire); }

    core::TransactionId find_external(core::Provider provider, std::string_view external_id) const;

private:
    using ExternalKey = std::pair<core::Provider, std::string>;

    static std::size_t stripe_of(core::TransactionId id) noexcept { return id % stripe_count; }

    // Locks the stripes covering a and b in ascending order (once if they coincide).
    class PairLock {
    public:
        PairLock(const MemoryTransactionStore& store, core::TransactionId a, core::TransactionId b);

    private:
        std::unique_lock<std::mutex> first_;
        std::unique_lock<std::mutex> second_;
    };

    StoreStatus insert_locked(const core::Transaction& tx);

    mutable std::shared_mutex table_mutex_;
    mutable std::array<std::mutex, stripe_count> stripes_;
    std::unordered_map<core::TransactionId, core::Transaction> records_;
    std::map<ExternalKey, core::TransactionId> by_external_id_;
    std::atomic<core::TransactionId> next_id_{1};
};

// True when every field fixed at ingestion is equal in both records.
bool same_immutable_fields(const core::Transaction& a, const core::Transaction& b) noexcept;

} // namespace persist
