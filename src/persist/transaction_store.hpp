#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "core/transaction.hpp"

namespace persist {

enum class StoreStatus : std::uint8_t {
    Ok = 0,
    NotFound,
    Conflict,    // a conditional update found a status other than the expected one
    Duplicate,   // (provider, external_id) already stored
    Invalid,     // record rejected before reaching storage
    Unavailable, // transient I/O failure; caller may retry
};

inline const char* store_status_name(StoreStatus s) noexcept {
    switch (s) {
    case StoreStatus::Ok: return "ok";
    case StoreStatus::NotFound: return "not_found";
    case StoreStatus::Conflict: return "conflict";
    case StoreStatus::Duplicate: return "duplicate";
    case StoreStatus::Invalid: return "invalid";
    case StoreStatus::Unavailable: return "unavailable";
    }
    return "unknown";
}

struct TransactionFilter {
    std::optional<core::TxStatus> status{};
    std::optional<core::Provider> provider{};

    bool accepts(const core::Transaction& tx) const noexcept {
        return (!status || tx.status == *status) && (!provider || tx.provider == *provider);
    }
};

// Storage contract the reconciliation core depends on. Implementations must be safe
// to call from several threads at once.
class TransactionStore {
public:
    virtual ~TransactionStore() = default;

    virtual StoreStatus get(core::TransactionId id, core::Transaction& out) const noexcept = 0;

    // Results are ordered by id.
    virtual StoreStatus list(const TransactionFilter& filter, std::vector<core::Transaction>& out) const = 0;

    // Assigns the id; the draft's id, status and match fields are ignored.
    // On Duplicate, existing_id receives the id already holding (provider, external_id).
    virtual StoreStatus create(const core::Transaction& draft,
                               core::TransactionId& assigned_id,
                               core::TransactionId& existing_id) noexcept = 0;

    // Replaces both records iff their current statuses equal the expected ones; both
    // writes become visible together or not at all. Ids and immutable fields of the
    // replacements must equal the stored ones.
    virtual StoreStatus atomic_update_pair(core::TransactionId a,
                                           core::TransactionId b,
                                           core::TxStatus expected_a,
                                           core::TxStatus expected_b,
                                           const core::Transaction& new_a,
                                           const core::Transaction& new_b) noexcept = 0;

    virtual std::size_t size() const noexcept = 0;
};

} // namespace persist
