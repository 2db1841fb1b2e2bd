#pragma once

#include <cstdint>
#include <vector>

#include "core/recon_config.hpp"
#include "core/transaction.hpp"
#include "persist/transaction_store.hpp"

namespace core {

enum class ViolationKind : std::uint8_t {
    MissingLink,       // Matched without a counterpart id, or linked to itself
    DanglingLink,      // counterpart id not in the store
    AsymmetricLink,    // counterpart does not point back
    OutsideTolerance,  // pair fails amount/currency/date/provider checks
    PendingWithLink,   // Pending but carries a counterpart id
};

const char* violation_kind_name(ViolationKind k) noexcept;

struct InvariantViolation {
    ViolationKind kind{ViolationKind::MissingLink};
    TransactionId id{no_transaction};
    TransactionId counterpart_id{no_transaction};
};

struct InvariantReport {
    std::uint64_t transactions_checked{0};
    std::uint64_t matched_pairs{0};
    std::vector<InvariantViolation> violations{};

    bool clean() const noexcept { return violations.empty(); }
};

// Walks every stored transaction and reports records breaking the pairing invariants.
// Pairs are judged against pairing_limits(), whatever config matched them. Read-only;
// nothing is repaired. Returns the store's status if listing fails.
persist::StoreStatus verify_store_invariants(const persist::TransactionStore& store, InvariantReport& out);

} // namespace core
