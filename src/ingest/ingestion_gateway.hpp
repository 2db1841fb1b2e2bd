#pragma once

#include <atomic>
#include <cstdint>
#include <string_view>

#include "core/match_index.hpp"
#include "core/reconciliation_engine.hpp"
#include "core/transaction.hpp"
#include "persist/transaction_store.hpp"
#include "util/clock.hpp"

namespace ingest {

enum class IngestStatus : std::uint8_t {
    Accepted = 0,
    Duplicate,        // (provider, external_id) already stored; id is the existing record
    InvalidProvider,
    InvalidAmount,
    InvalidCurrency,
    InvalidDate,
    InvalidExternalId,
    Unavailable,      // store or index could not take the record; retryable
};

const char* ingest_status_name(IngestStatus s) noexcept;

struct IngestResult {
    IngestStatus status{IngestStatus::Unavailable};
    core::TransactionId id{core::no_transaction};
    core::ReconcileResult reconcile{};

    bool accepted() const noexcept { return status == IngestStatus::Accepted; }
};

struct IngestCounters {
    std::atomic<std::uint64_t> accepted{0};
    std::atomic<std::uint64_t> duplicates{0};
    std::atomic<std::uint64_t> rejected{0};
    std::atomic<std::uint64_t> unavailable{0};
};

// Text form of a record as it arrives from a provider export or the command line.
struct IngestRequest {
    std::string_view provider{};
    std::string_view amount{};   // "100.01"
    std::string_view currency{}; // "USD"
    std::string_view date{};     // "2024-01-02"
    std::string_view external_id{};
    std::string_view description{};
};

// Converts a request into a draft; Accepted on success, otherwise the first bad field.
IngestStatus parse_request(const IngestRequest& req, core::Transaction& draft) noexcept;

// Field checks every record passes before it is stored.
IngestStatus validate_draft(const core::Transaction& draft) noexcept;

// Front door for new records: validate, store, index, then reconcile.
class IngestionGateway {
public:
    IngestionGateway(persist::TransactionStore& store,
                     core::MatchIndex& index,
                     core::ReconciliationEngine& engine,
                     const util::WallClock& clock,
                     IngestCounters& counters) noexcept;

    IngestionGateway(const IngestionGateway&) = delete;
    IngestionGateway& operator=(const IngestionGateway&) = delete;

    IngestResult ingest(const core::Transaction& draft) noexcept;
    IngestResult ingest(const IngestRequest& req) noexcept;

private:
    IngestResult reject(IngestStatus status) noexcept;

    persist::TransactionStore& store_;
    core::MatchIndex& index_;
    core::ReconciliationEngine& engine_;
    const util::WallClock& clock_;
    IngestCounters& counters_;
};

} // namespace ingest
