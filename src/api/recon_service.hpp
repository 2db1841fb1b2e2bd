#pragma once

#include <array>
#include <cstdint>

#include "core/invariant_check.hpp"
#include "core/match_index.hpp"
#include "core/recon_config.hpp"
#include "core/reconciliation_engine.hpp"
#include "core/transaction.hpp"
#include "ingest/ingestion_gateway.hpp"
#include "persist/transaction_store.hpp"
#include "util/clock.hpp"

namespace api {

struct StartReport {
    persist::StoreStatus status{persist::StoreStatus::Ok};
    std::uint64_t indexed{0};
    std::uint64_t swept{0};
    std::uint64_t matched_by_sweep{0};
};

struct Summary {
    std::uint64_t total{0};
    std::uint64_t pending{0};
    std::uint64_t matched{0};
    // [provider][status]
    std::array<std::array<std::uint64_t, 2>, core::provider_count> by_provider{};

    std::uint64_t count(core::Provider p, core::TxStatus s) const noexcept {
        return by_provider[static_cast<std::size_t>(p)][static_cast<std::size_t>(s)];
    }
};

// Wires index, engine and gateway around one store. The store must already hold its
// recovered state; start() rebuilds the in-memory index from it.
class ReconService {
public:
    // Throws std::invalid_argument if cfg widens the pairing limits.
    ReconService(persist::TransactionStore& store, const core::ReconConfig& cfg, const util::WallClock& clock);

    ReconService(const ReconService&) = delete;
    ReconService& operator=(const ReconService&) = delete;

    // Indexes every Pending record. With catch_up_sweep, then reconciles each of them
    // oldest first, so pairs that arrived while no engine was running get matched.
    StartReport start(bool catch_up_sweep = true);

    ingest::IngestResult ingest(const core::Transaction& draft) noexcept { return gateway_.ingest(draft); }
    ingest::IngestResult ingest(const ingest::IngestRequest& req) noexcept { return gateway_.ingest(req); }
    core::ReconcileResult reconcile(core::TransactionId id) noexcept { return engine_.reconcile(id); }

    persist::StoreStatus summarize(Summary& out) const;
    persist::StoreStatus verify(core::InvariantReport& out) const;

    persist::TransactionStore& store() noexcept { return store_; }
    core::MatchIndex& index() noexcept { return index_; }
    ingest::IngestionGateway& gateway() noexcept { return gateway_; }
    const core::ReconCounters& recon_counters() const noexcept { return recon_counters_; }
    const ingest::IngestCounters& ingest_counters() const noexcept { return ingest_counters_; }

private:
    persist::TransactionStore& store_;
    const core::ReconConfig cfg_;
    core::ReconCounters recon_counters_;
    ingest::IngestCounters ingest_counters_;
    core::MatchIndex index_;
    core::ReconciliationEngine engine_;
    ingest::IngestionGateway gateway_;
};

} // namespace api
