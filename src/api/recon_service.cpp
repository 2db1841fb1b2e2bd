#include "api/recon_service.hpp"

#include <algorithm>
#include <tuple>
#include <vector>

#include "util/log.hpp"

namespace api {

ReconService::ReconService(persist::TransactionStore& store,
                           const core::ReconConfig& cfg,
                           const util::WallClock& clock)
    : store_(store),
      cfg_(cfg),
      index_(cfg.date_window_days),
      engine_(store_, index_, recon_counters_, cfg_),
      gateway_(store_, index_, engine_, clock, ingest_counters_) {}

StartReport ReconService::start(bool catch_up_sweep) {
    StartReport report{};
    std::vector<core::Transaction> pending;
    persist::TransactionFilter filter{};
    filter.status = core::TxStatus::Pending;
    report.status = store_.list(filter, pending);
    if (report.status != persist::StoreStatus::Ok) {
        LOG_SLOW_ERROR("start: listing pending transactions failed (%s)", persist::store_status_name(report.status));
        return report;
    }

    std::sort(pending.begin(), pending.end(), [](const core::Transaction& l, const core::Transaction& r) {
        return std::tie(l.created_at_ns, l.id) < std::tie(r.created_at_ns, r.id);
    });

    index_.clear();
    for (const auto& tx : pending) {
        if (index_.insert(tx)) {
            ++report.indexed;
        }
    }
    LOG_SLOW_INFO("start: indexed %llu pending transactions", static_cast<unsigned long long>(report.indexed));

    if (!catch_up_sweep) {
        return report;
    }
    const auto matched_before = recon_counters_.matched.load(std::memory_order_relaxed);
    for (const auto& tx : pending) {
        const core::ReconcileResult res = engine_.reconcile(tx.id);
        ++report.swept;
        if (res.status == core::ReconcileStatus::StoreUnavailable) {
            report.status = persist::StoreStatus::Unavailable;
            LOG_SLOW_ERROR("start: sweep stopped at tx=%llu, store unavailable", static_cast<unsigned long long>(tx.id));
            break;
        }
    }
    report.matched_by_sweep = recon_counters_.matched.load(std::memory_order_relaxed) - matched_before;
    LOG_SLOW_INFO("start: sweep reconciled %llu transactions, %llu new pairs",
                  static_cast<unsigned long long>(report.swept),
                  static_cast<unsigned long long>(report.matched_by_sweep));
    return report;
}

persist::StoreStatus ReconService::summarize(Summary& out) const {
    out = Summary{};
    std::vector<core::Transaction> all;
    const persist::StoreStatus st = store_.list(persist::TransactionFilter{}, all);
    if (st != persist::StoreStatus::Ok) {
        return st;
    }
    for (const auto& tx : all) {
        ++out.total;
        if (tx.is_matched()) {
            ++out.matched;
        } else {
            ++out.pending;
        }
        ++out.by_provider[static_cast<std::size_t>(tx.provider)][static_cast<std::size_t>(tx.status)];
    }
    return persist::StoreStatus::Ok;
}

persist::StoreStatus ReconService::verify(core::InvariantReport& out) const {
    const persist::StoreStatus st = core::verify_store_invariants(store_, out);
    if (st == persist::StoreStatus::Ok && !out.clean()) {
        for (const auto& v : out.violations) {
            LOG_SLOW_ERROR("invariant violation %s: tx=%llu counterpart=%llu",
                           core::violation_kind_name(v.kind),
                           static_cast<unsigned long long>(v.id),
                           static_cast<unsigned long long>(v.counterpart_id));
        }
    }
    return st;
}

} // namespace api
