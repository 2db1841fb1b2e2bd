#include "ingest/ingestion_gateway.hpp"

#include <chrono>
#include <new>

#include "util/async_log.hpp"

namespace ingest {

namespace {

constexpr auto log_category = util::LogCategory::Ingest;

constexpr core::DayNumber day_of(std::chrono::year_month_day ymd) noexcept {
    return static_cast<core::DayNumber>(std::chrono::sys_days{ymd}.time_since_epoch().count());
}

constexpr core::DayNumber earliest_day = day_of(std::chrono::year{1900} / 1 / 1);
constexpr core::DayNumber latest_day = day_of(std::chrono::year{9999} / 12 / 31);

inline void bump(std::atomic<std::uint64_t>& c) noexcept { c.fetch_add(1, std::memory_order_relaxed); }

} // namespace

const char* ingest_status_name(IngestStatus s) noexcept {
    switch (s) {
    case IngestStatus::Accepted: return "accepted";
    case IngestStatus::Duplicate: return "duplicate";
    case IngestStatus::InvalidProvider: return "invalid_provider";
    case IngestStatus::InvalidAmount: return "invalid_amount";
    case IngestStatus::InvalidCurrency: return "invalid_currency";
    case IngestStatus::InvalidDate: return "invalid_date";
    case IngestStatus::InvalidExternalId: return "invalid_external_id";
    case IngestStatus::Unavailable: return "unavailable";
    }
    return "unknown";
}

IngestStatus parse_request(const IngestRequest& req, core::Transaction& draft) noexcept {
    draft = core::Transaction{};
    const auto provider = core::parse_provider(req.provider);
    if (!provider) {
        return IngestStatus::InvalidProvider;
    }
    const auto amount = core::parse_amount(req.amount);
    if (!amount) {
        return IngestStatus::InvalidAmount;
    }
    const auto currency = core::make_currency(req.currency);
    if (!currency) {
        return IngestStatus::InvalidCurrency;
    }
    const auto date = core::parse_date(req.date);
    if (!date) {
        return IngestStatus::InvalidDate;
    }
    if (req.external_id.size() > core::Transaction::external_id_capacity) {
        return IngestStatus::InvalidExternalId;
    }
    draft.provider = *provider;
    draft.amount_cents = *amount;
    draft.currency = *currency;
    draft.transaction_date = *date;
    draft.set_external_id(req.external_id);
    draft.set_description(req.description);
    return validate_draft(draft);
}

IngestStatus validate_draft(const core::Transaction& draft) noexcept {
    if (draft.provider != core::Provider::Xero && draft.provider != core::Provider::QuickBooks) {
        return IngestStatus::InvalidProvider;
    }
    if (draft.amount_cents <= 0) {
        return IngestStatus::InvalidAmount;
    }
    if (!core::make_currency(draft.currency.view())) {
        return IngestStatus::InvalidCurrency;
    }
    if (draft.transaction_date < earliest_day || draft.transaction_date > latest_day) {
        return IngestStatus::InvalidDate;
    }
    if (draft.external_id_len == 0 || draft.external_id_len > core::Transaction::external_id_capacity) {
        return IngestStatus::InvalidExternalId;
    }
    return IngestStatus::Accepted;
}

IngestionGateway::IngestionGateway(persist::TransactionStore& store,
                                   core::MatchIndex& index,
                                   core::ReconciliationEngine& engine,
                                   const util::WallClock& clock,
                                   IngestCounters& counters) noexcept
    : store_(store), index_(index), engine_(engine), clock_(clock), counters_(counters) {}

IngestResult IngestionGateway::reject(IngestStatus status) noexcept {
    bump(counters_.rejected);
    LOG_WARM_WARN(log_category, "rejected record: %s", ingest_status_name(status));
    return IngestResult{status, core::no_transaction, {}};
}

IngestResult IngestionGateway::ingest(const IngestRequest& req) noexcept {
    core::Transaction draft{};
    const IngestStatus st = parse_request(req, draft);
    if (st != IngestStatus::Accepted) {
        return reject(st);
    }
    return ingest(draft);
}

IngestResult IngestionGateway::ingest(const core::Transaction& draft) noexcept {
    const IngestStatus valid = validate_draft(draft);
    if (valid != IngestStatus::Accepted) {
        return reject(valid);
    }

    core::Transaction stamped = draft;
    stamped.created_at_ns = clock_.now_ns();

    core::TransactionId id = core::no_transaction;
    core::TransactionId existing = core::no_transaction;
    const persist::StoreStatus st = store_.create(stamped, id, existing);
    if (st == persist::StoreStatus::Duplicate) {
        bump(counters_.duplicates);
        LOG_WARM_TX_DEBUG(log_category,
                          existing,
                          "%s external_id=%.*s already stored",
                          core::provider_name(draft.provider),
                          static_cast<int>(draft.external_id_len),
                          draft.external_id);
        return IngestResult{IngestStatus::Duplicate, existing, {}};
    }
    if (st != persist::StoreStatus::Ok) {
        bump(counters_.unavailable);
        LOG_WARM_ERROR(log_category, "store create failed: %s", persist::store_status_name(st));
        return IngestResult{IngestStatus::Unavailable, core::no_transaction, {}};
    }

    core::Transaction stored{};
    if (store_.get(id, stored) != persist::StoreStatus::Ok) {
        bump(counters_.unavailable);
        return IngestResult{IngestStatus::Unavailable, id, {}};
    }
    try {
        index_.insert(stored);
    } catch (const std::bad_alloc&) {
        // Stored but not indexed; the next index rebuild picks it up.
        bump(counters_.unavailable);
        LOG_WARM_TX_ERROR(log_category, id, "stored but not indexed");
        return IngestResult{IngestStatus::Unavailable, id, {}};
    }

    bump(counters_.accepted);
    return IngestResult{IngestStatus::Accepted, id, engine_.reconcile(id)};
}

} // namespace ingest
