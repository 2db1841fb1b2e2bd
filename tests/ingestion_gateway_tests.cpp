#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "core/invariant_check.hpp"
#include "core/match_index.hpp"
#include "core/reconciliation_engine.hpp"
#include "harness/tx_builder.hpp"
#include "ingest/ingestion_gateway.hpp"
#include "persist/memory_transaction_store.hpp"

namespace {

using ingest::IngestRequest;
using ingest::IngestStatus;

IngestRequest request(std::string_view provider,
                      std::string_view amount,
                      std::string_view date,
                      std::string_view external_id,
                      std::string_view currency = "USD") {
    IngestRequest req{};
    req.provider = provider;
    req.amount = amount;
    req.currency = currency;
    req.date = date;
    req.external_id = external_id;
    req.description = "intercompany transfer";
    return req;
}

class IngestionGatewayTest : public ::testing::Test {
protected:
    core::Transaction load(core::TransactionId id) {
        core::Transaction tx{};
        EXPECT_EQ(store_.get(id, tx), persist::StoreStatus::Ok);
        return tx;
    }

    persist::MemoryTransactionStore store_{};
    core::MatchIndex index_{};
    core::ReconCounters recon_counters_{};
    core::ReconciliationEngine engine_{store_, index_, recon_counters_};
    test::ManualClock clock_{5'000, 10};
    ingest::IngestCounters counters_{};
    ingest::IngestionGateway gateway_{store_, index_, engine_, clock_, counters_};
};

TEST_F(IngestionGatewayTest, AcceptedRecordIsStoredStampedAndIndexed) {
    const auto r = gateway_.ingest(request("xero", "100.00", "2024-01-01", "BT-1"));
    ASSERT_TRUE(r.accepted());
    EXPECT_TRUE(r.reconcile.ok());
    EXPECT_EQ(r.reconcile.tx_status, core::TxStatus::Pending);

    const auto tx = load(r.id);
    EXPECT_EQ(tx.provider, core::Provider::Xero);
    EXPECT_EQ(tx.amount_cents, 10'000);
    EXPECT_EQ(tx.external_id_view(), "BT-1");
    EXPECT_EQ(tx.description_view(), "intercompany transfer");
    EXPECT_EQ(tx.created_at_ns, 5'000u);
    EXPECT_TRUE(index_.contains(r.id));
    EXPECT_EQ(counters_.accepted.load(), 1u);
}

TEST_F(IngestionGatewayTest, CounterpartIngestTriggersMatch) {
    const auto a = gateway_.ingest(request("xero", "100.00", "2024-01-01", "BT-1"));
    const auto b = gateway_.ingest(request("quickbooks", "100.01", "2024-01-02", "QB-9"));
    ASSERT_TRUE(b.accepted());
    ASSERT_TRUE(b.reconcile.matched());
    EXPECT_EQ(b.reconcile.matched_transaction_id, a.id);
    EXPECT_EQ(load(a.id).matched_transaction_id, b.id);
    EXPECT_GT(load(b.id).created_at_ns, load(a.id).created_at_ns);
}

TEST_F(IngestionGatewayTest, DuplicateReturnsExistingRecord) {
    const auto first = gateway_.ingest(request("xero", "100.00", "2024-01-01", "BT-1"));
    const auto again = gateway_.ingest(request("xero", "250.00", "2024-03-01", "BT-1"));
    EXPECT_EQ(again.status, IngestStatus::Duplicate);
    EXPECT_EQ(again.id, first.id);
    EXPECT_EQ(load(first.id).amount_cents, 10'000);
    EXPECT_EQ(store_.size(), 1u);
    EXPECT_EQ(counters_.duplicates.load(), 1u);
}

TEST_F(IngestionGatewayTest, RejectsMalformedFields) {
    EXPECT_EQ(gateway_.ingest(request("sage", "1.00", "2024-01-01", "X")).status, IngestStatus::InvalidProvider);
    EXPECT_EQ(gateway_.ingest(request("xero", "1.001", "2024-01-01", "X")).status, IngestStatus::InvalidAmount);
    EXPECT_EQ(gateway_.ingest(request("xero", "0.00", "2024-01-01", "X")).status, IngestStatus::InvalidAmount);
    EXPECT_EQ(gateway_.ingest(request("xero", "-5.00", "2024-01-01", "X")).status, IngestStatus::InvalidAmount);
    EXPECT_EQ(gateway_.ingest(request("xero", "1.00", "2024-01-01", "X", "usd")).status,
              IngestStatus::InvalidCurrency);
    EXPECT_EQ(gateway_.ingest(request("xero", "1.00", "2024-02-30", "X")).status, IngestStatus::InvalidDate);
    EXPECT_EQ(gateway_.ingest(request("xero", "1.00", "1899-12-31", "X")).status, IngestStatus::InvalidDate);
    EXPECT_EQ(gateway_.ingest(request("xero", "1.00", "2024-01-01", "")).status, IngestStatus::InvalidExternalId);

    const std::string too_long(core::Transaction::external_id_capacity + 1, 'e');
    EXPECT_EQ(gateway_.ingest(request("xero", "1.00", "2024-01-01", too_long)).status,
              IngestStatus::InvalidExternalId);

    EXPECT_EQ(store_.size(), 0u);
    EXPECT_EQ(index_.size(), 0u);
    EXPECT_EQ(counters_.rejected.load(), 9u);
}

TEST_F(IngestionGatewayTest, DraftPathValidatesToo) {
    core::Transaction draft = test::TxBuilder().xero().draft();
    draft.amount_cents = 0;
    EXPECT_EQ(gateway_.ingest(draft).status, IngestStatus::InvalidAmount);

    draft = test::TxBuilder().quickbooks().draft();
    draft.external_id_len = 0;
    EXPECT_EQ(gateway_.ingest(draft).status, IngestStatus::InvalidExternalId);

    // Caller-supplied id, status and timestamp are ignored.
    draft = test::TxBuilder().quickbooks().draft();
    draft.id = 77;
    draft.status = core::TxStatus::Matched;
    draft.created_at_ns = 1;
    const auto r = gateway_.ingest(draft);
    ASSERT_TRUE(r.accepted());
    EXPECT_EQ(r.id, 1u);
    EXPECT_TRUE(load(r.id).is_pending());
    EXPECT_NE(load(r.id).created_at_ns, 1u);
}

// One thread per provider feed, each pair split across the two threads. A record is
// indexed before it reconciles, so whichever side lands second finds the first.
TEST(IngestionGatewayConcurrency, ProviderFeedsInParallelMatchEveryPair) {
    constexpr int pairs = 200;
    constexpr int rounds = 10;
    for (int round = 0; round < rounds; ++round) {
        persist::MemoryTransactionStore store;
        core::MatchIndex index;
        core::ReconCounters recon_counters;
        core::ReconciliationEngine engine(store, index, recon_counters);
        test::ManualClock clock;
        ingest::IngestCounters counters;
        ingest::IngestionGateway gateway(store, index, engine, clock, counters);

        std::atomic<bool> go{false};
        auto feed = [&](core::Provider provider, const char* prefix) {
            while (!go.load(std::memory_order_acquire)) {
                std::this_thread::yield();
            }
            for (int i = 0; i < pairs; ++i) {
                // Each pair sits in its own amount band, far outside tolerance of the others.
                const auto draft = test::TxBuilder()
                                       .provider(provider)
                                       .cents(10'000 + i * 100)
                                       .external_id(prefix + std::to_string(i))
                                       .draft();
                const auto r = gateway.ingest(draft);
                EXPECT_TRUE(r.accepted()) << ingest::ingest_status_name(r.status);
                EXPECT_TRUE(r.reconcile.ok());
            }
        };
        std::thread xero(feed, core::Provider::Xero, "XE-");
        std::thread quickbooks(feed, core::Provider::QuickBooks, "QB-");
        go.store(true, std::memory_order_release);
        xero.join();
        quickbooks.join();

        ASSERT_EQ(recon_counters.matched.load(), static_cast<std::uint64_t>(pairs)) << "round " << round;
        EXPECT_EQ(counters.accepted.load(), static_cast<std::uint64_t>(2 * pairs));
        EXPECT_EQ(index.size(), 0u);

        core::InvariantReport report{};
        ASSERT_EQ(core::verify_store_invariants(store, report), persist::StoreStatus::Ok);
        EXPECT_TRUE(report.clean());
        EXPECT_EQ(report.matched_pairs, static_cast<std::uint64_t>(pairs));
    }
}

TEST(IngestParse, ParseRequestFillsDraft) {
    core::Transaction draft{};
    ASSERT_EQ(ingest::parse_request(request("qb", "12.5", "2024-02-29", "Q-1", "EUR"), draft),
              IngestStatus::Accepted);
    EXPECT_EQ(draft.provider, core::Provider::QuickBooks);
    EXPECT_EQ(draft.amount_cents, 1'250);
    EXPECT_EQ(draft.currency.view(), "EUR");
    EXPECT_EQ(draft.transaction_date, test::day("2024-02-29"));
    EXPECT_STREQ(ingest::ingest_status_name(IngestStatus::InvalidDate), "invalid_date");
}

} // namespace
