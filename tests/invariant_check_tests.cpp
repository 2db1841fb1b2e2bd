#include <gtest/gtest.h>

#include "core/invariant_check.hpp"
#include "harness/tx_builder.hpp"
#include "persist/memory_transaction_store.hpp"

namespace {

using core::ViolationKind;

class InvariantCheckTest : public ::testing::Test {
protected:
    void put(test::TxBuilder b, core::TransactionId id, core::TransactionId link = core::no_transaction) {
        core::Transaction tx = b.draft();
        tx.id = id;
        if (link != core::no_transaction) {
            tx.status = core::TxStatus::Matched;
            tx.matched_transaction_id = link;
        }
        ASSERT_EQ(store_.restore(tx), persist::StoreStatus::Ok);
    }

    core::InvariantReport check() {
        core::InvariantReport report{};
        EXPECT_EQ(core::verify_store_invariants(store_, report),
                  persist::StoreStatus::Ok);
        return report;
    }

    persist::MemoryTransactionStore store_{};
};

TEST_F(InvariantCheckTest, EmptyStoreIsClean) {
    const auto report = check();
    EXPECT_TRUE(report.clean());
    EXPECT_EQ(report.transactions_checked, 0u);
}

TEST_F(InvariantCheckTest, MutualPairCountsOnce) {
    put(test::TxBuilder().xero(), 1, 2);
    put(test::TxBuilder().quickbooks().amount("100.01"), 2, 1);
    put(test::TxBuilder().quickbooks(), 3);
    const auto report = check();
    EXPECT_TRUE(report.clean());
    EXPECT_EQ(report.transactions_checked, 3u);
    EXPECT_EQ(report.matched_pairs, 1u);
}

TEST_F(InvariantCheckTest, ReportsAsymmetricAndDanglingLinks) {
    put(test::TxBuilder().xero(), 1, 2);
    put(test::TxBuilder().quickbooks(), 2);
    put(test::TxBuilder().xero(), 3, 40);

    const auto report = check();
    ASSERT_EQ(report.violations.size(), 2u);
    EXPECT_EQ(report.violations[0].kind, ViolationKind::AsymmetricLink);
    EXPECT_EQ(report.violations[0].id, 1u);
    EXPECT_EQ(report.violations[1].kind, ViolationKind::DanglingLink);
    EXPECT_EQ(report.violations[1].counterpart_id, 40u);
}

TEST_F(InvariantCheckTest, ReportsSelfLinkAndPendingWithLink) {
    put(test::TxBuilder().xero(), 1, 1);
    core::Transaction pending = test::TxBuilder().quickbooks().draft();
    pending.id = 2;
    pending.matched_transaction_id = 1;
    ASSERT_EQ(store_.restore(pending), persist::StoreStatus::Ok);

    const auto report = check();
    ASSERT_EQ(report.violations.size(), 2u);
    EXPECT_EQ(report.violations[0].kind, ViolationKind::MissingLink);
    EXPECT_EQ(report.violations[1].kind, ViolationKind::PendingWithLink);
}

TEST_F(InvariantCheckTest, ReportsPairOutsideTolerance) {
    put(test::TxBuilder().xero().date("2024-01-01"), 1, 2);
    put(test::TxBuilder().quickbooks().date("2024-02-01"), 2, 1);
    put(test::TxBuilder().xero(), 3, 4);
    put(test::TxBuilder().xero(), 4, 3);

    const auto report = check();
    ASSERT_EQ(report.violations.size(), 2u);
    EXPECT_EQ(report.violations[0].kind, ViolationKind::OutsideTolerance);
    EXPECT_EQ(report.violations[0].id, 1u);
    EXPECT_EQ(report.violations[1].kind, ViolationKind::OutsideTolerance);
    EXPECT_EQ(report.violations[1].id, 3u);
    EXPECT_STREQ(core::violation_kind_name(report.violations[1].kind), "outside_tolerance");
}

TEST_F(InvariantCheckTest, PairWiderThanFixedLimitsIsReported) {
    // As a widened matcher would have stored it: 5.00 apart.
    put(test::TxBuilder().xero().amount("100.00"), 1, 2);
    put(test::TxBuilder().quickbooks().amount("105.00"), 2, 1);

    const auto report = check();
    ASSERT_EQ(report.violations.size(), 1u);
    EXPECT_EQ(report.violations[0].kind, ViolationKind::OutsideTolerance);
}

TEST_F(InvariantCheckTest, PairAtFixedLimitsIsClean) {
    put(test::TxBuilder().xero().amount("100.00").date("2024-01-01"), 1, 2);
    put(test::TxBuilder().quickbooks().amount("100.01").date("2024-01-04"), 2, 1);

    const auto report = check();
    EXPECT_TRUE(report.clean());
    EXPECT_EQ(report.matched_pairs, 1u);
}

} // namespace
