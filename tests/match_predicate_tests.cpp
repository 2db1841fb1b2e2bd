#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "core/match_predicate.hpp"
#include "harness/tx_builder.hpp"

namespace {

using core::PredicateFailure;

class MatchPredicateTest : public ::testing::Test {
protected:
    core::Transaction make(test::TxBuilder b, core::TransactionId id) {
        core::Transaction tx = b.draft();
        tx.id = id;
        return tx;
    }

    core::ReconConfig cfg_ = core::default_recon_config();
};

TEST_F(MatchPredicateTest, AmountDifferingByOneCentMatches) {
    const auto a = make(test::TxBuilder().xero().amount("100.00"), 1);
    const auto b = make(test::TxBuilder().quickbooks().amount("100.01"), 2);
    EXPECT_EQ(core::check_match(a, b, cfg_), PredicateFailure::None);
    EXPECT_EQ(core::check_match(b, a, cfg_), PredicateFailure::None);
}

TEST_F(MatchPredicateTest, AmountDifferingByTwoCentsDoesNotMatch) {
    const auto a = make(test::TxBuilder().xero().amount("100.00"), 1);
    const auto b = make(test::TxBuilder().quickbooks().amount("100.02"), 2);
    EXPECT_EQ(core::check_match(a, b, cfg_), PredicateFailure::AmountOutOfTolerance);
}

TEST_F(MatchPredicateTest, DatesThreeDaysApartMatch) {
    const auto a = make(test::TxBuilder().xero().date("2024-01-01"), 1);
    const auto b = make(test::TxBuilder().quickbooks().date("2024-01-04"), 2);
    EXPECT_TRUE(core::is_match(a, b, cfg_));
}

TEST_F(MatchPredicateTest, DatesFourDaysApartDoNotMatch) {
    const auto a = make(test::TxBuilder().xero().date("2024-01-01"), 1);
    const auto b = make(test::TxBuilder().quickbooks().date("2024-01-05"), 2);
    EXPECT_EQ(core::check_match(a, b, cfg_), PredicateFailure::DateOutOfWindow);
    EXPECT_EQ(core::check_match(b, a, cfg_), PredicateFailure::DateOutOfWindow);
}

TEST_F(MatchPredicateTest, DateWindowSpansMonthAndYearEnds) {
    const auto a = make(test::TxBuilder().xero().date("2023-12-30"), 1);
    const auto b = make(test::TxBuilder().quickbooks().date("2024-01-02"), 2);
    EXPECT_TRUE(core::is_match(a, b, cfg_));
}

TEST_F(MatchPredicateTest, CurrencyMustBeIdentical) {
    const auto a = make(test::TxBuilder().xero().currency("EUR"), 1);
    const auto b = make(test::TxBuilder().quickbooks().currency("USD"), 2);
    EXPECT_EQ(core::check_match(a, b, cfg_), PredicateFailure::CurrencyMismatch);
}

TEST_F(MatchPredicateTest, ProvidersMustDiffer) {
    const auto a = make(test::TxBuilder().xero(), 1);
    const auto b = make(test::TxBuilder().xero(), 2);
    EXPECT_EQ(core::check_match(a, b, cfg_), PredicateFailure::SameProvider);
}

TEST_F(MatchPredicateTest, BothMustBePending) {
    const auto a = make(test::TxBuilder().xero(), 1);
    auto b = make(test::TxBuilder().quickbooks(), 2);
    b.status = core::TxStatus::Matched;
    b.matched_transaction_id = 9;
    EXPECT_EQ(core::check_match(a, b, cfg_), PredicateFailure::NotPending);
    EXPECT_TRUE(core::pair_within_tolerance(a, b, cfg_));
}

TEST_F(MatchPredicateTest, NeverMatchesItself) {
    const auto a = make(test::TxBuilder().xero(), 1);
    EXPECT_EQ(core::check_match(a, a, cfg_), PredicateFailure::SameTransaction);
}

TEST_F(MatchPredicateTest, ToleranceIsConfigurable) {
    core::ReconConfig exact = cfg_;
    exact.amount_tolerance_cents = 0;
    exact.date_window_days = 0;
    const auto a = make(test::TxBuilder().xero().amount("10.00").date("2024-01-01"), 1);
    const auto b = make(test::TxBuilder().quickbooks().amount("10.01").date("2024-01-02"), 2);
    EXPECT_TRUE(core::is_match(a, b, cfg_));
    EXPECT_FALSE(core::is_match(a, b, exact));
}

TEST(CandidateRankTest, OrdersByDateThenAmountThenCreatedThenId) {
    std::vector<core::CandidateRank> ranks{
        {1, 0, 10, 4},
        {0, 1, 30, 3},
        {0, 0, 20, 2},
        {0, 0, 20, 1},
        {0, 1, 5, 5},
    };
    std::sort(ranks.begin(), ranks.end());
    std::vector<core::TransactionId> ids;
    for (const auto& r : ranks) ids.push_back(r.id);
    EXPECT_EQ(ids, (std::vector<core::TransactionId>{1, 2, 5, 3, 4}));
}

} // namespace
