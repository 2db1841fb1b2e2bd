#include <gtest/gtest.h>

#include "core/match_predicate.hpp"
#include "core/recon_config.hpp"
#include "harness/tx_builder.hpp"

namespace {

TEST(ReconConfigTest, DefaultValues) {
    const core::ReconConfig config{};

    EXPECT_EQ(config.amount_tolerance_cents, 1);
    EXPECT_EQ(config.date_window_days, 3);
    EXPECT_TRUE(config.verify_counterpart_on_idempotent);
    EXPECT_TRUE(config.prune_stale_candidates);
}

TEST(ReconConfigTest, DefaultReconConfigFunction) {
    constexpr auto config = core::default_recon_config();
    static_assert(config.amount_tolerance_cents == 1);
    static_assert(config.date_window_days == 3);
    EXPECT_TRUE(config.verify_counterpart_on_idempotent);
}

TEST(ReconConfigTest, CopyKeepsTolerances) {
    core::ReconConfig original{};
    original.amount_tolerance_cents = 25;
    original.date_window_days = 7;
    original.prune_stale_candidates = false;

    core::ReconConfig other{};
    other = original;

    EXPECT_EQ(other.amount_tolerance_cents, 25);
    EXPECT_EQ(other.date_window_days, 7);
    EXPECT_FALSE(other.prune_stale_candidates);
}

// Tightening the tolerances turns boundary matches into misses.
TEST(ReconConfigTest, TolerancesDrivePredicate) {
    auto a = test::TxBuilder().xero().amount("100.00").date("2024-03-01").draft();
    auto b = test::TxBuilder().quickbooks().amount("100.01").date("2024-03-04").draft();
    a.id = 1;
    b.id = 2;

    const core::ReconConfig defaults = core::default_recon_config();
    EXPECT_TRUE(core::is_match(a, b, defaults));

    core::ReconConfig tighter = defaults;
    tighter.date_window_days = 2;
    EXPECT_EQ(core::check_match(a, b, tighter), core::PredicateFailure::DateOutOfWindow);

    tighter.date_window_days = 3;
    tighter.amount_tolerance_cents = 0;
    EXPECT_EQ(core::check_match(a, b, tighter), core::PredicateFailure::AmountOutOfTolerance);
}

TEST(ReconConfigTest, PairingLimitsBoundTheConfig) {
    static_assert(core::within_pairing_limits(core::default_recon_config()));
    static_assert(core::within_pairing_limits(core::pairing_limits()));

    core::ReconConfig cfg{};
    cfg.amount_tolerance_cents = 0;
    cfg.date_window_days = 0;
    EXPECT_TRUE(core::within_pairing_limits(cfg));
    cfg.amount_tolerance_cents = core::max_amount_tolerance_cents + 1;
    EXPECT_FALSE(core::within_pairing_limits(cfg));
    cfg.amount_tolerance_cents = 0;
    cfg.date_window_days = core::max_date_window_days + 1;
    EXPECT_FALSE(core::within_pairing_limits(cfg));
    cfg.date_window_days = -1;
    EXPECT_FALSE(core::within_pairing_limits(cfg));
}

} // namespace
