#pragma once

#include <cstdint>
#include <type_traits>

namespace core {

// Matching tolerances and engine behaviour flags.
struct ReconConfig {
    // Absolute amount tolerance, in cents (inclusive).
    std::int64_t amount_tolerance_cents{1};

    // Transaction date window, in whole days either side (inclusive).
    std::int32_t date_window_days{3};

    // On an already-matched transaction, load the counterpart and check the link is mutual.
    bool verify_counterpart_on_idempotent{true};

    // Drop index entries whose store record is no longer Pending.
    bool prune_stale_candidates{true};
};

static_assert(std::is_trivially_copyable_v<ReconConfig>, "ReconConfig must be trivially copyable");

[[nodiscard]] inline constexpr ReconConfig default_recon_config() noexcept {
    return ReconConfig{};
}

// Every stored pair must satisfy these; a config may only tighten them.
inline constexpr std::int64_t max_amount_tolerance_cents = 1;
inline constexpr std::int32_t max_date_window_days = 3;

[[nodiscard]] inline constexpr bool within_pairing_limits(const ReconConfig& cfg) noexcept {
    return cfg.amount_tolerance_cents >= 0 && cfg.amount_tolerance_cents <= max_amount_tolerance_cents &&
           cfg.date_window_days >= 0 && cfg.date_window_days <= max_date_window_days;
}

// The widest tolerances a pair may have been matched under.
[[nodiscard]] inline constexpr ReconConfig pairing_limits() noexcept {
    ReconConfig cfg{};
    cfg.amount_tolerance_cents = max_amount_tolerance_cents;
    cfg.date_window_days = max_date_window_days;
    return cfg;
}

} // namespace core
