#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "core/recon_config.hpp"
#include "core/transaction.hpp"
#include "util/async_log.hpp"
#include "util/log.hpp"

namespace api {

struct FeedConfig {
    std::string channel{"aeron:udp?endpoint=localhost:40123"};
    std::int32_t stream_id{0};
};

struct DaemonConfig {
    std::filesystem::path journal_path{"icrecon.journal"};
    bool sync_each_write{true};

    std::string log_file{}; // stderr when empty
    std::size_t log_capacity{1u << 14};
    util::LogLevel log_level{util::LogLevel::Info};
    std::uint32_t log_categories{util::all_log_categories};

    FeedConfig xero{"aeron:udp?endpoint=localhost:40123", 1001};
    FeedConfig quickbooks{"aeron:udp?endpoint=localhost:40124", 1002};

    core::ReconConfig recon{};

    const FeedConfig& feed(core::Provider p) const noexcept {
        return p == core::Provider::Xero ? xero : quickbooks;
    }
};

// Parses a JSON config document. Every key is optional; absent keys keep the
// defaults above. Unknown keys are rejected so typos do not pass silently.
//
// {
//   "journal_path": "/var/lib/icrecon/journal",
//   "sync_each_write": true,
//   "log": {"file": "", "capacity": 16384, "level": "info",
//           "categories": ["ingest", "recon", "feed"]},
//   "feeds": {
//     "xero":       {"channel": "aeron:udp?endpoint=host:40123", "stream_id": 1001},
//     "quickbooks": {"channel": "aeron:udp?endpoint=host:40124", "stream_id": 1002}
//   },
//   "matching": {"amount_tolerance_cents": 1, "date_window_days": 3,
//                "verify_counterpart_on_idempotent": true, "prune_stale_candidates": true}
// }
bool parse_daemon_config_text(std::string_view text, DaemonConfig& out, std::string& error) noexcept;

bool load_daemon_config(const std::filesystem::path& path, DaemonConfig& out, std::string& error) noexcept;

} // namespace api
