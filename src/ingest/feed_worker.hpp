#pragma once

#include <atomic>
#include <cstdint>

#include "core/transaction.hpp"
#include "ingest/ingestion_gateway.hpp"
#include "ingest/spsc_ring.hpp"

namespace ingest {

using FeedRing = SpscRing<core::Transaction, 1u << 12>;

struct FeedWorkerStats {
    std::atomic<std::uint64_t> consumed{0};
    std::atomic<std::uint64_t> matched{0};
    std::atomic<std::uint64_t> retries{0};
    std::atomic<std::uint64_t> failed{0};
};

// Drains one feed ring into the gateway. Each provider feed gets its own worker, so
// reconciliations triggered by the two feeds run concurrently.
class FeedWorker {
public:
    // A record the gateway reports Unavailable is retried this many times before it is
    // counted as failed; the provider re-delivers it later and dedup absorbs repeats.
    static constexpr int max_attempts = 3;

    FeedWorker(std::atomic<bool>& stop_flag, FeedRing& ring, IngestionGateway& gateway, FeedWorkerStats& stats) noexcept;

    void run();

    // Drains whatever is queued right now; returns the number of records handled.
    std::size_t drain() noexcept;

private:
    void process(const core::Transaction& draft) noexcept;

    std::atomic<bool>& stop_flag_;
    FeedRing& ring_;
    IngestionGateway& gateway_;
    FeedWorkerStats& stats_;
};

} // namespace ingest
