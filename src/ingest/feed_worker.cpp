#include "ingest/feed_worker.hpp"

#include <chrono>
#include <thread>

#include "util/async_log.hpp"

namespace ingest {

FeedWorker::FeedWorker(std::atomic<bool>& stop_flag,
                       FeedRing& ring,
                       IngestionGateway& gateway,
                       FeedWorkerStats& stats) noexcept
    : stop_flag_(stop_flag), ring_(ring), gateway_(gateway), stats_(stats) {}

void FeedWorker::process(const core::Transaction& draft) noexcept {
    stats_.consumed.fetch_add(1, std::memory_order_relaxed);
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        const IngestResult res = gateway_.ingest(draft);
        if (res.status != IngestStatus::Unavailable &&
            res.reconcile.status != core::ReconcileStatus::StoreUnavailable) {
            if (res.reconcile.matched()) {
                stats_.matched.fetch_add(1, std::memory_order_relaxed);
            }
            return;
        }
        if (res.status == IngestStatus::Accepted) {
            // Stored and indexed; only the reconcile failed. The catch-up sweep or the
            // counterpart's own reconcile will pick it up.
            stats_.failed.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        stats_.retries.fetch_add(1, std::memory_order_relaxed);
        std::this_thread::sleep_for(std::chrono::milliseconds(attempt));
    }
    stats_.failed.fetch_add(1, std::memory_order_relaxed);
    LOG_WARM_ERROR(util::LogCategory::Feed,
                   "%s external_id=%.*s not ingested after %d attempts",
                   core::provider_name(draft.provider),
                   static_cast<int>(draft.external_id_len),
                   draft.external_id,
                   max_attempts);
}

std::size_t FeedWorker::drain() noexcept {
    std::size_t handled = 0;
    core::Transaction draft{};
    while (ring_.try_pop(draft)) {
        process(draft);
        ++handled;
    }
    return handled;
}

void FeedWorker::run() {
    std::uint32_t backoff = 0;
    while (!stop_flag_.load(std::memory_order_acquire)) {
        if (drain() != 0) {
            backoff = 0;
            continue;
        }
        if (backoff < 16) {
            ++backoff;
            std::this_thread::yield();
        } else {
            std::this_thread::sleep_for(std::chrono::microseconds(50));
        }
    }
    drain();
}

} // namespace ingest
