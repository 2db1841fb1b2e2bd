#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "core/transaction.hpp"
#include "core/wire_transaction.hpp"
#include "ingest/feed_client_view.hpp"
#include "ingest/feed_worker.hpp"

namespace ingest {

struct FeedStats {
    std::atomic<std::uint64_t> produced{0};
    std::atomic<std::uint64_t> decode_failures{0};
    std::atomic<std::uint64_t> backpressure_waits{0};
    std::atomic<std::uint64_t> dropped_on_stop{0};
    std::atomic<std::uint64_t> disconnects{0};
};

// Polls one provider's stream and pushes decoded drafts into the ring. A full ring
// stalls polling instead of dropping; records are only lost if stop is raised while
// the ring is still full.
class FeedSubscriber {
public:
    FeedSubscriber(std::string channel,
                   std::int32_t stream_id,
                   core::Provider provider,
                   FeedRing& ring,
                   FeedStats& stats,
                   std::shared_ptr<FeedClientView> client,
                   std::atomic<bool>& stop_flag) noexcept;

    void run();

    core::Provider provider() const noexcept { return provider_; }

private:
    void on_record(const std::uint8_t* data, std::size_t length) noexcept;
    void track_connection(const SubscriptionView& subscription) noexcept;

    std::string channel_;
    std::int32_t stream_id_;
    core::Provider provider_;
    FeedRing& ring_;
    FeedStats& stats_;
    std::shared_ptr<FeedClientView> client_;
    std::atomic<bool>& stop_flag_;
    bool connected_{false};
};

} // namespace ingest
