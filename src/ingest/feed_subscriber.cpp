#include "ingest/feed_subscriber.hpp"

#include <cstring>
#include <thread>

#include "util/async_log.hpp"

namespace ingest {

FeedSubscriber::FeedSubscriber(std::string channel,
                               std::int32_t stream_id,
                               core::Provider provider,
                               FeedRing& ring,
                               FeedStats& stats,
                               std::shared_ptr<FeedClientView> client,
                               std::atomic<bool>& stop_flag) noexcept
    : channel_(std::move(channel)),
      stream_id_(stream_id),
      provider_(provider),
      ring_(ring),
      stats_(stats),
      client_(std::move(client)),
      stop_flag_(stop_flag) {}

void FeedSubscriber::on_record(const std::uint8_t* data, std::size_t length) noexcept {
    if (length != sizeof(core::WireTransaction)) {
        stats_.decode_failures.fetch_add(1, std::memory_order_relaxed);
        LOG_WARM_WARN(util::LogCategory::Feed, "%s: dropped record of %zu bytes", core::provider_name(provider_), length);
        return;
    }
    core::WireTransaction wire{};
    std::memcpy(&wire, data, sizeof(wire));
    const core::Transaction draft = core::from_wire(wire, provider_);

    bool waited = false;
    while (!ring_.try_push(draft)) {
        if (stop_flag_.load(std::memory_order_acquire)) {
            stats_.dropped_on_stop.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        if (!waited) {
            waited = true;
            stats_.backpressure_waits.fetch_add(1, std::memory_order_relaxed);
        }
        std::this_thread::yield();
    }
    stats_.produced.fetch_add(1, std::memory_order_relaxed);
}

void FeedSubscriber::track_connection(const SubscriptionView& subscription) noexcept {
    const bool now = subscription.is_connected();
    if (now == connected_) {
        return;
    }
    connected_ = now;
    if (now) {
        LOG_WARM_INFO(util::LogCategory::Feed, "%s: publisher connected", core::provider_name(provider_));
    } else {
        stats_.disconnects.fetch_add(1, std::memory_order_relaxed);
        LOG_WARM_WARN(util::LogCategory::Feed, "%s: publisher disconnected", core::provider_name(provider_));
    }
}

void FeedSubscriber::run() {
    constexpr int record_limit = 10;

    const auto registration_id = client_->add_subscription(channel_, stream_id_);

    std::shared_ptr<SubscriptionView> subscription;
    while (!stop_flag_.load(std::memory_order_acquire) && !subscription) {
        subscription = client_->find_subscription(registration_id);
        if (!subscription) {
            std::this_thread::yield();
        }
    }
    if (!subscription) {
        return;
    }
    LOG_WARM_INFO(util::LogCategory::Feed, "%s: subscribed to %s stream %d",
                  core::provider_name(provider_), channel_.c_str(), stream_id_);

    const RecordHandler handler = [this](const std::uint8_t* data, std::size_t length) { on_record(data, length); };

    int idle_count = 0;
    while (!stop_flag_.load(std::memory_order_acquire)) {
        if (subscription->poll(handler, record_limit) > 0) {
            idle_count = 0;
            continue;
        }
        track_connection(*subscription);
        if (idle_count < 32) {
            ++idle_count;
        } else {
            idle_count = 0;
            std::this_thread::yield();
        }
    }
}

} // namespace ingest
