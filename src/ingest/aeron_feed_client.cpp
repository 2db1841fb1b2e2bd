#include "ingest/aeron_feed_client.hpp"

#include <concurrent/AtomicBuffer.h>
#include <concurrent/logbuffer/Header.h>

namespace ingest {
namespace {

class AeronSubscription final : public SubscriptionView {
public:
    explicit AeronSubscription(std::shared_ptr<aeron::Subscription> sub) : sub_(std::move(sub)) {}

    int poll(const RecordHandler& handler, int record_limit) override {
        return sub_->poll(
            [&handler](const aeron::concurrent::AtomicBuffer& buffer,
                       aeron::util::index_t offset,
                       aeron::util::index_t length,
                       const aeron::concurrent::logbuffer::Header&) {
                handler(buffer.buffer() + offset, static_cast<std::size_t>(length));
            },
            record_limit);
    }

    bool is_connected() const override { return sub_->isConnected(); }

private:
    std::shared_ptr<aeron::Subscription> sub_;
};

class AeronFeedClient final : public FeedClientView {
public:
    explicit AeronFeedClient(std::shared_ptr<aeron::Aeron> client) : client_(std::move(client)) {}

    std::int64_t add_subscription(const std::string& channel, std::int32_t stream_id) override {
        return client_->addSubscription(channel, stream_id);
    }

    std::shared_ptr<SubscriptionView> find_subscription(std::int64_t registration_id) override {
        auto sub = client_->findSubscription(registration_id);
        if (!sub) {
            return nullptr;
        }
        return std::make_shared<AeronSubscription>(std::move(sub));
    }

private:
    std::shared_ptr<aeron::Aeron> client_;
};

} // namespace

std::shared_ptr<FeedClientView> make_aeron_feed_client(std::shared_ptr<aeron::Aeron> client) {
    return std::make_shared<AeronFeedClient>(std::move(client));
}

} // namespace ingest
