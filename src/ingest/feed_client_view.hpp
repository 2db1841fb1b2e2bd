#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace ingest {

// Receives one complete wire record; the bytes are only valid during the call.
using RecordHandler = std::function<void(const std::uint8_t* data, std::size_t length)>;

// Transport seam under FeedSubscriber. The daemon plugs in the Aeron client
// (see aeron_feed_client.hpp); tests plug in scripted stubs.
class SubscriptionView {
public:
    virtual ~SubscriptionView() = default;

    // Delivers at most record_limit records and returns how many were delivered.
    virtual int poll(const RecordHandler& handler, int record_limit) = 0;

    // True while at least one publisher is attached to the stream.
    virtual bool is_connected() const = 0;
};

class FeedClientView {
public:
    virtual ~FeedClientView() = default;

    // Starts registering a subscription; the returned id is polled with find_subscription.
    virtual std::int64_t add_subscription(const std::string& channel, std::int32_t stream_id) = 0;

    // Null until the registration has completed.
    virtual std::shared_ptr<SubscriptionView> find_subscription(std::int64_t registration_id) = 0;
};

} // namespace ingest
