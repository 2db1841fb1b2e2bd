#pragma once

#include <memory>

#include <Aeron.h>

#include "ingest/feed_client_view.hpp"

namespace ingest {

// Wraps a connected Aeron client. Every fragment on the stream is one record, so
// publishers must offer whole WireTransaction frames below the MTU.
std::shared_ptr<FeedClientView> make_aeron_feed_client(std::shared_ptr<aeron::Aeron> client);

} // namespace ingest
