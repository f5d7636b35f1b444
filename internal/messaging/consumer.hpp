#pragma once

#include <string>

#include "internal/broker/api/broker.hpp"
#include "internal/util/cancellation.hpp"

namespace clusterlink::messaging {

/*
  Long-running subscription to one queue.

  Connects, opens a channel with prefetch 1 and hands every delivery to
  `handler` on the channel's dispatch thread. With prefetch 1 the next
  message is delivered only after the previous one has been settled, so
  the handler is never re-entered.

  Blocks until `token` is cancelled (returns normally) or the broker
  drops the connection (throws util::ConnectionError). A queue that does
  not exist raises util::NotFound; the queue is never declared here.

  Channel and connection are released on every exit path, channel first.
*/
void RunConsumer(broker::ConnectionFactory& factory,
                 const broker::BrokerEndpoint& endpoint,
                 const std::string& queue_name,
                 broker::MessageHandler handler,
                 util::CancellationToken& token);

} // namespace clusterlink::messaging
