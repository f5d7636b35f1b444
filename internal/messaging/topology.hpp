#pragma once

#include <string>

#include "internal/broker/api/broker.hpp"

namespace clusterlink::messaging {

/*
  Wire contract shared with every cluster agent. Values must match
  byte-for-byte on both sides.
*/
inline constexpr const char* kDeadLetterExchange   = "dlx_exchange";
inline constexpr const char* kDeadLetterRoutingKey = "dlx_key";
inline constexpr const char* kDeadLetterQueue      = "dlx_queue";

inline constexpr const char* kQueueTypeArgument          = "x-queue-type";
inline constexpr const char* kQuorumQueueType            = "quorum";
inline constexpr const char* kDeadLetterExchangeArgument = "x-dead-letter-exchange";
inline constexpr const char* kDeadLetterRoutingArgument  = "x-dead-letter-routing-key";

// Options every application queue is declared with.
broker::QueueOptions ApplicationQueueOptions();

/*
  Brings the channel's vhost to the known topology for `queue_name`:

    dlx_exchange (direct) --dlx_key--> dlx_queue
    queue_name (durable, quorum, dead-letters into dlx_exchange/dlx_key)

  Safe to call repeatedly. Any disagreement with what already exists on
  the broker is raised as util::TopologyError.
*/
void EnsureTopology(broker::Channel& channel, const std::string& queue_name);

} // namespace clusterlink::messaging
