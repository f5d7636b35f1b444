#pragma once

#include <functional>
#include <string>

#include "codec.hpp"
#include "internal/broker/api/broker.hpp"
#include "sender.hpp"

namespace clusterlink::messaging {

/*
  Routes a delivery to the typed handler for its message_type.

  Handlers receive the publisher's broker-validated user id alongside the
  decoded message; that user id is the cluster's identity. Replies go to
  `outbox`, which is published only if the whole delivery succeeds.
  Message types without a handler are rejected as invalid so they end up
  dead-lettered instead of cycling through the queue.
*/
class MessageDispatcher {
 public:
  template <typename T>
  using Handler = std::function<void(const std::string& sender, const T& message, MessageSender& outbox)>;

  void OnHeartbeat(Handler<v1::HeartbeatMessage> handler);
  void OnClusterNodes(Handler<v1::ClusterNodesMessage> handler);
  void OnClusterModels(Handler<v1::AIMClusterModelsMessage> handler);

  // Throws util::InvalidMessage, or whatever the handler throws.
  void Dispatch(const std::string& sender, const std::string& body, MessageSender& outbox) const;
  void Dispatch(const broker::IncomingMessage& message, MessageSender& outbox) const;

 private:
  Handler<v1::HeartbeatMessage>        heartbeat_;
  Handler<v1::ClusterNodesMessage>     cluster_nodes_;
  Handler<v1::AIMClusterModelsMessage> cluster_models_;
};

} // namespace clusterlink::messaging
