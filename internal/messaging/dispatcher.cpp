#include "dispatcher.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace clusterlink::messaging {

using observability::StringField;

void MessageDispatcher::OnHeartbeat(Handler<v1::HeartbeatMessage> handler) {
  heartbeat_ = std::move(handler);
}

void MessageDispatcher::OnClusterNodes(Handler<v1::ClusterNodesMessage> handler) {
  cluster_nodes_ = std::move(handler);
}

void MessageDispatcher::OnClusterModels(Handler<v1::AIMClusterModelsMessage> handler) {
  cluster_models_ = std::move(handler);
}

void MessageDispatcher::Dispatch(const std::string& sender, const std::string& body, MessageSender& outbox) const {
  if (sender.empty()) {
    throw util::InvalidMessage("message carries no user id");
  }

  const auto type = DecodeMessageType(body);
  CLUSTERLINK_LOG_DEBUG("Dispatching message", {StringField("message_type", type), StringField("sender", sender)});

  if (type == kHeartbeatMessageType && heartbeat_) {
    heartbeat_(sender, DecodeHeartbeat(body), outbox);
  } else if (type == kClusterNodesMessageType && cluster_nodes_) {
    cluster_nodes_(sender, DecodeClusterNodes(body), outbox);
  } else if (type == kClusterModelsMessageType && cluster_models_) {
    cluster_models_(sender, DecodeClusterModels(body), outbox);
  } else {
    throw util::InvalidMessage("no handler for message_type '" + type + "'");
  }
}

void MessageDispatcher::Dispatch(const broker::IncomingMessage& message, MessageSender& outbox) const {
  Dispatch(message.UserId(), message.Body(), outbox);
}

} // namespace clusterlink::messaging
