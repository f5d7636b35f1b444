#include "topology.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace clusterlink::messaging {

using observability::StringField;

broker::QueueOptions ApplicationQueueOptions() {
  broker::QueueOptions options;
  options.durable     = true;
  options.auto_delete = false;
  options.exclusive   = false;
  options.arguments   = {
      {kQueueTypeArgument, kQuorumQueueType},
      {kDeadLetterExchangeArgument, kDeadLetterExchange},
      {kDeadLetterRoutingArgument, kDeadLetterRoutingKey},
  };
  return options;
}

static broker::QueueOptions DeadLetterQueueOptions() {
  broker::QueueOptions options;
  options.durable     = true;
  options.auto_delete = false;
  options.arguments   = {{kQueueTypeArgument, kQuorumQueueType}};
  return options;
}

void EnsureTopology(broker::Channel& channel, const std::string& queue_name) {
  if (queue_name.empty()) {
    throw util::TopologyError("queue name must not be empty");
  }
  if (queue_name == kDeadLetterQueue) {
    throw util::TopologyError(std::string("'") + kDeadLetterQueue + "' is reserved for dead-lettered messages");
  }

  try {
    channel.DeclareExchange(kDeadLetterExchange, broker::ExchangeType::kDirect, true);
    channel.DeclareQueue(kDeadLetterQueue, DeadLetterQueueOptions());
    channel.BindQueue(kDeadLetterQueue, kDeadLetterExchange, kDeadLetterRoutingKey);

    channel.DeclareQueue(queue_name, ApplicationQueueOptions());
  } catch (const broker::PreconditionFailed& e) {
    CLUSTERLINK_LOG_ERROR("Queue topology drift", {StringField("queue", queue_name), StringField("error", e.what())});
    throw util::TopologyError("topology for queue '" + queue_name + "' conflicts with broker state: " + e.what());
  } catch (const broker::AccessRefused& e) {
    throw util::TopologyError("topology for queue '" + queue_name + "' refused by broker: " + e.what());
  } catch (const broker::ChannelClosed& e) {
    throw util::ConnectionError(e.what());
  }

  CLUSTERLINK_LOG_DEBUG("Queue topology ensured", {StringField("queue", queue_name)});
}

} // namespace clusterlink::messaging
