#include "processing.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace clusterlink::messaging {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

ProcessOutcome ProcessMessage(broker::IncomingMessage& message, const ProcessFn& process) {
  const auto tag = static_cast<std::int64_t>(message.DeliveryTag());

  try {
    process(message);
  } catch (const util::InvalidMessage& e) {
    CLUSTERLINK_LOG_ERROR("Rejecting invalid message",
                          {StringField("queue", message.RoutingKey()), IntField("delivery_tag", tag), StringField("error", e.what())});
    message.Nack(false);
    return ProcessOutcome::kDeadLettered;
  } catch (const std::exception& e) {
    CLUSTERLINK_LOG_ERROR("Message processing failed, requeueing",
                          {StringField("queue", message.RoutingKey()),
                           IntField("delivery_tag", tag),
                           BoolField("redelivered", message.Redelivered()),
                           StringField("error", e.what())});
    message.Nack(true);
    return ProcessOutcome::kRequeued;
  }

  message.Ack();
  return ProcessOutcome::kAcked;
}

ProcessOutcome ProcessMessage(broker::IncomingMessage& message,
                              ConnectionProvider& connections,
                              const std::string& claimed_identity,
                              const SendingProcessFn& process) {
  return ProcessMessage(message, [&](const broker::IncomingMessage& m) {
    try {
      SendScoped(connections.Get(), claimed_identity, [&](MessageSender& outbox) { process(m, outbox); });
    } catch (const util::ConnectionError&) {
      connections.Reset();
      throw;
    }
  });
}

} // namespace clusterlink::messaging
