#pragma once

#include <functional>
#include <string>

#include "connection_provider.hpp"
#include "internal/broker/api/broker.hpp"
#include "sender.hpp"

namespace clusterlink::messaging {

using ProcessFn        = std::function<void(const broker::IncomingMessage&)>;
using SendingProcessFn = std::function<void(const broker::IncomingMessage&, MessageSender& outbox)>;

enum class ProcessOutcome { kAcked, kRequeued, kDeadLettered };

/*
  Settles `message` according to how `process` finished:

    returns normally             -> ack
    throws util::InvalidMessage  -> reject without requeue (dead-lettered)
    throws anything else         -> reject with requeue

  The handler's exception is logged and absorbed; the message state on
  the broker is the only outcome the caller sees.
*/
ProcessOutcome ProcessMessage(broker::IncomingMessage& message, const ProcessFn& process);

/*
  Same settlement rules, with a fresh outbox per delivery. Messages the
  handler enqueues are published as `claimed_identity` before the ack;
  they are discarded when the delivery is rejected. A failed publish
  rejects with requeue, so the replies are produced again on redelivery.
*/
ProcessOutcome ProcessMessage(broker::IncomingMessage& message,
                              ConnectionProvider& connections,
                              const std::string& claimed_identity,
                              const SendingProcessFn& process);

} // namespace clusterlink::messaging
