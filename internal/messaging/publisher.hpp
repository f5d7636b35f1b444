#pragma once

#include <string>

#include "internal/broker/api/broker.hpp"

namespace clusterlink::messaging {

/*
  Publishes one persistent message to `queue_name` via the default
  exchange, claiming `claimed_identity` as user id.

  Routing convention: the default (nameless) exchange delivers to the
  queue whose name equals the routing key. Both sides rely on this.

  Returns once the broker stored the message. Throws
  util::PublisherIdentityMismatch when the broker rejects the claimed
  identity, util::ConnectionError for transport failures.
*/
void Publish(broker::Channel& channel, const std::string& queue_name, const std::string& body, const std::string& claimed_identity);

// Opens a dedicated channel for this call and closes it afterwards.
void Publish(broker::Connection& connection, const std::string& queue_name, const std::string& body, const std::string& claimed_identity);

} // namespace clusterlink::messaging
