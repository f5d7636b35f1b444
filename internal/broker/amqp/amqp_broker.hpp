#pragma once

#include <chrono>
#include <memory>

#include "internal/broker/api/broker.hpp"

namespace clusterlink::broker::amqp {

struct AmqpOptions {
  std::chrono::milliseconds connect_timeout = std::chrono::seconds(10);
  // Applies to every synchronous method and to publisher confirms.
  std::chrono::milliseconds rpc_timeout = std::chrono::seconds(30);
  // 0 disables AMQP heartbeats.
  int heartbeat_seconds = 0;
};

/*
  AmqpConnectionFactory

  Connects to a RabbitMQ broker over AMQP 0-9-1 through rabbitmq-c.

  One socket per Connection. rabbitmq-c connections are not thread safe,
  so every frame exchange is serialized on a per-connection lock. The
  first Consume() starts an I/O thread that reads deliveries and
  broker-initiated closes; consumer callbacks run on that thread, one at
  a time.

  Channels publish in confirm mode: Publish() returns once the broker
  acked the message and throws the mapped channel error when the broker
  closed the channel instead (e.g. user_id mismatch).
*/
class AmqpConnectionFactory final : public ConnectionFactory {
 public:
  explicit AmqpConnectionFactory(AmqpOptions options = {});

  std::shared_ptr<Connection> Connect(const BrokerEndpoint& endpoint) override;

 private:
  AmqpOptions options_;
};

} // namespace clusterlink::broker::amqp
