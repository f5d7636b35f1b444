#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "errors.hpp"
#include "types.hpp"

namespace clusterlink::broker {

/*
  Narrow view of an AMQP 0-9-1 broker.

  Implementations: memory::MemoryBroker (in process). A networked client
  plugs in behind ConnectionFactory without touching messaging code.
*/

class IncomingMessage {
 public:
  virtual ~IncomingMessage() = default;

  virtual const std::string& Body() const        = 0;
  virtual const std::string& UserId() const      = 0;
  virtual const std::string& RoutingKey() const  = 0;
  virtual std::uint64_t      DeliveryTag() const = 0;
  virtual bool               Redelivered() const = 0;

  virtual void Ack() = 0;
  // requeue=false routes the message to the queue's dead-letter exchange.
  virtual void Nack(bool requeue) = 0;
};

using MessageHandler = std::function<void(IncomingMessage&)>;

class Channel {
 public:
  using ClosedCallback = std::function<void(const std::string& reason)>;

  virtual ~Channel() = default;

  virtual void DeclareExchange(const std::string& name, ExchangeType type, bool durable) = 0;
  virtual void DeclareQueue(const std::string& name, const QueueOptions& options)      = 0;
  // Throws NotFound if the queue does not exist. Never creates it.
  virtual void DeclareQueuePassive(const std::string& name)                                              = 0;
  virtual void BindQueue(const std::string& queue, const std::string& exchange, const std::string& routing_key) = 0;

  // Returns once the broker has stored the message (publisher confirm).
  // The empty exchange name is the default exchange.
  virtual void Publish(const std::string& exchange, const std::string& routing_key, const OutgoingMessage& message) = 0;

  // Per-consumer unacknowledged message limit for consumers started later
  // on this channel. 0 means unlimited.
  virtual void SetPrefetch(std::uint16_t count) = 0;

  virtual std::string Consume(const std::string& queue, MessageHandler handler) = 0;
  virtual void        CancelConsumer(const std::string& consumer_tag)            = 0;

  // Fires once when the broker closes the channel (channel exception,
  // e.g. an unknown delivery tag). Not fired by Close(). Fires right away
  // when the channel is already closed. Callbacks must not call back into
  // the channel.
  virtual void OnClose(ClosedCallback callback) = 0;

  virtual void Close()        = 0;
  virtual bool IsOpen() const = 0;
};

class Connection {
 public:
  using LostCallback = std::function<void(const std::string& reason)>;

  virtual ~Connection() = default;

  virtual std::shared_ptr<Channel> OpenChannel() = 0;

  virtual const std::string& AuthenticatedUser() const = 0;

  // Fires when the broker side drops the connection. Not fired by Close().
  virtual void OnConnectionLost(LostCallback callback) = 0;

  virtual void Close()        = 0;
  virtual bool IsOpen() const = 0;
};

class ConnectionFactory {
 public:
  virtual ~ConnectionFactory() = default;

  virtual std::shared_ptr<Connection> Connect(const BrokerEndpoint& endpoint) = 0;
};

} // namespace clusterlink::broker
