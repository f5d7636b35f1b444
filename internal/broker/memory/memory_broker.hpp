#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "internal/broker/api/broker.hpp"

namespace clusterlink::broker::memory {

class MemoryBroker;

namespace detail {

struct StoredMessage {
  OutgoingMessage message;
  std::string     routing_key;
  bool            redelivered = false;
};

class ChannelCore;

struct ConsumerState {
  std::string                  tag;
  std::string                  queue;
  std::shared_ptr<ChannelCore> channel;
  MessageHandler               handler;
  std::uint16_t                prefetch  = 0;
  std::size_t                  in_flight = 0;
};

struct UnackedDelivery {
  std::string                    queue;
  StoredMessage                  stored;
  std::shared_ptr<ConsumerState> consumer;
};

struct PendingDelivery {
  MessageHandler                   handler;
  std::unique_ptr<IncomingMessage> message;
};

/*
  Per-channel state shared between the public channel object and the
  broker. Broker-owned fields are guarded by the broker mutex; the
  dispatch queue has its own lock and thread.
*/
class ChannelCore : public std::enable_shared_from_this<ChannelCore> {
 public:
  ChannelCore(std::uint64_t id, std::string vhost, std::string user);
  ~ChannelCore();

  std::uint64_t      Id() const { return id_; }
  const std::string& VirtualHost() const { return vhost_; }
  const std::string& User() const { return user_; }

  // guarded by the broker mutex
  bool                                       open                = true;
  std::uint16_t                              prefetch            = 0;
  std::uint64_t                              next_delivery_tag   = 1;
  std::uint64_t                              next_consumer_index = 1;
  std::map<std::uint64_t, UnackedDelivery>   unacked;
  std::set<std::string>                      consumer_tags;
  std::vector<Channel::ClosedCallback>       close_callbacks;
  std::string                                close_reason;

  // Starts the dispatch thread on first use.
  void Enqueue(PendingDelivery delivery);
  // Non-blocking; safe under the broker lock.
  void RequestStop();
  // Waits for an in-flight handler. No-op on the dispatch thread itself.
  void Join();

 private:
  void RunDispatch();

  const std::uint64_t id_;
  const std::string   vhost_;
  const std::string   user_;

  std::mutex                  dispatch_mutex_;
  std::condition_variable     dispatch_cv_;
  std::deque<PendingDelivery> pending_;
  bool                        stopping_ = false;
  std::mutex                  join_mutex_;
  std::thread                 thread_;
};

} // namespace detail

class MemoryConnection;

class MemoryChannel final : public Channel {
 public:
  MemoryChannel(std::shared_ptr<MemoryBroker> broker, std::shared_ptr<detail::ChannelCore> core);
  ~MemoryChannel() override;

  void DeclareExchange(const std::string& name, ExchangeType type, bool durable) override;
  void DeclareQueue(const std::string& name, const QueueOptions& options) override;
  void DeclareQueuePassive(const std::string& name) override;
  void BindQueue(const std::string& queue, const std::string& exchange, const std::string& routing_key) override;
  void Publish(const std::string& exchange, const std::string& routing_key, const OutgoingMessage& message) override;
  void SetPrefetch(std::uint16_t count) override;

  std::string Consume(const std::string& queue, MessageHandler handler) override;
  void        CancelConsumer(const std::string& consumer_tag) override;

  void OnClose(ClosedCallback callback) override;

  void Close() override;
  bool IsOpen() const override;

 private:
  std::shared_ptr<MemoryBroker>        broker_;
  std::shared_ptr<detail::ChannelCore> core_;
};

class MemoryConnection final : public Connection, public std::enable_shared_from_this<MemoryConnection> {
 public:
  MemoryConnection(std::shared_ptr<MemoryBroker> broker, std::string vhost, std::string user);
  ~MemoryConnection() override;

  std::shared_ptr<Channel> OpenChannel() override;

  const std::string& AuthenticatedUser() const override;

  void OnConnectionLost(LostCallback callback) override;

  void Close() override;
  bool IsOpen() const override;

  // Broker side drop. Closes every channel and notifies lost callbacks.
  void Drop(const std::string& reason);

 private:
  std::vector<std::shared_ptr<detail::ChannelCore>> TakeChannels();

  std::shared_ptr<MemoryBroker> broker_;
  const std::string             vhost_;
  const std::string             user_;

  mutable std::mutex                                mutex_;
  bool                                              open_ = true;
  std::vector<std::weak_ptr<detail::ChannelCore>>   channels_;
  std::vector<LostCallback>                         lost_callbacks_;
};

/*
  MemoryBroker

  In-process AMQP 0-9-1 broker with the semantics the messaging layer
  depends on:
    - idempotent declare, PRECONDITION_FAILED on inequivalent arguments
    - quorum queues must be durable and non auto-delete
    - default exchange routes by queue name
    - user_id validated against the authenticated user
    - per-consumer prefetch, ack / nack / requeue
    - nack without requeue dead-letters via x-dead-letter-exchange

  Host and port of the endpoint are ignored.
*/
class MemoryBroker final : public ConnectionFactory, public std::enable_shared_from_this<MemoryBroker> {
 public:
  static std::shared_ptr<MemoryBroker> Create();

  void AddVirtualHost(const std::string& vhost);
  void AddUser(const std::string& username, const std::string& password);

  // While unavailable every Connect throws ConnectionRefused.
  void SetAvailable(bool available);

  // Simulates a broker restart for every live connection.
  void DropConnections(const std::string& reason);

  std::shared_ptr<Connection> Connect(const BrokerEndpoint& endpoint) override;

  // Inspection
  bool                       HasQueue(const std::string& vhost, const std::string& queue) const;
  std::size_t                ReadyCount(const std::string& vhost, const std::string& queue) const;
  std::size_t                UnackedCount(const std::string& vhost, const std::string& queue) const;
  std::vector<std::string>   ReadyBodies(const std::string& vhost, const std::string& queue) const;
  std::optional<QueueOptions> QueueDeclaration(const std::string& vhost, const std::string& queue) const;
  std::size_t                ConsumerCount(const std::string& vhost, const std::string& queue) const;
  std::size_t                OpenConnectionCount() const;

 private:
  friend class MemoryChannel;
  friend class MemoryConnection;
  friend class MemoryDelivery;

  MemoryBroker() = default;

  enum class Settle { kAck, kRequeue, kDeadLetter };

  struct QueueState {
    QueueOptions                                         options;
    std::deque<detail::StoredMessage>                    ready;
    std::vector<std::shared_ptr<detail::ConsumerState>> consumers;
    std::size_t                                          next_consumer = 0;
    std::size_t                                          unacked       = 0;
  };

  struct ExchangeState {
    ExchangeType                                   type    = ExchangeType::kDirect;
    bool                                           durable = true;
    std::set<std::pair<std::string, std::string>> bindings;  // (routing key, queue)
  };

  struct VirtualHostState {
    std::map<std::string, ExchangeState> exchanges;
    std::map<std::string, QueueState>    queues;
  };

  // Channel operations. All take the broker lock.
  std::shared_ptr<detail::ChannelCore> OpenChannel(const std::string& vhost, const std::string& user);
  void DeclareExchange(detail::ChannelCore& core, const std::string& name, ExchangeType type, bool durable);
  void DeclareQueue(detail::ChannelCore& core, const std::string& name, const QueueOptions& options);
  void DeclareQueuePassive(detail::ChannelCore& core, const std::string& name);
  void BindQueue(detail::ChannelCore& core, const std::string& queue, const std::string& exchange, const std::string& routing_key);
  void Publish(detail::ChannelCore& core, const std::string& exchange, const std::string& routing_key, const OutgoingMessage& message);
  void SetPrefetch(detail::ChannelCore& core, std::uint16_t count);
  std::string Consume(const std::shared_ptr<detail::ChannelCore>& core, const std::string& queue, MessageHandler handler);
  void        CancelConsumer(detail::ChannelCore& core, const std::string& consumer_tag);
  void        CloseChannel(const std::shared_ptr<detail::ChannelCore>& core);
  void        AddCloseCallback(detail::ChannelCore& core, Channel::ClosedCallback callback);
  void        SettleDelivery(detail::ChannelCore& core, std::uint64_t delivery_tag, Settle action);
  void        ForgetConnection(const MemoryConnection* connection);

  // Helpers below expect the broker lock to be held.
  VirtualHostState& VirtualHostLocked(const std::string& vhost);
  void EnsureOpenLocked(const detail::ChannelCore& core) const;
  void CloseChannelLocked(detail::ChannelCore& core);
  // Broker-initiated close: notifies OnClose listeners, then closes.
  void FailChannelLocked(detail::ChannelCore& core, const std::string& reason);
  [[noreturn]] void FailChannelPreconditionLocked(detail::ChannelCore& core, const std::string& reason);
  [[noreturn]] void FailChannelNotFoundLocked(detail::ChannelCore& core, const std::string& reason);
  void RouteLocked(VirtualHostState& vh, const std::string& exchange, const std::string& routing_key, detail::StoredMessage stored);
  void DeadLetterLocked(VirtualHostState& vh, const QueueState& source, detail::StoredMessage stored);
  void PumpLocked(const std::string& queue_name, QueueState& queue);

  mutable std::mutex                                  mutex_;
  bool                                                available_ = true;
  std::map<std::string, VirtualHostState>             vhosts_;
  std::unordered_map<std::string, std::string>        users_;
  std::vector<std::weak_ptr<MemoryConnection>>        connections_;
  std::uint64_t                                       next_channel_id_ = 1;
};

} // namespace clusterlink::broker::memory
