#include "memory_broker.hpp"

#include <algorithm>
#include <utility>

#include "internal/observability/logging.hpp"

namespace clusterlink::broker::memory {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kQueueTypeArgument     = "x-queue-type";
constexpr const char* kDeadLetterExchangeArg = "x-dead-letter-exchange";
constexpr const char* kDeadLetterRoutingKey  = "x-dead-letter-routing-key";

std::string DescribeArguments(const Arguments& args) {
  std::string out = "{";
  bool        first = true;
  for (const auto& [key, value] : args) {
    if (!first) out += ", ";
    first = false;
    out += key + "=" + value;
  }
  return out + "}";
}

std::string QueueRef(const std::string& queue, const std::string& vhost) {
  return "queue '" + queue + "' in vhost '" + vhost + "'";
}

} // namespace

// ------------------------------------------------------------
// Delivery handed to consumer callbacks
// ------------------------------------------------------------

class MemoryDelivery final : public IncomingMessage {
 public:
  MemoryDelivery(std::weak_ptr<MemoryBroker> broker, std::weak_ptr<detail::ChannelCore> core, std::uint64_t tag, detail::StoredMessage stored)
      : broker_(std::move(broker)), core_(std::move(core)), tag_(tag), stored_(std::move(stored)) {
  }

  const std::string& Body() const override {
    return stored_.message.body;
  }
  const std::string& UserId() const override {
    return stored_.message.user_id;
  }
  const std::string& RoutingKey() const override {
    return stored_.routing_key;
  }
  std::uint64_t DeliveryTag() const override {
    return tag_;
  }
  bool Redelivered() const override {
    return stored_.redelivered;
  }

  void Ack() override {
    Settle(MemoryBroker::Settle::kAck);
  }

  void Nack(bool requeue) override {
    Settle(requeue ? MemoryBroker::Settle::kRequeue : MemoryBroker::Settle::kDeadLetter);
  }

 private:
  void Settle(MemoryBroker::Settle action) {
    auto broker = broker_.lock();
    auto core   = core_.lock();
    if (!broker || !core) {
      throw ChannelClosed("channel closed before delivery " + std::to_string(tag_) + " was settled");
    }
    broker->SettleDelivery(*core, tag_, action);
  }

  std::weak_ptr<MemoryBroker>        broker_;
  std::weak_ptr<detail::ChannelCore> core_;
  std::uint64_t                      tag_;
  detail::StoredMessage              stored_;
};

// ------------------------------------------------------------
// Broker administration
// ------------------------------------------------------------

std::shared_ptr<MemoryBroker> MemoryBroker::Create() {
  return std::shared_ptr<MemoryBroker>(new MemoryBroker());
}

void MemoryBroker::AddVirtualHost(const std::string& vhost) {
  std::lock_guard lock(mutex_);
  vhosts_.try_emplace(vhost);
}

void MemoryBroker::AddUser(const std::string& username, const std::string& password) {
  std::lock_guard lock(mutex_);
  users_[username] = password;
}

void MemoryBroker::SetAvailable(bool available) {
  std::lock_guard lock(mutex_);
  available_ = available;
}

void MemoryBroker::DropConnections(const std::string& reason) {
  std::vector<std::shared_ptr<MemoryConnection>> live;
  {
    std::lock_guard lock(mutex_);
    for (auto& weak : connections_) {
      if (auto conn = weak.lock()) live.push_back(std::move(conn));
    }
    connections_.clear();
  }

  for (auto& conn : live) {
    conn->Drop(reason);
  }
}

std::shared_ptr<Connection> MemoryBroker::Connect(const BrokerEndpoint& endpoint) {
  std::lock_guard lock(mutex_);

  if (!available_) {
    throw ConnectionRefused("Connect call failed: connection refused (" + endpoint.host + ":" + std::to_string(endpoint.port) + ")");
  }

  auto user = users_.find(endpoint.credentials.username);
  if (user == users_.end() || user->second != endpoint.credentials.password) {
    throw AccessRefused("ACCESS_REFUSED - Login was refused using authentication mechanism PLAIN");
  }

  if (vhosts_.find(endpoint.vhost) == vhosts_.end()) {
    throw NotFound("NOT_FOUND - vhost '" + endpoint.vhost + "' not found");
  }

  auto conn = std::make_shared<MemoryConnection>(shared_from_this(), endpoint.vhost, endpoint.credentials.username);

  connections_.erase(std::remove_if(connections_.begin(), connections_.end(), [](const auto& weak) { return weak.expired(); }),
                     connections_.end());
  connections_.push_back(conn);
  return conn;
}

// ------------------------------------------------------------
// Inspection
// ------------------------------------------------------------

bool MemoryBroker::HasQueue(const std::string& vhost, const std::string& queue) const {
  std::lock_guard lock(mutex_);
  auto            vh = vhosts_.find(vhost);
  return vh != vhosts_.end() && vh->second.queues.count(queue) > 0;
}

std::size_t MemoryBroker::ReadyCount(const std::string& vhost, const std::string& queue) const {
  std::lock_guard lock(mutex_);
  auto            vh = vhosts_.find(vhost);
  if (vh == vhosts_.end()) return 0;
  auto q = vh->second.queues.find(queue);
  return q == vh->second.queues.end() ? 0 : q->second.ready.size();
}

std::size_t MemoryBroker::UnackedCount(const std::string& vhost, const std::string& queue) const {
  std::lock_guard lock(mutex_);
  auto            vh = vhosts_.find(vhost);
  if (vh == vhosts_.end()) return 0;
  auto q = vh->second.queues.find(queue);
  return q == vh->second.queues.end() ? 0 : q->second.unacked;
}

std::vector<std::string> MemoryBroker::ReadyBodies(const std::string& vhost, const std::string& queue) const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> bodies;
  auto                     vh = vhosts_.find(vhost);
  if (vh == vhosts_.end()) return bodies;
  auto q = vh->second.queues.find(queue);
  if (q == vh->second.queues.end()) return bodies;
  for (const auto& stored : q->second.ready) {
    bodies.push_back(stored.message.body);
  }
  return bodies;
}

std::optional<QueueOptions> MemoryBroker::QueueDeclaration(const std::string& vhost, const std::string& queue) const {
  std::lock_guard lock(mutex_);
  auto            vh = vhosts_.find(vhost);
  if (vh == vhosts_.end()) return std::nullopt;
  auto q = vh->second.queues.find(queue);
  if (q == vh->second.queues.end()) return std::nullopt;
  return q->second.options;
}

std::size_t MemoryBroker::ConsumerCount(const std::string& vhost, const std::string& queue) const {
  std::lock_guard lock(mutex_);
  auto            vh = vhosts_.find(vhost);
  if (vh == vhosts_.end()) return 0;
  auto q = vh->second.queues.find(queue);
  return q == vh->second.queues.end() ? 0 : q->second.consumers.size();
}

std::size_t MemoryBroker::OpenConnectionCount() const {
  std::vector<std::weak_ptr<MemoryConnection>> tracked;
  {
    std::lock_guard lock(mutex_);
    tracked = connections_;
  }

  // connection locks are never taken under the broker lock
  std::size_t count = 0;
  for (const auto& weak : tracked) {
    auto conn = weak.lock();
    if (conn && conn->IsOpen()) ++count;
  }
  return count;
}

// ------------------------------------------------------------
// Locked helpers
// ------------------------------------------------------------

MemoryBroker::VirtualHostState& MemoryBroker::VirtualHostLocked(const std::string& vhost) {
  auto vh = vhosts_.find(vhost);
  if (vh == vhosts_.end()) {
    throw NotFound("NOT_FOUND - vhost '" + vhost + "' not found");
  }
  return vh->second;
}

void MemoryBroker::EnsureOpenLocked(const detail::ChannelCore& core) const {
  if (!core.open) {
    throw ChannelClosed("channel " + std::to_string(core.Id()) + " is closed");
  }
}

void MemoryBroker::CloseChannelLocked(detail::ChannelCore& core) {
  if (!core.open) return;
  core.open = false;

  auto vh = vhosts_.find(core.VirtualHost());
  if (vh != vhosts_.end()) {
    for (auto& [name, queue] : vh->second.queues) {
      auto& consumers = queue.consumers;
      consumers.erase(std::remove_if(consumers.begin(), consumers.end(),
                                     [&](const auto& consumer) { return consumer->channel.get() == &core; }),
                      consumers.end());
      if (queue.next_consumer >= consumers.size()) queue.next_consumer = 0;
    }

    // unacked deliveries go back to the head of their queue, in order
    for (auto it = core.unacked.rbegin(); it != core.unacked.rend(); ++it) {
      auto q = vh->second.queues.find(it->second.queue);
      if (q == vh->second.queues.end()) continue;
      auto stored        = std::move(it->second.stored);
      stored.redelivered = true;
      q->second.ready.push_front(std::move(stored));
      if (q->second.unacked > 0) --q->second.unacked;
    }
  }

  core.unacked.clear();
  core.consumer_tags.clear();
  core.close_callbacks.clear();
  core.RequestStop();

  if (vh != vhosts_.end()) {
    for (auto& [name, queue] : vh->second.queues) {
      PumpLocked(name, queue);
    }
  }
}

void MemoryBroker::FailChannelLocked(detail::ChannelCore& core, const std::string& reason) {
  if (!core.open) return;
  core.close_reason = reason;

  // listeners only flag state and notify; they never re-enter the broker
  auto callbacks = std::move(core.close_callbacks);
  core.close_callbacks.clear();
  for (auto& callback : callbacks) {
    callback(reason);
  }
  CloseChannelLocked(core);
}

void MemoryBroker::FailChannelPreconditionLocked(detail::ChannelCore& core, const std::string& reason) {
  const auto message = "PRECONDITION_FAILED - " + reason;
  FailChannelLocked(core, message);
  throw PreconditionFailed(message);
}

void MemoryBroker::FailChannelNotFoundLocked(detail::ChannelCore& core, const std::string& reason) {
  const auto message = "NOT_FOUND - " + reason;
  FailChannelLocked(core, message);
  throw NotFound(message);
}

void MemoryBroker::RouteLocked(VirtualHostState& vh, const std::string& exchange, const std::string& routing_key, detail::StoredMessage stored) {
  std::vector<std::string> targets;

  if (exchange.empty()) {
    // default exchange: every queue is bound under its own name
    if (vh.queues.count(routing_key)) targets.push_back(routing_key);
  } else {
    const auto& ex = vh.exchanges.at(exchange);
    for (const auto& [key, queue] : ex.bindings) {
      if (ex.type == ExchangeType::kFanout || key == routing_key) {
        if (std::find(targets.begin(), targets.end(), queue) == targets.end()) targets.push_back(queue);
      }
    }
  }

  if (targets.empty()) {
    CLUSTERLINK_LOG_DEBUG("Unroutable message dropped", {StringField("exchange", exchange), StringField("routing_key", routing_key)});
    return;
  }

  stored.routing_key = routing_key;
  for (const auto& target : targets) {
    auto& queue = vh.queues.at(target);
    queue.ready.push_back(stored);
    PumpLocked(target, queue);
  }
}

void MemoryBroker::DeadLetterLocked(VirtualHostState& vh, const QueueState& source, detail::StoredMessage stored) {
  const auto& args     = source.options.arguments;
  auto        exchange = args.find(kDeadLetterExchangeArg);
  if (exchange == args.end()) {
    CLUSTERLINK_LOG_DEBUG("Rejected message discarded, queue has no dead-letter exchange");
    return;
  }
  if (!exchange->second.empty() && vh.exchanges.find(exchange->second) == vh.exchanges.end()) {
    CLUSTERLINK_LOG_WARN("Dead-letter exchange missing, message discarded", {StringField("exchange", exchange->second)});
    return;
  }

  auto        key         = args.find(kDeadLetterRoutingKey);
  std::string routing_key = key == args.end() ? stored.routing_key : key->second;

  stored.redelivered = false;
  RouteLocked(vh, exchange->second, routing_key, std::move(stored));
}

void MemoryBroker::PumpLocked(const std::string& queue_name, QueueState& queue) {
  while (!queue.ready.empty() && !queue.consumers.empty()) {
    std::shared_ptr<detail::ConsumerState> chosen;
    const auto                             count = queue.consumers.size();
    for (std::size_t i = 0; i < count; ++i) {
      auto& candidate = queue.consumers[(queue.next_consumer + i) % count];
      if (!candidate->channel->open) continue;
      if (candidate->prefetch != 0 && candidate->in_flight >= candidate->prefetch) continue;
      chosen              = candidate;
      queue.next_consumer = (queue.next_consumer + i + 1) % count;
      break;
    }
    if (!chosen) return;

    auto stored = std::move(queue.ready.front());
    queue.ready.pop_front();

    auto&      core = *chosen->channel;
    const auto tag  = core.next_delivery_tag++;
    ++chosen->in_flight;
    ++queue.unacked;
    core.unacked.emplace(tag, detail::UnackedDelivery{queue_name, stored, chosen});

    detail::PendingDelivery delivery;
    delivery.handler = chosen->handler;
    delivery.message = std::make_unique<MemoryDelivery>(weak_from_this(), chosen->channel, tag, std::move(stored));
    core.Enqueue(std::move(delivery));
  }
}

// ------------------------------------------------------------
// Channel operations
// ------------------------------------------------------------

std::shared_ptr<detail::ChannelCore> MemoryBroker::OpenChannel(const std::string& vhost, const std::string& user) {
  std::lock_guard lock(mutex_);
  VirtualHostLocked(vhost);
  return std::make_shared<detail::ChannelCore>(next_channel_id_++, vhost, user);
}

void MemoryBroker::DeclareExchange(detail::ChannelCore& core, const std::string& name, ExchangeType type, bool durable) {
  std::lock_guard lock(mutex_);
  EnsureOpenLocked(core);
  auto& vh = VirtualHostLocked(core.VirtualHost());

  if (name.empty() || name.rfind("amq.", 0) == 0) {
    const auto message = "ACCESS_REFUSED - operation not permitted on exchange '" + name + "'";
    FailChannelLocked(core, message);
    throw AccessRefused(message);
  }

  auto existing = vh.exchanges.find(name);
  if (existing != vh.exchanges.end()) {
    if (existing->second.type != type) {
      FailChannelPreconditionLocked(core, "inequivalent arg 'type' for exchange '" + name + "': received '" + ToString(type) +
                                              "' but current is '" + ToString(existing->second.type) + "'");
    }
    if (existing->second.durable != durable) {
      FailChannelPreconditionLocked(core, "inequivalent arg 'durable' for exchange '" + name + "'");
    }
    return;
  }

  ExchangeState state;
  state.type    = type;
  state.durable = durable;
  vh.exchanges.emplace(name, std::move(state));
}

void MemoryBroker::DeclareQueue(detail::ChannelCore& core, const std::string& name, const QueueOptions& options) {
  std::lock_guard lock(mutex_);
  EnsureOpenLocked(core);
  auto& vh = VirtualHostLocked(core.VirtualHost());

  if (name.empty()) {
    FailChannelPreconditionLocked(core, "server-named queues are not supported");
  }

  auto type = options.arguments.find(kQueueTypeArgument);
  if (type != options.arguments.end() && type->second == "quorum") {
    if (!options.durable || options.auto_delete || options.exclusive) {
      FailChannelPreconditionLocked(core, "invalid property for " + QueueRef(name, core.VirtualHost()) +
                                              ": quorum queues must be durable, non-exclusive and not auto-delete");
    }
  }

  auto existing = vh.queues.find(name);
  if (existing != vh.queues.end()) {
    const auto& current = existing->second.options;
    if (current.durable != options.durable) {
      FailChannelPreconditionLocked(core, "inequivalent arg 'durable' for " + QueueRef(name, core.VirtualHost()));
    }
    if (current.auto_delete != options.auto_delete) {
      FailChannelPreconditionLocked(core, "inequivalent arg 'auto_delete' for " + QueueRef(name, core.VirtualHost()));
    }
    if (current.exclusive != options.exclusive) {
      FailChannelPreconditionLocked(core, "inequivalent arg 'exclusive' for " + QueueRef(name, core.VirtualHost()));
    }
    if (current.arguments != options.arguments) {
      FailChannelPreconditionLocked(core, "inequivalent arguments for " + QueueRef(name, core.VirtualHost()) + ": received " +
                                              DescribeArguments(options.arguments) + " but current is " +
                                              DescribeArguments(current.arguments));
    }
    return;
  }

  QueueState state;
  state.options = options;
  vh.queues.emplace(name, std::move(state));
}

void MemoryBroker::DeclareQueuePassive(detail::ChannelCore& core, const std::string& name) {
  std::lock_guard lock(mutex_);
  EnsureOpenLocked(core);
  auto& vh = VirtualHostLocked(core.VirtualHost());

  if (vh.queues.find(name) == vh.queues.end()) {
    FailChannelNotFoundLocked(core, "no " + QueueRef(name, core.VirtualHost()));
  }
}

void MemoryBroker::BindQueue(detail::ChannelCore& core, const std::string& queue, const std::string& exchange, const std::string& routing_key) {
  std::lock_guard lock(mutex_);
  EnsureOpenLocked(core);
  auto& vh = VirtualHostLocked(core.VirtualHost());

  if (vh.queues.find(queue) == vh.queues.end()) {
    FailChannelNotFoundLocked(core, "no " + QueueRef(queue, core.VirtualHost()));
  }
  auto ex = vh.exchanges.find(exchange);
  if (ex == vh.exchanges.end()) {
    FailChannelNotFoundLocked(core, "no exchange '" + exchange + "' in vhost '" + core.VirtualHost() + "'");
  }

  ex->second.bindings.emplace(routing_key, queue);
}

void MemoryBroker::Publish(detail::ChannelCore& core, const std::string& exchange, const std::string& routing_key, const OutgoingMessage& message) {
  std::lock_guard lock(mutex_);
  EnsureOpenLocked(core);
  auto& vh = VirtualHostLocked(core.VirtualHost());

  if (!message.user_id.empty() && message.user_id != core.User()) {
    FailChannelPreconditionLocked(core, "user_id property set to '" + message.user_id + "' but authenticated user was '" + core.User() + "'");
  }

  if (!exchange.empty() && vh.exchanges.find(exchange) == vh.exchanges.end()) {
    FailChannelNotFoundLocked(core, "no exchange '" + exchange + "' in vhost '" + core.VirtualHost() + "'");
  }

  detail::StoredMessage stored;
  stored.message = message;
  RouteLocked(vh, exchange, routing_key, std::move(stored));
}

void MemoryBroker::SetPrefetch(detail::ChannelCore& core, std::uint16_t count) {
  std::lock_guard lock(mutex_);
  EnsureOpenLocked(core);
  core.prefetch = count;
}

std::string MemoryBroker::Consume(const std::shared_ptr<detail::ChannelCore>& core, const std::string& queue_name, MessageHandler handler) {
  std::lock_guard lock(mutex_);
  EnsureOpenLocked(*core);
  auto& vh = VirtualHostLocked(core->VirtualHost());

  auto queue = vh.queues.find(queue_name);
  if (queue == vh.queues.end()) {
    FailChannelNotFoundLocked(*core, "no " + QueueRef(queue_name, core->VirtualHost()));
  }

  auto consumer      = std::make_shared<detail::ConsumerState>();
  consumer->tag      = "ctag" + std::to_string(core->Id()) + "." + std::to_string(core->next_consumer_index++);
  consumer->queue    = queue_name;
  consumer->channel  = core;
  consumer->handler  = std::move(handler);
  consumer->prefetch = core->prefetch;

  core->consumer_tags.insert(consumer->tag);
  queue->second.consumers.push_back(consumer);

  CLUSTERLINK_LOG_DEBUG("Consumer attached", {StringField("queue", queue_name), StringField("consumer_tag", consumer->tag),
                                              IntField("prefetch", consumer->prefetch)});

  PumpLocked(queue_name, queue->second);
  return consumer->tag;
}

void MemoryBroker::CancelConsumer(detail::ChannelCore& core, const std::string& consumer_tag) {
  std::lock_guard lock(mutex_);
  EnsureOpenLocked(core);

  if (core.consumer_tags.erase(consumer_tag) == 0) {
    FailChannelNotFoundLocked(core, "unknown consumer tag '" + consumer_tag + "'");
  }

  auto& vh = VirtualHostLocked(core.VirtualHost());
  for (auto& [name, queue] : vh.queues) {
    auto& consumers = queue.consumers;
    consumers.erase(std::remove_if(consumers.begin(), consumers.end(), [&](const auto& consumer) { return consumer->tag == consumer_tag; }),
                    consumers.end());
    if (queue.next_consumer >= consumers.size()) queue.next_consumer = 0;
  }
}

void MemoryBroker::CloseChannel(const std::shared_ptr<detail::ChannelCore>& core) {
  {
    std::lock_guard lock(mutex_);
    CloseChannelLocked(*core);
  }
  core->Join();
}

void MemoryBroker::AddCloseCallback(detail::ChannelCore& core, Channel::ClosedCallback callback) {
  std::lock_guard lock(mutex_);
  if (!core.open) {
    callback(core.close_reason.empty() ? "channel " + std::to_string(core.Id()) + " is closed" : core.close_reason);
    return;
  }
  core.close_callbacks.push_back(std::move(callback));
}

void MemoryBroker::SettleDelivery(detail::ChannelCore& core, std::uint64_t delivery_tag, Settle action) {
  std::lock_guard lock(mutex_);
  EnsureOpenLocked(core);

  auto entry = core.unacked.find(delivery_tag);
  if (entry == core.unacked.end()) {
    FailChannelPreconditionLocked(core, "unknown delivery tag " + std::to_string(delivery_tag));
  }

  auto delivery = std::move(entry->second);
  core.unacked.erase(entry);
  if (delivery.consumer && delivery.consumer->in_flight > 0) --delivery.consumer->in_flight;

  auto& vh    = VirtualHostLocked(core.VirtualHost());
  auto  queue = vh.queues.find(delivery.queue);
  if (queue == vh.queues.end()) return;
  if (queue->second.unacked > 0) --queue->second.unacked;

  switch (action) {
    case Settle::kAck:
      break;
    case Settle::kRequeue:
      delivery.stored.redelivered = true;
      queue->second.ready.push_front(std::move(delivery.stored));
      break;
    case Settle::kDeadLetter:
      DeadLetterLocked(vh, queue->second, std::move(delivery.stored));
      break;
  }

  PumpLocked(delivery.queue, queue->second);
}

void MemoryBroker::ForgetConnection(const MemoryConnection* connection) {
  // released after the lock so no connection destructor runs under it
  std::vector<std::shared_ptr<MemoryConnection>> released;

  std::lock_guard lock(mutex_);
  connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                    [&](const auto& weak) {
                                      auto       conn = weak.lock();
                                      const bool drop = !conn || conn.get() == connection;
                                      released.push_back(std::move(conn));
                                      return drop;
                                    }),
                     connections_.end());
}

} // namespace clusterlink::broker::memory
