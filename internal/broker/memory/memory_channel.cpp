#include "memory_broker.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace clusterlink::broker::memory {

using observability::IntField;
using observability::StringField;

// ------------------------------------------------------------
// ChannelCore dispatch
// ------------------------------------------------------------

namespace detail {

ChannelCore::ChannelCore(std::uint64_t id, std::string vhost, std::string user) : id_(id), vhost_(std::move(vhost)), user_(std::move(user)) {
}

ChannelCore::~ChannelCore() {
  RequestStop();
  if (thread_.joinable()) {
    if (thread_.get_id() == std::this_thread::get_id()) {
      thread_.detach();
    } else {
      thread_.join();
    }
  }
}

void ChannelCore::Enqueue(PendingDelivery delivery) {
  {
    std::lock_guard lock(dispatch_mutex_);
    if (stopping_) return;
    pending_.push_back(std::move(delivery));
    if (!thread_.joinable()) {
      // the thread keeps the core alive until it drains out
      thread_ = std::thread([self = shared_from_this()] { self->RunDispatch(); });
    }
  }
  dispatch_cv_.notify_one();
}

void ChannelCore::RequestStop() {
  {
    std::lock_guard lock(dispatch_mutex_);
    stopping_ = true;
    pending_.clear();
  }
  dispatch_cv_.notify_all();
}

void ChannelCore::Join() {
  std::thread::id id;
  {
    std::lock_guard lock(dispatch_mutex_);
    if (!thread_.joinable()) return;
    id = thread_.get_id();
  }
  if (id == std::this_thread::get_id()) return;

  std::lock_guard join_lock(join_mutex_);
  if (thread_.joinable()) thread_.join();
}

void ChannelCore::RunDispatch() {
  while (true) {
    PendingDelivery delivery;
    {
      std::unique_lock lock(dispatch_mutex_);
      dispatch_cv_.wait(lock, [&] { return stopping_ || !pending_.empty(); });
      if (stopping_) return;
      delivery = std::move(pending_.front());
      pending_.pop_front();
    }

    try {
      delivery.handler(*delivery.message);
    } catch (const std::exception& e) {
      CLUSTERLINK_LOG_ERROR("Consumer callback raised", {IntField("channel", static_cast<std::int64_t>(id_)),
                                                         IntField("delivery_tag", static_cast<std::int64_t>(delivery.message->DeliveryTag())),
                                                         StringField("error", e.what())});
    } catch (...) {
      CLUSTERLINK_LOG_ERROR("Consumer callback raised a non-standard exception",
                            {IntField("channel", static_cast<std::int64_t>(id_)),
                             IntField("delivery_tag", static_cast<std::int64_t>(delivery.message->DeliveryTag()))});
    }
  }
}

} // namespace detail

// ------------------------------------------------------------
// MemoryChannel
// ------------------------------------------------------------

MemoryChannel::MemoryChannel(std::shared_ptr<MemoryBroker> broker, std::shared_ptr<detail::ChannelCore> core)
    : broker_(std::move(broker)), core_(std::move(core)) {
}

MemoryChannel::~MemoryChannel() {
  Close();
}

void MemoryChannel::DeclareExchange(const std::string& name, ExchangeType type, bool durable) {
  broker_->DeclareExchange(*core_, name, type, durable);
}

void MemoryChannel::DeclareQueue(const std::string& name, const QueueOptions& options) {
  broker_->DeclareQueue(*core_, name, options);
}

void MemoryChannel::DeclareQueuePassive(const std::string& name) {
  broker_->DeclareQueuePassive(*core_, name);
}

void MemoryChannel::BindQueue(const std::string& queue, const std::string& exchange, const std::string& routing_key) {
  broker_->BindQueue(*core_, queue, exchange, routing_key);
}

void MemoryChannel::Publish(const std::string& exchange, const std::string& routing_key, const OutgoingMessage& message) {
  broker_->Publish(*core_, exchange, routing_key, message);
}

void MemoryChannel::SetPrefetch(std::uint16_t count) {
  broker_->SetPrefetch(*core_, count);
}

std::string MemoryChannel::Consume(const std::string& queue, MessageHandler handler) {
  return broker_->Consume(core_, queue, std::move(handler));
}

void MemoryChannel::CancelConsumer(const std::string& consumer_tag) {
  broker_->CancelConsumer(*core_, consumer_tag);
}

void MemoryChannel::OnClose(ClosedCallback callback) {
  broker_->AddCloseCallback(*core_, std::move(callback));
}

void MemoryChannel::Close() {
  broker_->CloseChannel(core_);
}

bool MemoryChannel::IsOpen() const {
  std::lock_guard lock(broker_->mutex_);
  return core_->open;
}

// ------------------------------------------------------------
// MemoryConnection
// ------------------------------------------------------------

MemoryConnection::MemoryConnection(std::shared_ptr<MemoryBroker> broker, std::string vhost, std::string user)
    : broker_(std::move(broker)), vhost_(std::move(vhost)), user_(std::move(user)) {
}

MemoryConnection::~MemoryConnection() {
  for (auto& core : TakeChannels()) {
    broker_->CloseChannel(core);
  }
}

std::shared_ptr<Channel> MemoryConnection::OpenChannel() {
  std::lock_guard lock(mutex_);
  if (!open_) {
    throw ChannelClosed("connection to vhost '" + vhost_ + "' is closed");
  }

  auto core = broker_->OpenChannel(vhost_, user_);
  channels_.push_back(core);
  return std::make_shared<MemoryChannel>(broker_, std::move(core));
}

const std::string& MemoryConnection::AuthenticatedUser() const {
  return user_;
}

void MemoryConnection::OnConnectionLost(LostCallback callback) {
  std::lock_guard lock(mutex_);
  lost_callbacks_.push_back(std::move(callback));
}

std::vector<std::shared_ptr<detail::ChannelCore>> MemoryConnection::TakeChannels() {
  std::vector<std::shared_ptr<detail::ChannelCore>> cores;
  std::lock_guard                                   lock(mutex_);
  open_ = false;
  for (auto& weak : channels_) {
    if (auto core = weak.lock()) cores.push_back(std::move(core));
  }
  channels_.clear();
  return cores;
}

void MemoryConnection::Close() {
  {
    std::lock_guard lock(mutex_);
    if (!open_) return;
  }

  for (auto& core : TakeChannels()) {
    broker_->CloseChannel(core);
  }
  broker_->ForgetConnection(this);
}

bool MemoryConnection::IsOpen() const {
  std::lock_guard lock(mutex_);
  return open_;
}

void MemoryConnection::Drop(const std::string& reason) {
  {
    std::lock_guard lock(mutex_);
    if (!open_) return;
  }

  for (auto& core : TakeChannels()) {
    broker_->CloseChannel(core);
  }

  std::vector<LostCallback> callbacks;
  {
    std::lock_guard lock(mutex_);
    callbacks.swap(lost_callbacks_);
  }

  CLUSTERLINK_LOG_WARN("Broker dropped connection", {StringField("vhost", vhost_), StringField("user", user_), StringField("reason", reason)});
  for (auto& callback : callbacks) {
    callback(reason);
  }
}

} // namespace clusterlink::broker::memory
