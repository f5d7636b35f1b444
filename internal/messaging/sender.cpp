#include "sender.hpp"

#include <stdexcept>

#include "codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "publisher.hpp"

namespace clusterlink::messaging {

using observability::IntField;

MessageSender::MessageSender(std::shared_ptr<broker::Connection> connection, std::string claimed_identity)
    : connection_(std::move(connection)), claimed_identity_(std::move(claimed_identity)) {
  if (!connection_) {
    throw std::invalid_argument("MessageSender requires a connection");
  }
}

void MessageSender::Enqueue(const std::string& queue_name, const google::protobuf::Message& message) {
  Enqueue(queue_name, EncodeMessage(message));
}

void MessageSender::Enqueue(const std::string& queue_name, std::string body) {
  std::lock_guard lock(mutex_);
  pending_.push_back(Outbound{queue_name, std::move(body)});
}

void MessageSender::OnFlushed(std::function<void()> callback) {
  std::lock_guard lock(mutex_);
  on_flushed_.push_back(std::move(callback));
}

void MessageSender::Flush() {
  std::vector<std::function<void()>> callbacks;
  {
    std::lock_guard lock(mutex_);
    PublishPendingLocked();
    callbacks.swap(on_flushed_);
  }

  for (auto& callback : callbacks) {
    callback();
  }
}

void MessageSender::PublishPendingLocked() {
  if (pending_.empty()) return;

  std::shared_ptr<broker::Channel> channel;
  try {
    channel = connection_->OpenChannel();
  } catch (const broker::BrokerError& e) {
    throw util::ConnectionError(std::string("failed to open channel: ") + e.what());
  }

  const auto total = static_cast<std::int64_t>(pending_.size());
  try {
    while (!pending_.empty()) {
      const auto& next = pending_.front();
      Publish(*channel, next.queue, next.body, claimed_identity_);
      pending_.pop_front();
    }
  } catch (...) {
    channel->Close();
    throw;
  }
  channel->Close();

  CLUSTERLINK_LOG_DEBUG("Flushed outbound messages", {IntField("count", total)});
}

void MessageSender::Discard() {
  std::lock_guard lock(mutex_);
  if (!pending_.empty()) {
    CLUSTERLINK_LOG_WARN("Discarding outbound messages", {IntField("count", static_cast<std::int64_t>(pending_.size()))});
  }
  pending_.clear();
  on_flushed_.clear();
}

std::size_t MessageSender::Pending() const {
  std::lock_guard lock(mutex_);
  return pending_.size();
}

} // namespace clusterlink::messaging
