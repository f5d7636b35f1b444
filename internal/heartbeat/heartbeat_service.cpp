#include "heartbeat_service.hpp"

#include "internal/messaging/codec.hpp"
#include "internal/messaging/publisher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace clusterlink::heartbeat {

using observability::StringField;

HeartbeatService::HeartbeatService(std::shared_ptr<broker::ConnectionFactory> factory,
                                   broker::BrokerEndpoint endpoint,
                                   HeartbeatSettings settings,
                                   health::WatcherRegistry& registry)
    : connections_(std::move(factory), std::move(endpoint)), settings_(std::move(settings)), registry_(registry) {
}

HeartbeatService::~HeartbeatService() {
  Stop();
}

v1::HeartbeatMessage HeartbeatService::BuildHeartbeat(util::TimePoint now) const {
  v1::HeartbeatMessage message;
  message.set_message_type(messaging::kHeartbeatMessageType);
  *message.mutable_last_heartbeat_at() = util::ToProto(now);
  message.set_cluster_name(settings_.cluster_name);
  message.set_organization_name(settings_.organization_name);
  return message;
}

void HeartbeatService::SendHeartbeat() {
  const auto message = BuildHeartbeat(util::Now());
  const auto body    = messaging::EncodeMessage(message);

  std::lock_guard lock(mutex_);
  auto            connection = connections_.Get();
  try {
    messaging::Publish(*connection, settings_.queue, body, connections_.Endpoint().credentials.username);
  } catch (const util::ConnectionError&) {
    connections_.Reset();
    throw;
  }
  ++sent_;

  CLUSTERLINK_LOG_DEBUG("Heartbeat sent",
                        {StringField("queue", settings_.queue),
                         StringField("cluster_name", settings_.cluster_name),
                         StringField("last_heartbeat_at", util::ToIso8601(util::FromProto(message.last_heartbeat_at())))});
}

void HeartbeatService::Start() {
  if (watcher_) {
    throw util::InvalidState("heartbeat service already started");
  }

  auto watcher = std::make_unique<health::PollingWatcher>(
      kHeartbeatWatcherName, registry_, [this] { SendHeartbeat(); }, settings_.interval, settings_.retry_delay);
  watcher->Start();
  watcher_ = std::move(watcher);
}

void HeartbeatService::Stop() {
  if (watcher_) {
    watcher_->Stop();
  }

  std::lock_guard lock(mutex_);
  connections_.Reset();
}

std::uint64_t HeartbeatService::Sent() const {
  std::lock_guard lock(mutex_);
  return sent_;
}

} // namespace clusterlink::heartbeat
