#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "api/clusterlink/v1.hpp"
#include "internal/broker/api/broker.hpp"
#include "internal/health/polling_watcher.hpp"
#include "internal/health/watcher_registry.hpp"
#include "internal/messaging/connection_provider.hpp"
#include "internal/util/time.hpp"

namespace clusterlink::heartbeat {

inline constexpr const char* kHeartbeatWatcherName = "heartbeat_watcher";
inline constexpr const char* kDefaultFeedbackQueue = "airm_common";

struct HeartbeatSettings {
  std::string               queue = kDefaultFeedbackQueue;
  std::string               organization_name;
  std::string               cluster_name;
  std::chrono::milliseconds interval    = std::chrono::seconds(30);
  std::chrono::milliseconds retry_delay = health::kDefaultRetryDelay;
};

/*
  Periodically tells the central service that this cluster is alive.

  Each beat publishes one heartbeat message to the feedback queue as the
  broker user the agent logged in with. The broker connection is opened
  on the first beat and reopened after it breaks.

  Every attempt touches the "heartbeat_watcher" entry of the registry,
  so a broker outage does not by itself mark the process unhealthy; a
  stuck loop does.
*/
class HeartbeatService {
 public:
  HeartbeatService(std::shared_ptr<broker::ConnectionFactory> factory,
                   broker::BrokerEndpoint endpoint,
                   HeartbeatSettings settings,
                   health::WatcherRegistry& registry);
  ~HeartbeatService();

  HeartbeatService(const HeartbeatService&)            = delete;
  HeartbeatService& operator=(const HeartbeatService&) = delete;

  v1::HeartbeatMessage BuildHeartbeat(util::TimePoint now) const;

  // One publish. Throws util::ConnectionError or
  // util::PublisherIdentityMismatch.
  void SendHeartbeat();

  void Start();
  void Stop();

  const HeartbeatSettings& Settings() const {
    return settings_;
  }

  std::uint64_t Sent() const;

 private:
  messaging::ConnectionProvider connections_;
  HeartbeatSettings             settings_;
  health::WatcherRegistry&      registry_;

  mutable std::mutex mutex_;
  std::uint64_t      sent_ = 0;

  std::unique_ptr<health::PollingWatcher> watcher_;
};

} // namespace clusterlink::heartbeat
