#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "api/clusterlink/v1.hpp"
#include "internal/util/time.hpp"

namespace clusterlink::clusters {

enum class ClusterStatus { kVerifying, kHealthy, kUnhealthy };

enum class NodeSnapshotResult { kOutdated, kUnchanged, kChanged };

const char* ToString(ClusterStatus status);

inline constexpr std::chrono::minutes kClusterHeartbeatTimeout{5};

struct ClusterRecord {
  // Broker user the cluster's agent authenticates as.
  std::string id;
  std::string organization_name;
  std::string name;

  std::optional<util::TimePoint> last_heartbeat_at;
  std::optional<util::TimePoint> nodes_updated_at;

  std::vector<v1::ClusterNode> nodes;
};

/*
  Central view of registered clusters, fed by the feedback consumer.

  A cluster has to be registered before any of its messages are
  accepted. Out-of-order heartbeats never move last_heartbeat_at
  backwards.
*/
class ClusterLedger {
 public:
  // Throws util::InvalidState if `cluster_id` is already registered.
  void RegisterCluster(const std::string& cluster_id, const std::string& organization_name);

  // Throws util::NotFound for unregistered clusters. Returns false when
  // the heartbeat was ignored (organization mismatch on rename).
  bool ApplyHeartbeat(const std::string& cluster_id, const v1::HeartbeatMessage& heartbeat);

  // Replaces the node inventory unless the snapshot is older than the
  // one already applied. kChanged means nodes were added, removed or
  // modified (names compare case-insensitively). Throws util::NotFound.
  NodeSnapshotResult ApplyClusterNodes(const std::string& cluster_id, const v1::ClusterNodesMessage& message);
  // What ApplyClusterNodes would return, without applying.
  NodeSnapshotResult CompareClusterNodes(const std::string& cluster_id, const v1::ClusterNodesMessage& message) const;

  // Throws util::NotFound.
  ClusterRecord Get(const std::string& cluster_id) const;
  ClusterStatus Status(const std::string& cluster_id, util::TimePoint now) const;

  std::size_t              Size() const;
  std::vector<std::string> ClusterIds() const;

  static ClusterStatus DeriveStatus(const std::optional<util::TimePoint>& last_heartbeat_at, util::TimePoint now);

 private:
  ClusterRecord&       RecordLocked(const std::string& cluster_id);
  const ClusterRecord& RecordLocked(const std::string& cluster_id) const;

  static NodeSnapshotResult CompareLocked(const ClusterRecord& record, const v1::ClusterNodesMessage& message);

  mutable std::mutex                   mutex_;
  std::map<std::string, ClusterRecord> clusters_;
};

struct NodeCounts {
  std::int64_t total     = 0;
  std::int64_t available = 0;
  std::int64_t gpus      = 0;
};

NodeCounts CountNodes(const ClusterRecord& record);

} // namespace clusterlink::clusters
