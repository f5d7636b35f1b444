#include "cluster_ledger.hpp"

#include <algorithm>
#include <cctype>

#include <google/protobuf/util/message_differencer.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace clusterlink::clusters {

using observability::StringField;

namespace {

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
         });
}

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool SameInventory(const std::vector<v1::ClusterNode>& current, const v1::ClusterNodesMessage& snapshot) {
  if (current.size() != static_cast<std::size_t>(snapshot.cluster_nodes_size())) return false;

  std::map<std::string, const v1::ClusterNode*> by_name;
  for (const auto& node : current) {
    by_name[Lower(node.name())] = &node;
  }
  for (const auto& node : snapshot.cluster_nodes()) {
    auto it = by_name.find(Lower(node.name()));
    if (it == by_name.end()) return false;
    if (!google::protobuf::util::MessageDifferencer::Equals(*it->second, node)) return false;
    by_name.erase(it);
  }
  return by_name.empty();
}

} // namespace

const char* ToString(ClusterStatus status) {
  switch (status) {
    case ClusterStatus::kVerifying:
      return "verifying";
    case ClusterStatus::kHealthy:
      return "healthy";
    case ClusterStatus::kUnhealthy:
      return "unhealthy";
  }
  return "unknown";
}

void ClusterLedger::RegisterCluster(const std::string& cluster_id, const std::string& organization_name) {
  std::lock_guard lock(mutex_);

  ClusterRecord record;
  record.id                = cluster_id;
  record.organization_name = organization_name;

  if (!clusters_.emplace(cluster_id, std::move(record)).second) {
    throw util::InvalidState("cluster '" + cluster_id + "' already registered");
  }
}

ClusterRecord& ClusterLedger::RecordLocked(const std::string& cluster_id) {
  auto it = clusters_.find(cluster_id);
  if (it == clusters_.end()) {
    throw util::NotFound("cluster '" + cluster_id + "' not found");
  }
  return it->second;
}

const ClusterRecord& ClusterLedger::RecordLocked(const std::string& cluster_id) const {
  auto it = clusters_.find(cluster_id);
  if (it == clusters_.end()) {
    throw util::NotFound("cluster '" + cluster_id + "' not found");
  }
  return it->second;
}

bool ClusterLedger::ApplyHeartbeat(const std::string& cluster_id, const v1::HeartbeatMessage& heartbeat) {
  std::lock_guard lock(mutex_);
  auto&           record = RecordLocked(cluster_id);

  if (!EqualsIgnoreCase(record.name, heartbeat.cluster_name())) {
    if (!EqualsIgnoreCase(record.organization_name, heartbeat.organization_name())) {
      CLUSTERLINK_LOG_ERROR("Heartbeat organization mismatch",
                            {StringField("cluster_id", cluster_id),
                             StringField("organization_name", heartbeat.organization_name()),
                             StringField("expected", record.organization_name)});
      return false;
    }

    CLUSTERLINK_LOG_INFO("Cluster renamed",
                         {StringField("cluster_id", cluster_id), StringField("from", record.name), StringField("to", heartbeat.cluster_name())});
    record.name = heartbeat.cluster_name();
  }

  const auto at = util::FromProto(heartbeat.last_heartbeat_at());
  if (!record.last_heartbeat_at || at > *record.last_heartbeat_at) {
    record.last_heartbeat_at = at;
  }
  return true;
}

NodeSnapshotResult ClusterLedger::ApplyClusterNodes(const std::string& cluster_id, const v1::ClusterNodesMessage& message) {
  std::lock_guard lock(mutex_);
  auto&           record = RecordLocked(cluster_id);

  const auto result = CompareLocked(record, message);
  if (result == NodeSnapshotResult::kOutdated) {
    CLUSTERLINK_LOG_DEBUG("Ignoring outdated node snapshot", {StringField("cluster_id", cluster_id)});
    return result;
  }

  record.nodes.assign(message.cluster_nodes().begin(), message.cluster_nodes().end());
  record.nodes_updated_at = util::FromProto(message.updated_at());
  return result;
}

NodeSnapshotResult ClusterLedger::CompareClusterNodes(const std::string& cluster_id, const v1::ClusterNodesMessage& message) const {
  std::lock_guard lock(mutex_);
  return CompareLocked(RecordLocked(cluster_id), message);
}

NodeSnapshotResult ClusterLedger::CompareLocked(const ClusterRecord& record, const v1::ClusterNodesMessage& message) {
  if (record.nodes_updated_at && util::FromProto(message.updated_at()) < *record.nodes_updated_at) {
    return NodeSnapshotResult::kOutdated;
  }
  return SameInventory(record.nodes, message) ? NodeSnapshotResult::kUnchanged : NodeSnapshotResult::kChanged;
}

ClusterRecord ClusterLedger::Get(const std::string& cluster_id) const {
  std::lock_guard lock(mutex_);
  return RecordLocked(cluster_id);
}

ClusterStatus ClusterLedger::Status(const std::string& cluster_id, util::TimePoint now) const {
  std::lock_guard lock(mutex_);
  return DeriveStatus(RecordLocked(cluster_id).last_heartbeat_at, now);
}

std::size_t ClusterLedger::Size() const {
  std::lock_guard lock(mutex_);
  return clusters_.size();
}

std::vector<std::string> ClusterLedger::ClusterIds() const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(clusters_.size());
  for (const auto& [id, record] : clusters_) ids.push_back(id);
  return ids;
}

ClusterStatus ClusterLedger::DeriveStatus(const std::optional<util::TimePoint>& last_heartbeat_at, util::TimePoint now) {
  if (!last_heartbeat_at) return ClusterStatus::kVerifying;
  if (now - *last_heartbeat_at > kClusterHeartbeatTimeout) return ClusterStatus::kUnhealthy;
  return ClusterStatus::kHealthy;
}

NodeCounts CountNodes(const ClusterRecord& record) {
  NodeCounts counts;
  for (const auto& node : record.nodes) {
    ++counts.total;
    if (node.is_ready()) ++counts.available;
    if (node.has_gpu_information()) counts.gpus += node.gpu_information().count();
  }
  return counts;
}

} // namespace clusterlink::clusters
