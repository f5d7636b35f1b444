#pragma once

#include <cstdint>

#include "api/clusterlink/v1.hpp"
#include "cluster_ledger.hpp"

namespace clusterlink::clusters {

inline constexpr const char* kCatchAllQuotaName = "catch-all";

struct ClusterResources {
  std::int64_t cpu_milli_cores         = 0;
  std::int64_t memory_bytes            = 0;
  std::int64_t ephemeral_storage_bytes = 0;
  std::int64_t gpu_count               = 0;
};

// Sum over ready nodes only.
ClusterResources AvailableResources(const ClusterRecord& record);

/*
  Quota allocation pushed to a cluster after its inventory changed.

  No project quotas are tracked here, so the whole available capacity
  goes to the catch-all quota. gpu_vendor is taken from the first ready
  GPU node and left empty for CPU-only clusters.
*/
v1::ClusterQuotasAllocationMessage BuildQuotasAllocation(const ClusterRecord& record);

} // namespace clusterlink::clusters
