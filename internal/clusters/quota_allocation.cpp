#include "quota_allocation.hpp"

#include "internal/messaging/codec.hpp"

namespace clusterlink::clusters {

ClusterResources AvailableResources(const ClusterRecord& record) {
  ClusterResources resources;
  for (const auto& node : record.nodes) {
    if (!node.is_ready()) continue;
    resources.cpu_milli_cores += node.cpu_milli_cores();
    resources.memory_bytes += node.memory_bytes();
    resources.ephemeral_storage_bytes += node.ephemeral_storage_bytes();
    if (node.has_gpu_information()) resources.gpu_count += node.gpu_information().count();
  }
  return resources;
}

v1::ClusterQuotasAllocationMessage BuildQuotasAllocation(const ClusterRecord& record) {
  v1::ClusterQuotasAllocationMessage message;
  message.set_message_type(messaging::kQuotasAllocationType);

  for (const auto& node : record.nodes) {
    if (node.is_ready() && node.has_gpu_information() && !node.gpu_information().vendor().empty()) {
      message.set_gpu_vendor(node.gpu_information().vendor());
      break;
    }
  }

  const auto available = AvailableResources(record);
  auto*      catch_all = message.add_quota_allocations();
  catch_all->set_quota_name(kCatchAllQuotaName);
  catch_all->set_cpu_milli_cores(available.cpu_milli_cores);
  catch_all->set_memory_bytes(available.memory_bytes);
  catch_all->set_ephemeral_storage_bytes(available.ephemeral_storage_bytes);
  catch_all->set_gpu_count(available.gpu_count);
  return message;
}

} // namespace clusterlink::clusters
