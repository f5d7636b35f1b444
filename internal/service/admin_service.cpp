#include "admin_service.hpp"

#include <stdexcept>

#include "internal/clusters/cluster_ledger.hpp"
#include "internal/health/health_endpoint.hpp"
#include "internal/health/liveness.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace clusterlink::service {

using namespace clusterlink::admin::v1;
using observability::StringField;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.liveness || !ctx_.ledger) {
    throw std::invalid_argument("AdminService requires liveness and ledger");
  }
}

CheckLivenessResponse AdminService::CheckLiveness(const CheckLivenessRequest&) {
  const auto health = health::CheckLiveness(*ctx_.liveness);

  CheckLivenessResponse resp;
  resp.set_healthy(health.http_status == 200);
  resp.set_http_status(health.http_status);
  resp.set_body(health.body);
  if (!resp.healthy()) {
    for (const auto& name : ctx_.liveness->UnhealthyWatchers()) {
      resp.add_unhealthy_watchers(name);
    }
  }
  return resp;
}

GetClusterStatusResponse AdminService::GetClusterStatus(const GetClusterStatusRequest& req) {
  if (req.cluster_id().empty()) {
    throw util::InvalidMessage("cluster_id is required");
  }

  try {
    const auto record = ctx_.ledger->Get(req.cluster_id());
    const auto counts = clusters::CountNodes(record);
    const auto status = clusters::ClusterLedger::DeriveStatus(record.last_heartbeat_at, util::Now());

    GetClusterStatusResponse resp;
    resp.set_cluster_id(record.id);
    resp.set_name(record.name);
    resp.set_organization_name(record.organization_name);
    resp.set_status(clusters::ToString(status));
    if (record.last_heartbeat_at) {
      *resp.mutable_last_heartbeat_at() = util::ToProto(*record.last_heartbeat_at);
    }
    resp.set_total_node_count(counts.total);
    resp.set_available_node_count(counts.available);
    resp.set_total_gpu_count(counts.gpus);
    return resp;
  } catch (const std::exception& ex) {
    CLUSTERLINK_LOG_ERROR("RPC failed", {StringField("route", "AdminService.GetClusterStatus"), StringField("error", ex.what())});
    throw;
  }
}

} // namespace clusterlink::service
