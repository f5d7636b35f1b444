#include "internal/service/admin_service.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/clusters/cluster_ledger.hpp"
#include "internal/health/liveness.hpp"
#include "internal/health/watcher_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace clusterlink;
using namespace clusterlink::admin::v1;
using namespace std::chrono_literals;

struct Fixture {
  util::MonotonicTimePoint                   now      = util::MonotonicTimePoint(std::chrono::hours(1));
  std::shared_ptr<health::WatcherRegistry>   registry = std::make_shared<health::WatcherRegistry>([this] { return now; });
  std::shared_ptr<health::LivenessEvaluator> liveness = std::make_shared<health::LivenessEvaluator>(*registry);
  std::shared_ptr<clusters::ClusterLedger>   ledger   = std::make_shared<clusters::ClusterLedger>();

  service::AdminService Service() {
    service::ServiceContext ctx;
    ctx.liveness = liveness;
    ctx.ledger   = ledger;
    return service::AdminService(ctx);
  }
};

void TestCheckLivenessHealthy() {
  Fixture f;
  f.registry->Register("heartbeat_watcher");
  auto service = f.Service();

  const auto resp = service.CheckLiveness(CheckLivenessRequest{});
  assert(resp.healthy());
  assert(resp.http_status() == 200);
  assert(resp.body() == R"({"status":"OK"})");
  assert(resp.unhealthy_watchers_size() == 0);
}

void TestCheckLivenessListsStaleWatchers() {
  Fixture f;
  f.registry->Register("heartbeat_watcher");
  f.now += 6min;
  auto service = f.Service();

  const auto resp = service.CheckLiveness(CheckLivenessRequest{});
  assert(!resp.healthy());
  assert(resp.http_status() == 500);
  assert(resp.body() == R"({"detail":"One or more watchers are unhealthy"})");
  assert(resp.unhealthy_watchers_size() == 1);
  assert(resp.unhealthy_watchers(0) == "heartbeat_watcher");
}

void TestGetClusterStatus() {
  Fixture f;
  f.ledger->RegisterCluster("cluster-a", "Acme");
  auto service = f.Service();

  GetClusterStatusRequest req;
  req.set_cluster_id("cluster-a");
  auto resp = service.GetClusterStatus(req);
  assert(resp.status() == "verifying");
  assert(!resp.has_last_heartbeat_at());

  v1::HeartbeatMessage heartbeat;
  heartbeat.set_message_type("heartbeat");
  heartbeat.set_cluster_name("gpu-east");
  heartbeat.set_organization_name("Acme");
  *heartbeat.mutable_last_heartbeat_at() = util::ToProto(util::Now());
  f.ledger->ApplyHeartbeat("cluster-a", heartbeat);

  resp = service.GetClusterStatus(req);
  assert(resp.status() == "healthy");
  assert(resp.name() == "gpu-east");
  assert(resp.organization_name() == "Acme");
  assert(resp.has_last_heartbeat_at());
}

void TestGetClusterStatusErrors() {
  Fixture f;
  auto    service = f.Service();

  bool invalid = false;
  try {
    service.GetClusterStatus(GetClusterStatusRequest{});
  } catch (const util::InvalidMessage&) {
    invalid = true;
  }
  assert(invalid);

  GetClusterStatusRequest req;
  req.set_cluster_id("ghost");
  bool not_found = false;
  try {
    service.GetClusterStatus(req);
  } catch (const util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

} // namespace

int main() {
  TestCheckLivenessHealthy();
  TestCheckLivenessListsStaleWatchers();
  TestGetClusterStatus();
  TestGetClusterStatusErrors();

  std::cout << "clusterlink_unit_admin_service: pass\n";
  return 0;
}
