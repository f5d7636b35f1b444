#pragma once

#include <memory>

namespace clusterlink::health {
class LivenessEvaluator;
}
namespace clusterlink::clusters {
class ClusterLedger;
}

namespace clusterlink::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<clusterlink::health::LivenessEvaluator> liveness;
  std::shared_ptr<clusterlink::clusters::ClusterLedger>   ledger;
};

} // namespace clusterlink::service
