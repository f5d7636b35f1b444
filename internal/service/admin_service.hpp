#pragma once

#include "clusterlink/admin/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace clusterlink::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  clusterlink::admin::v1::CheckLivenessResponse CheckLiveness(const clusterlink::admin::v1::CheckLivenessRequest& req);

  clusterlink::admin::v1::GetClusterStatusResponse GetClusterStatus(const clusterlink::admin::v1::GetClusterStatusRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace clusterlink::service
