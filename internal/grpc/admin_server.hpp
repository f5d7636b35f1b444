#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "clusterlink/admin/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace clusterlink::grpc {

class AdminServer final : public clusterlink::admin::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<clusterlink::service::AdminService> svc);

  ::grpc::Status CheckLiveness(::grpc::ServerContext*,
                               const clusterlink::admin::v1::CheckLivenessRequest*,
                               clusterlink::admin::v1::CheckLivenessResponse*) override;

  ::grpc::Status GetClusterStatus(::grpc::ServerContext*,
                                  const clusterlink::admin::v1::GetClusterStatusRequest*,
                                  clusterlink::admin::v1::GetClusterStatusResponse*) override;

 private:
  std::shared_ptr<clusterlink::service::AdminService> service_;
};

} // namespace clusterlink::grpc
