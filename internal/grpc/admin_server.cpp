#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace clusterlink::grpc {

using namespace clusterlink::admin::v1;

AdminServer::AdminServer(std::shared_ptr<clusterlink::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::CheckLiveness(::grpc::ServerContext*, const CheckLivenessRequest* req, CheckLivenessResponse* resp) {
  try {
    *resp = service_->CheckLiveness(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetClusterStatus(::grpc::ServerContext*, const GetClusterStatusRequest* req, GetClusterStatusResponse* resp) {
  try {
    *resp = service_->GetClusterStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace clusterlink::grpc
