#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace clusterlink::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace clusterlink::grpc
