#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace clusterlink::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace clusterlink::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidMessage*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const TopologyError*>(&e) || dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const PublisherIdentityMismatch*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const ConnectionError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  // DuplicateWatcher, WatcherNotRegistered and anything unexpected
  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace clusterlink::grpc
