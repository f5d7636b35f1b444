#include "connection_provider.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace clusterlink::messaging {

using observability::StringField;

ConnectionProvider::ConnectionProvider(std::shared_ptr<broker::ConnectionFactory> factory, broker::BrokerEndpoint endpoint)
    : factory_(std::move(factory)), endpoint_(std::move(endpoint)) {
}

ConnectionProvider::~ConnectionProvider() {
  Reset();
}

std::shared_ptr<broker::Connection> ConnectionProvider::Get() {
  std::lock_guard lock(mutex_);
  if (connection_ && connection_->IsOpen()) return connection_;

  ResetLocked();
  try {
    connection_ = factory_->Connect(endpoint_);
  } catch (const broker::BrokerError& e) {
    throw util::ConnectionError("cannot reach broker at " + endpoint_.host + ":" + std::to_string(endpoint_.port) + ": " + e.what());
  }
  return connection_;
}

void ConnectionProvider::Reset() {
  std::lock_guard lock(mutex_);
  ResetLocked();
}

void ConnectionProvider::ResetLocked() {
  if (!connection_) return;
  try {
    connection_->Close();
  } catch (const std::exception& e) {
    CLUSTERLINK_LOG_WARN("Failed to close broker connection", {StringField("vhost", endpoint_.vhost), StringField("error", e.what())});
  }
  connection_.reset();
}

} // namespace clusterlink::messaging
