#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "internal/broker/api/broker.hpp"

namespace clusterlink::messaging {

/*
  Lazily opened broker connection shared by the publishers of one
  component. A closed or reset connection is reopened on the next Get().
*/
class ConnectionProvider {
 public:
  ConnectionProvider(std::shared_ptr<broker::ConnectionFactory> factory, broker::BrokerEndpoint endpoint);
  ~ConnectionProvider();

  ConnectionProvider(const ConnectionProvider&)            = delete;
  ConnectionProvider& operator=(const ConnectionProvider&) = delete;

  // Throws util::ConnectionError when the broker cannot be reached.
  std::shared_ptr<broker::Connection> Get();

  // Closes the current connection, if any.
  void Reset();

  const broker::BrokerEndpoint& Endpoint() const {
    return endpoint_;
  }

 private:
  void ResetLocked();

  std::shared_ptr<broker::ConnectionFactory> factory_;
  const broker::BrokerEndpoint               endpoint_;

  std::mutex                          mutex_;
  std::shared_ptr<broker::Connection> connection_;
};

} // namespace clusterlink::messaging
