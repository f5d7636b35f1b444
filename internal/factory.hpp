#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/broker/api/broker.hpp"
#include "internal/broker/memory/memory_broker.hpp"
#include "internal/clusters/cluster_ledger.hpp"
#include "internal/health/liveness.hpp"
#include "internal/health/watcher_registry.hpp"
#include "internal/heartbeat/heartbeat_service.hpp"
#include "internal/messaging/connection_provider.hpp"
#include "internal/messaging/consumer_worker.hpp"
#include "internal/messaging/dispatcher.hpp"
#include "internal/service/admin_service.hpp"

namespace clusterlink::factory {

/*
  Application

  Owns all long-lived components of the process. Everything here lives
  for the lifetime of the process; Stop() is safe to call more than once.
*/
struct Application {
  std::shared_ptr<broker::ConnectionFactory> broker;
  // Set when the in-process backend is selected.
  std::shared_ptr<broker::memory::MemoryBroker> memory_broker;
  broker::BrokerEndpoint                        endpoint;

  std::shared_ptr<health::WatcherRegistry>   registry;
  std::shared_ptr<health::LivenessEvaluator> liveness;
  std::shared_ptr<clusters::ClusterLedger>   ledger;

  std::shared_ptr<messaging::MessageDispatcher>  dispatcher;
  std::shared_ptr<messaging::ConnectionProvider> outbound;
  std::unique_ptr<messaging::ConsumerWorker>     feedback_consumer;
  std::unique_ptr<heartbeat::HeartbeatService>  heartbeat;

  std::shared_ptr<service::AdminService> admin_service;

  // Declares queue topology (feedback queue and one queue per registered
  // cluster), then starts the consumer and heartbeat.
  // Throws util::TopologyError when the broker disagrees with our topology.
  void Start();
  void Stop();
};

broker::BrokerEndpoint EndpointFromConfig(const clusterlink::runtime::config::BrokerConfig& config);

/*
  Build

  Composition root. The only place that knows the concrete broker type.
  broker.amqp selects RabbitMQ and throws std::runtime_error when the
  build has no AMQP support; anything else uses the in-process broker.
*/
Application Build(const clusterlink::runtime::config::RuntimeConfig& config);

} // namespace clusterlink::factory
