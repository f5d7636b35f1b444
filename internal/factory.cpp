#include "factory.hpp"

#include <set>
#include <stdexcept>
#include <string>

#include "internal/clusters/quota_allocation.hpp"
#include "internal/messaging/processing.hpp"
#include "internal/messaging/topology.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if CLUSTERLINK_BROKER_AMQP
#include "internal/broker/amqp/amqp_broker.hpp"
#endif

namespace clusterlink::factory {

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::chrono::milliseconds kDefaultHeartbeatInterval = std::chrono::seconds(30);
constexpr std::chrono::milliseconds kDefaultRestartDelay      = std::chrono::seconds(5);

std::shared_ptr<broker::memory::MemoryBroker> BuildMemoryBroker(const clusterlink::runtime::config::BrokerConfig& config,
                                                                const broker::BrokerEndpoint& endpoint) {
  auto broker = broker::memory::MemoryBroker::Create();

  std::set<std::string> vhosts(config.memory().vhosts().begin(), config.memory().vhosts().end());
  vhosts.insert(endpoint.vhost);
  for (const auto& vhost : vhosts) {
    broker->AddVirtualHost(vhost);
  }

  for (const auto& user : config.memory().users()) {
    broker->AddUser(user.username(), user.password());
  }
  if (!endpoint.credentials.username.empty()) {
    broker->AddUser(endpoint.credentials.username, endpoint.credentials.password);
  }

  return broker;
}

// Feedback messages from clusters that are not registered cannot be
// attributed to anyone; they are dead-lettered rather than retried.
template <typename Fn>
void AttributeToCluster(const std::string& sender, Fn&& apply) {
  try {
    apply();
  } catch (const util::NotFound& e) {
    throw util::InvalidMessage("message from unregistered cluster '" + sender + "': " + e.what());
  }
}

/*
  A node inventory change is answered with a fresh quota allocation on
  the cluster's own queue (named after its id). The ledger only takes the
  new inventory once that allocation is published, so a redelivered
  snapshot still counts as a change.
*/
void HandleClusterNodes(clusters::ClusterLedger& ledger,
                        const std::string& sender,
                        const v1::ClusterNodesMessage& message,
                        messaging::MessageSender& outbox) {
  auto result = clusters::NodeSnapshotResult::kOutdated;
  AttributeToCluster(sender, [&] { result = ledger.CompareClusterNodes(sender, message); });

  if (result == clusters::NodeSnapshotResult::kOutdated) return;
  if (result == clusters::NodeSnapshotResult::kUnchanged) {
    ledger.ApplyClusterNodes(sender, message);
    return;
  }

  auto record = ledger.Get(sender);
  record.nodes.assign(message.cluster_nodes().begin(), message.cluster_nodes().end());
  outbox.Enqueue(sender, clusters::BuildQuotasAllocation(record));
  outbox.OnFlushed([&ledger, sender, message] {
    ledger.ApplyClusterNodes(sender, message);
    CLUSTERLINK_LOG_INFO("Quota allocation sent after node change", {StringField("cluster_id", sender)});
  });
}

std::shared_ptr<messaging::MessageDispatcher> BuildDispatcher(const std::shared_ptr<clusters::ClusterLedger>& ledger) {
  auto dispatcher = std::make_shared<messaging::MessageDispatcher>();

  dispatcher->OnHeartbeat([ledger](const std::string& sender, const v1::HeartbeatMessage& message, messaging::MessageSender&) {
    AttributeToCluster(sender, [&] { ledger->ApplyHeartbeat(sender, message); });
  });
  dispatcher->OnClusterNodes([ledger](const std::string& sender, const v1::ClusterNodesMessage& message, messaging::MessageSender& outbox) {
    HandleClusterNodes(*ledger, sender, message, outbox);
  });
  dispatcher->OnClusterModels([ledger](const std::string& sender, const v1::AIMClusterModelsMessage& message, messaging::MessageSender&) {
    AttributeToCluster(sender, [&] { ledger->Get(sender); });
    CLUSTERLINK_LOG_INFO("Cluster models reported", {StringField("cluster_id", sender), IntField("models", message.models_size())});
  });

  return dispatcher;
}

void EnsureQueueTopology(broker::ConnectionFactory& factory, const broker::BrokerEndpoint& endpoint, const std::string& queue) {
  std::shared_ptr<broker::Connection> connection;
  try {
    connection = factory.Connect(endpoint);
  } catch (const broker::BrokerError& e) {
    throw util::ConnectionError(std::string("cannot declare topology: ") + e.what());
  }

  try {
    auto channel = connection->OpenChannel();
    messaging::EnsureTopology(*channel, queue);
    channel->Close();
  } catch (...) {
    connection->Close();
    throw;
  }
  connection->Close();
}

#if CLUSTERLINK_BROKER_AMQP
broker::amqp::AmqpOptions AmqpOptionsFromConfig(const clusterlink::runtime::config::AmqpBrokerConfig& config) {
  broker::amqp::AmqpOptions options;
  options.connect_timeout   = util::FromProto(config.connect_timeout(), options.connect_timeout);
  options.rpc_timeout       = util::FromProto(config.rpc_timeout(), options.rpc_timeout);
  options.heartbeat_seconds = static_cast<int>(config.heartbeat_seconds());
  return options;
}
#endif

void BuildBroker(const clusterlink::runtime::config::BrokerConfig& config, Application& app) {
  if (config.has_amqp()) {
#if CLUSTERLINK_BROKER_AMQP
    app.broker = std::make_shared<broker::amqp::AmqpConnectionFactory>(AmqpOptionsFromConfig(config.amqp()));
    CLUSTERLINK_LOG_INFO("Using AMQP broker", {StringField("host", app.endpoint.host), IntField("port", app.endpoint.port)});
    return;
#else
    throw std::runtime_error("amqp broker requested but not enabled at build time");
#endif
  }

  app.memory_broker = BuildMemoryBroker(config, app.endpoint);
  app.broker        = app.memory_broker;
}

} // namespace

broker::BrokerEndpoint EndpointFromConfig(const clusterlink::runtime::config::BrokerConfig& config) {
  broker::BrokerEndpoint endpoint;
  if (!config.host().empty()) endpoint.host = config.host();
  if (config.port() != 0) endpoint.port = static_cast<std::uint16_t>(config.port());
  if (!config.vhost().empty()) endpoint.vhost = config.vhost();
  endpoint.credentials.username = config.username();
  endpoint.credentials.password = config.password();
  return endpoint;
}

/*
    Build full application dependency graph
*/
Application Build(const clusterlink::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Broker
  // ------------------------------------------------------------------
  app.endpoint = EndpointFromConfig(config.broker());
  BuildBroker(config.broker(), app);

  // ------------------------------------------------------------------
  // Health
  // ------------------------------------------------------------------
  app.registry = std::make_shared<health::WatcherRegistry>();
  app.liveness = std::make_shared<health::LivenessEvaluator>(
      *app.registry, util::FromProto(config.health().staleness_threshold(), health::kDefaultStalenessThreshold));

  // ------------------------------------------------------------------
  // Feedback consumer
  // ------------------------------------------------------------------
  app.ledger     = std::make_shared<clusters::ClusterLedger>();
  app.dispatcher = BuildDispatcher(app.ledger);

  const auto& feedback = config.feedback_consumer();
  for (const auto& cluster : feedback.clusters()) {
    app.ledger->RegisterCluster(cluster.id(), cluster.organization_name());
  }

  if (feedback.enabled()) {
    const auto queue = feedback.queue().empty() ? std::string(heartbeat::kDefaultFeedbackQueue) : feedback.queue();

    // replies are published as the service's own broker user
    app.outbound = std::make_shared<messaging::ConnectionProvider>(app.broker, app.endpoint);

    auto dispatcher       = app.dispatcher;
    auto outbound         = app.outbound;
    auto identity         = app.endpoint.credentials.username;
    app.feedback_consumer = std::make_unique<messaging::ConsumerWorker>(
        app.broker,
        app.endpoint,
        queue,
        [dispatcher, outbound, identity](broker::IncomingMessage& message) {
          messaging::ProcessMessage(message, *outbound, identity, [&](const broker::IncomingMessage& m, messaging::MessageSender& outbox) {
            dispatcher->Dispatch(m, outbox);
          });
        },
        util::FromProto(feedback.restart_delay(), kDefaultRestartDelay));
  }

  // ------------------------------------------------------------------
  // Heartbeat
  // ------------------------------------------------------------------
  if (config.heartbeat().enabled()) {
    heartbeat::HeartbeatSettings settings;
    if (!config.heartbeat().queue().empty()) settings.queue = config.heartbeat().queue();
    settings.organization_name = config.agent().organization_name();
    settings.cluster_name      = config.agent().cluster_name();
    settings.interval          = util::FromProto(config.heartbeat().interval(), kDefaultHeartbeatInterval);
    settings.retry_delay       = util::FromProto(config.heartbeat().retry_delay(), health::kDefaultRetryDelay);

    app.heartbeat = std::make_unique<heartbeat::HeartbeatService>(app.broker, app.endpoint, std::move(settings), *app.registry);
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.liveness = app.liveness;
  ctx.ledger   = app.ledger;

  app.admin_service = std::make_shared<service::AdminService>(ctx);

  return app;
}

void Application::Start() {
  std::set<std::string> queues;
  if (heartbeat) queues.insert(heartbeat->Settings().queue);
  if (feedback_consumer) {
    queues.insert(feedback_consumer->QueueName());
    for (const auto& cluster_id : ledger->ClusterIds()) queues.insert(cluster_id);
  }

  for (const auto& queue : queues) {
    EnsureQueueTopology(*broker, endpoint, queue);
  }

  if (feedback_consumer) feedback_consumer->Start();
  if (heartbeat) heartbeat->Start();

  CLUSTERLINK_LOG_INFO("Application started",
                       {observability::BoolField("heartbeat", heartbeat != nullptr),
                        observability::BoolField("feedback_consumer", feedback_consumer != nullptr)});
}

void Application::Stop() {
  if (heartbeat) heartbeat->Stop();
  if (feedback_consumer) feedback_consumer->Stop();
  if (outbound) outbound->Reset();
}

} // namespace clusterlink::factory
