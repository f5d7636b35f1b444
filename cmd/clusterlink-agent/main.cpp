#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using clusterlink::factory::Build;
using clusterlink::runtime::Server;

static constexpr const char* kDefaultBindAddress = "0.0.0.0:50051";

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: clusterlink-agent <config.yaml> OR clusterlink-agent --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = clusterlink::config::ConfigLoader::LoadFromYaml(config_path);

    clusterlink::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<clusterlink::grpc::AdminServer>(app.admin_service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const std::string bind_address = config.server().bind_address().empty() ? kDefaultBindAddress : config.server().bind_address();
    Server            server(bind_address, std::move(services));

    // Register signal handlers before starting to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
    server.Start();
    CLUSTERLINK_LOG_INFO("ClusterLink agent started", {clusterlink::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CLUSTERLINK_LOG_INFO("Shutting down clusterlink agent");

    server.Stop();
    app.Stop();
    clusterlink::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    CLUSTERLINK_LOG_ERROR("Fatal error", {clusterlink::observability::StringField("error", e.what())});
    clusterlink::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
