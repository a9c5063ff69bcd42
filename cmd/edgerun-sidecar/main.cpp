#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/dispatch/dispatcher.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/overlay/overlay_network.hpp"
#include "internal/runtime/server.hpp"

using edgerun::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 1) {
    // defaults + environment only
  } else if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: edgerun-sidecar [config.yaml] OR edgerun-sidecar --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = edgerun::config::ConfigLoader::Load(config_path);

    edgerun::observability::InitializeLogging(config);
    edgerun::observability::InitializeTracing(config);
    edgerun::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app        = edgerun::factory::Build(config);
    auto dispatcher = app.dispatcher;

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    EDGERUN_LOG_INFO("Sidecar started", {edgerun::observability::StringField("bind_address", config.server().bind_address()),
                                         edgerun::observability::BoolField("overlay_ready", app.overlay->IsReady())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    EDGERUN_LOG_INFO("Shutting down sidecar");

    server.Stop();
    dispatcher->Shutdown();
    edgerun::observability::ShutdownTracing();
    edgerun::observability::ShutdownMetrics();
    edgerun::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    EDGERUN_LOG_ERROR("Fatal error", {edgerun::observability::StringField("error", e.what())});
    edgerun::observability::ShutdownTracing();
    edgerun::observability::ShutdownMetrics();
    edgerun::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
