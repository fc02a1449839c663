#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/runtime/server.hpp"

using blegw::runtime::Server;

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
    std::cerr << "Usage: ble-gateway <config.yaml> OR ble-gateway --config <config.yaml>" << std::endl;
    return 1;
  }

  blegw::factory::Application app;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = blegw::config::ConfigLoader::LoadFromYaml(config_path);

    blegw::observability::InitializeMetrics(config);
    blegw::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    app = blegw::factory::Build(config);

    // ------------------------------------------------------------
    // Start pipeline and ingest server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
    server.Start();
    BLEGW_LOG_INFO("BLE gateway started", {blegw::observability::StringField("bind_address", config.server().bind_address()),
                                           blegw::observability::IntField("port", server.port())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    BLEGW_LOG_INFO("Shutting down BLE gateway");

    server.Stop();
    app.Stop();
    blegw::observability::ShutdownLogging();
    blegw::observability::ShutdownMetrics();
  } catch (const std::exception& e) {
    BLEGW_LOG_ERROR("Fatal error", {blegw::observability::StringField("error", e.what())});
    app.Stop();
    blegw::observability::ShutdownLogging();
    blegw::observability::ShutdownMetrics();
    return 2;
  }

  return 0;
}
