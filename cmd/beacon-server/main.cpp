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

using beacon::runtime::Server;

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
    std::cerr << "Usage: beacon-server <config.yaml> OR beacon-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = beacon::config::ConfigLoader::LoadFromYaml(config_path);

    beacon::observability::InitializeLogging(config);
    beacon::observability::InitializeMetrics(config);

    auto app = beacon::factory::Build(config);

    std::string bind_address = config.server().bind_address();
    if (bind_address.empty()) bind_address = "0.0.0.0:50051";

    Server server(bind_address, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();

    const bool worker_enabled = !config.worker().has_enabled() || config.worker().enabled();
    if (worker_enabled) app.worker->Start();

    BEACON_LOG_INFO("Beacon started", {beacon::observability::StringField("bind_address", bind_address),
                                       beacon::observability::BoolField("worker_enabled", worker_enabled)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    BEACON_LOG_INFO("Shutting down beacon");

    app.worker->Stop();
    server.Stop();
    beacon::observability::ShutdownMetrics();
    beacon::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    BEACON_LOG_ERROR("Fatal error", {beacon::observability::StringField("error", e.what())});
    beacon::observability::ShutdownMetrics();
    beacon::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
