#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using payday::factory::Build;
using payday::runtime::Server;

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
    std::cerr << "Usage: paydayd <config.yaml> OR paydayd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = payday::config::ConfigLoader::LoadFromYaml(config_path);

    payday::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // Resolve payments left in flight before accepting new work.
    payday::factory::StartBackground(app);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services),
                  std::chrono::milliseconds(config.server().shutdown_grace_ms()));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    PAYDAY_LOG_INFO("paydayd started", {payday::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    PAYDAY_LOG_INFO("Shutting down paydayd");

    server.Stop();
    payday::factory::StopBackground(app);
    payday::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    PAYDAY_LOG_ERROR("Fatal error", {payday::observability::StringField("error", e.what())});
    payday::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
