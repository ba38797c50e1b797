#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using orchestra::factory::Build;
using orchestra::runtime::Server;

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
    std::cerr << "Usage: orchestra-server <config.yaml> OR orchestra-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = orchestra::config::ConfigLoader::LoadFromYaml(config_path);

    orchestra::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    try {
      // ------------------------------------------------------------
      // Start server
      // ------------------------------------------------------------
      Server server(config.server().bind_address(), std::move(app.grpc_services));

      // Register signal handlers before starting server to avoid race window.
      std::signal(SIGINT, HandleSignal);
      std::signal(SIGTERM, HandleSignal);

      server.Start();
      ORCHESTRA_LOG_INFO("Orchestra started", {orchestra::observability::StringField("bind_address", config.server().bind_address())});

      while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

      ORCHESTRA_LOG_INFO("Shutting down orchestra");

      server.Stop();
    } catch (...) {
      app.Stop();
      throw;
    }

    app.Stop();
    orchestra::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    ORCHESTRA_LOG_ERROR("Fatal error", {orchestra::observability::StringField("error", e.what())});
    orchestra::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
