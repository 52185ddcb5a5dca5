#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/storage/common/arrow_utils.hpp"

using sealer::factory::Build;
using sealer::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

void ShutdownObservability() {
  sealer::observability::ShutdownLogging();
  sealer::observability::ShutdownMetrics();
  sealer::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: export-sealer <config.yaml> OR export-sealer --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = sealer::config::ConfigLoader::LoadFromYaml(config_path);
    sealer::config::ConfigLoader::Validate(config);

    sealer::observability::InitializeTracing(config);
    sealer::observability::InitializeMetrics(config);
    sealer::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    SEALER_LOG_INFO("export sealer started", {sealer::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SEALER_LOG_INFO("shutting down export sealer");

    server.Stop();
    sealer::storage::common::FinalizeFileSystems();
    ShutdownObservability();
  } catch (const std::exception& e) {
    SEALER_LOG_ERROR("fatal error", {sealer::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
