#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/report/report_scheduler.hpp"
#include "internal/report/run_coordinator.hpp"
#include "internal/runtime/server.hpp"

using signoff::runtime::Server;

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
    std::cerr << "Usage: signoff-reporter <config.yaml> OR signoff-reporter --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = signoff::config::ConfigLoader::LoadFromYaml(config_path);

    signoff::observability::InitializeTracing(config);
    signoff::observability::InitializeMetrics(config);
    signoff::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = signoff::factory::Build(config);

    if (config.reports().run_on_startup()) {
      try {
        app.coordinator->Run();
      } catch (const std::exception& e) {
        // Recorded as a FAILED run; the service still starts.
        SIGNOFF_LOG_WARN("Startup report run failed", {signoff::observability::StringField("error", e.what())});
      }
    }

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    if (app.scheduler) app.scheduler->Start();
    SIGNOFF_LOG_INFO("signoff-reporter started", {signoff::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SIGNOFF_LOG_INFO("Shutting down signoff-reporter");

    if (app.scheduler) app.scheduler->Stop();
    server.Stop();
    signoff::observability::ShutdownLogging();
    signoff::observability::ShutdownMetrics();
    signoff::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    SIGNOFF_LOG_ERROR("Fatal error", {signoff::observability::StringField("error", e.what())});
    signoff::observability::ShutdownLogging();
    signoff::observability::ShutdownMetrics();
    signoff::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
