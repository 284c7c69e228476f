#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/chunk/chunk_manager.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/stats_reporter.hpp"
#include "internal/proxy/cache_proxy.hpp"
#include "internal/runtime/server.hpp"

using mediacache::runtime::Server;

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
    std::cerr << "Usage: mediacache <config.yaml> OR mediacache --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = mediacache::config::ConfigLoader::LoadFromYaml(config_path);

    mediacache::observability::InitializeMetrics(config);
    mediacache::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = mediacache::factory::Build(config);

    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting anything to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.manager->Start();
    app.proxy->Start();
    if (app.reporter) app.reporter->Start();
    server.Start();

    MEDIACACHE_LOG_INFO("Mediacache started", {mediacache::observability::StringField("admin_address", config.server().bind_address()),
                                               mediacache::observability::IntField("proxy_port", app.proxy->Port()),
                                               mediacache::observability::StringField("cache_dir", config.cache().directory())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    MEDIACACHE_LOG_INFO("Shutting down mediacache");

    server.Stop();
    app.proxy->Stop();
    app.manager->Stop();
    if (app.reporter) app.reporter->Stop();

    mediacache::observability::ShutdownLogging();
    mediacache::observability::ShutdownMetrics();
  } catch (const std::exception& e) {
    MEDIACACHE_LOG_ERROR("Fatal error", {mediacache::observability::StringField("error", e.what())});
    mediacache::observability::ShutdownLogging();
    mediacache::observability::ShutdownMetrics();
    return 2;
  }

  return 0;
}
