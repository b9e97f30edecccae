#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

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
    std::cerr << "Usage: edge-sync-node <config.yaml> OR edge-sync-node --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = edgesync::config::ConfigLoader::LoadFromYaml(config_path);

    edgesync::observability::InitializeLogging(config);
    edgesync::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build node (dependency graph)
    // ------------------------------------------------------------
    auto node = edgesync::factory::BuildNode(config);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    node->Start();
    EDGESYNC_LOG_INFO("edge sync node started", {edgesync::observability::StringField("node_id", config.node().node_id()),
                                                 edgesync::observability::StringField("gateway", config.gateway().address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    EDGESYNC_LOG_INFO("Shutting down edge sync node");
    node->Stop();

    const auto stats = node->engine->Stats();
    EDGESYNC_LOG_INFO("final sync stats", {edgesync::observability::UintField("sent", stats.sent),
                                           edgesync::observability::UintField("acked", stats.acked),
                                           edgesync::observability::UintField("queued", node->queue->TotalLen()),
                                           edgesync::observability::BoolField("halted", stats.halted)});

    edgesync::observability::ShutdownMetrics();
    edgesync::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    EDGESYNC_LOG_ERROR("Fatal error", {edgesync::observability::StringField("error", e.what())});
    edgesync::observability::ShutdownMetrics();
    edgesync::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
