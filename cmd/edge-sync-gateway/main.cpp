#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/crypto/ed25519.hpp"
#include "internal/grpc/gateway_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/gateway_service.hpp"

using edgesync::runtime::Server;

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
    std::cerr << "Usage: edge-sync-gateway <config.yaml> OR edge-sync-gateway --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = edgesync::config::ConfigLoader::LoadFromYaml(config_path);
    edgesync::observability::InitializeLogging(config);

    if (config.server().bind_address().empty()) {
      throw std::runtime_error("server.bind_address is required");
    }

    std::shared_ptr<const edgesync::crypto::Ed25519Signer> key;
    if (config.server().private_key_path().empty()) {
      EDGESYNC_LOG_WARN("server.private_key_path not set, downlink records signed with an ephemeral key");
      key = edgesync::crypto::Ed25519Signer::Generate();
    } else {
      key = edgesync::crypto::Ed25519Signer::LoadOrCreatePem(config.server().private_key_path());
    }

    edgesync::service::GatewayServiceOptions options;
    options.auth_token = config.gateway().auth_token();

    auto service = std::make_shared<edgesync::service::GatewayService>(key, options);

    std::vector<std::shared_ptr<grpc::Service>> services;
    services.push_back(std::make_shared<edgesync::grpc::GatewayServer>(service));

    Server server(config.server().bind_address(), std::move(services), edgesync::runtime::ServerOptions::FromConfig(config.server()));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    EDGESYNC_LOG_INFO("Shutting down gateway");
    server.Stop();
    edgesync::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    EDGESYNC_LOG_ERROR("Fatal error", {edgesync::observability::StringField("error", e.what())});
    edgesync::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
