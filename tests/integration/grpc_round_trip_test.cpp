#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/crypto/ed25519.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/gateway_server.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/gateway_service.hpp"

namespace {

using namespace edgesync::v1;

constexpr char kToken[] = "field-token";

struct Gateway {
  Gateway() {
    service = std::make_shared<edgesync::service::GatewayService>(
        std::shared_ptr<const edgesync::crypto::Ed25519Signer>(edgesync::crypto::Ed25519Signer::Generate()),
        edgesync::service::GatewayServiceOptions{kToken, true});
    server = std::make_unique<edgesync::runtime::Server>(
        "127.0.0.1:0", std::vector<std::shared_ptr<grpc::Service>>{std::make_shared<edgesync::grpc::GatewayServer>(service)});
    server->Start();

    key_path = std::filesystem::temp_directory_path() / ("edgesync_gateway_" + std::to_string(server->Port()) + ".pub");
    edgesync::crypto::SavePublicKey(service->PublicKey(), key_path.string());
  }

  ~Gateway() {
    server->Stop();
    std::error_code ec;
    std::filesystem::remove(key_path, ec);
  }

  edgesync::runtime::config::RuntimeConfig NodeConfig(const std::string& token) const {
    edgesync::runtime::config::RuntimeConfig config;
    config.mutable_node()->set_node_id("uav-grpc");
    config.mutable_node()->set_gateway_public_key_path(key_path.string());
    config.mutable_database()->mutable_memory();
    config.mutable_gateway()->set_address("127.0.0.1:" + std::to_string(server->Port()));
    config.mutable_gateway()->set_auth_token(token);
    config.mutable_sync()->set_self_check(true);
    edgesync::config::ConfigLoader::ApplyDefaults(config);
    return config;
  }

  std::shared_ptr<edgesync::service::GatewayService> service;
  std::unique_ptr<edgesync::runtime::Server>         server;
  std::filesystem::path                              key_path;
};

void TestNodeDrainsToGatewayAndReceivesTimeSync() {
  Gateway gateway;
  auto    node = edgesync::factory::BuildNode(gateway.NodeConfig(kToken));

  node->ingest_worker->Start();
  node->Publish(4, MESSAGE_TYPE_TELEMETRY, "battery 81%");
  node->Publish(0, MESSAGE_TYPE_EVIDENCE, std::string(64 * 1024, 'e'));
  node->Publish(1, MESSAGE_TYPE_DETECTION, "vehicle @ 34.1,-118.2");
  node->ingest_worker->Stop();
  assert(node->queue->TotalLen() == 3);

  auto now = edgesync::util::SteadyClock::now();
  node->engine->Tick(now);
  assert(node->connection->CanSend());
  assert(node->clock->LastDriftMs().has_value());

  node->engine->Tick(now + std::chrono::seconds(1));

  const auto stats = node->engine->Stats();
  assert(stats.acked == 3);
  assert(!stats.halted);
  assert(node->queue->TotalLen() == 0);
  assert(node->store->IterChained().empty());

  assert(gateway.service->AcceptedCount("uav-grpc") == 3);
  assert(gateway.service->LastStoredSequence("uav-grpc") == 3);

  // the TimeSync queued at authentication came back down, signature checked
  assert(stats.downlinks == 1);
  assert(node->downlink->Dispatched() == 1);
  assert(node->downlink->Rejected() == 0);
}

void TestBadTokenKeepsNodeOffline() {
  Gateway gateway;
  auto    node = edgesync::factory::BuildNode(gateway.NodeConfig("wrong"));

  node->engine->Tick(edgesync::util::SteadyClock::now());
  assert(!node->connection->CanSend());
  assert(node->connection->ConsecutiveAuthFailures() == 1);
}

} // namespace

int main() {
  TestNodeDrainsToGatewayAndReceivesTimeSync();
  TestBadTokenKeepsNodeOffline();

  std::cout << "edgesync_integration_grpc_round_trip: pass\n";
  return 0;
}
