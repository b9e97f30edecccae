#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/service/gateway_service.hpp"
#include "tests/support/loopback_transport.hpp"

namespace {

using edgesync::testing::LoopbackTransport;
using namespace edgesync::v1;

// Delivers to the gateway but reports the first ack as lost.
class LostAckTransport final : public edgesync::transport::GatewayTransport {
 public:
  explicit LostAckTransport(std::shared_ptr<LoopbackTransport> inner) : inner_(std::move(inner)) {
  }

  void Connect(std::chrono::milliseconds timeout) override {
    inner_->Connect(timeout);
  }
  edgesync::transport::AuthResult Authenticate(const edgesync::transport::AuthRequest& request, std::chrono::milliseconds timeout) override {
    return inner_->Authenticate(request, timeout);
  }
  edgesync::transport::SendResult Send(const std::string& session_id, const edgesync::model::SyncRecord& record,
                                       std::chrono::milliseconds timeout) override {
    auto result = inner_->Send(session_id, record, timeout);
    if (!lost_) {
      lost_ = true;
      edgesync::transport::SendResult timeout_result;
      timeout_result.status = edgesync::transport::SendStatus::kTimeout;
      return timeout_result;
    }
    return result;
  }
  std::vector<std::string> FetchDownlink(const std::string& session_id, std::uint32_t max_records,
                                         std::chrono::milliseconds timeout) override {
    return inner_->FetchDownlink(session_id, max_records, timeout);
  }
  void Close() override {
    inner_->Close();
  }

 private:
  std::shared_ptr<LoopbackTransport> inner_;
  bool                               lost_ = false;
};

edgesync::runtime::config::RuntimeConfig NodeConfig() {
  edgesync::runtime::config::RuntimeConfig config;
  config.mutable_node()->set_node_id("uav-loop");
  config.mutable_database()->mutable_memory();
  edgesync::config::ConfigLoader::ApplyDefaults(config);
  return config;
}

std::shared_ptr<edgesync::service::GatewayService> MakeGateway() {
  return std::make_shared<edgesync::service::GatewayService>(
      std::shared_ptr<const edgesync::crypto::Ed25519Signer>(edgesync::crypto::Ed25519Signer::Generate()),
      edgesync::service::GatewayServiceOptions{});
}

void PublishAll(edgesync::factory::EdgeNode& node, int n) {
  node.ingest_worker->Start();
  for (int i = 0; i < n; ++i) {
    node.Publish(static_cast<std::uint8_t>(i % 6), MESSAGE_TYPE_TELEMETRY, "sample " + std::to_string(i));
  }
  node.ingest_worker->Stop();
}

void TestLostAckResolvesAsDuplicate() {
  auto gateway = MakeGateway();
  auto node    = edgesync::factory::BuildNode(NodeConfig(), std::make_shared<LostAckTransport>(std::make_shared<LoopbackTransport>(gateway)));
  PublishAll(*node, 3);

  auto now = edgesync::util::SteadyClock::now();
  node->engine->Tick(now);
  node->engine->Tick(now += std::chrono::seconds(1));
  assert(node->queue->TotalLen() == 3);
  assert(gateway->AcceptedCount("uav-loop") == 1);

  node->engine->Tick(now += std::chrono::seconds(1));
  const auto stats = node->engine->Stats();
  assert(stats.duplicates == 1);
  assert(stats.acked == 2);
  assert(node->queue->TotalLen() == 0);
  assert(gateway->AcceptedCount("uav-loop") == 3);
}

void TestForgedRecordHaltsNode() {
  auto gateway = MakeGateway();
  auto node    = edgesync::factory::BuildNode(NodeConfig(), std::make_shared<LoopbackTransport>(gateway));
  PublishAll(*node, 2);

  // swap the queued head for a copy with a broken signature
  auto head = *node->queue->Peek(0);
  node->queue->Remove(head.id);
  head.signature[10] ^= 0x40;
  node->queue->Enqueue(head);

  auto now = edgesync::util::SteadyClock::now();
  node->engine->Tick(now);
  node->engine->Tick(now + std::chrono::seconds(1));

  assert(node->engine->Halted());
  assert(gateway->AcceptedCount("uav-loop") == 0);
  assert(node->store->Get(head.id).has_value());
}

} // namespace

int main() {
  TestLostAckResolvesAsDuplicate();
  TestForgedRecordHaltsNode();

  std::cout << "edgesync_integration_loopback_sync: pass\n";
  return 0;
}
