#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/codec/record_codec.hpp"
#include "internal/service/gateway_service.hpp"
#include "internal/transport/gateway_transport.hpp"
#include "internal/util/errors.hpp"

namespace edgesync::testing {

// Talks to an in-process GatewayService without gRPC.
class LoopbackTransport final : public transport::GatewayTransport {
 public:
  explicit LoopbackTransport(std::shared_ptr<service::GatewayService> gateway) : gateway_(std::move(gateway)) {
  }

  void Connect(std::chrono::milliseconds) override {
  }

  transport::AuthResult Authenticate(const transport::AuthRequest& request, std::chrono::milliseconds) override {
    edgesync::v1::AuthenticateRequest req;
    req.set_node_id(request.node_id);
    req.set_public_key(std::string(reinterpret_cast<const char*>(request.public_key.data()), request.public_key.size()));
    req.set_token(request.token);
    req.set_last_sequence(request.head.last_sequence);
    req.set_node_time_ms(request.node_time_ms);

    const auto resp = gateway_->Authenticate(req);
    return transport::AuthResult{resp.session_id(), resp.gateway_time_ms(), resp.last_stored_sequence()};
  }

  transport::SendResult Send(const std::string& session_id, const model::SyncRecord& record, std::chrono::milliseconds) override {
    edgesync::v1::SubmitRequest req;
    req.set_session_id(session_id);
    req.set_record(codec::EncodeWire(record));

    const auto resp = gateway_->Submit(req);

    transport::SendResult result;
    result.status    = resp.status() == edgesync::v1::ACK_STATUS_ACCEPTED ? transport::SendStatus::kAcked : transport::SendStatus::kRejected;
    result.reason    = resp.reason();
    result.detail    = resp.detail();
    if (resp.record_id().size() == 16) result.record_id = util::FromBytes(resp.record_id());
    return result;
  }

  std::vector<std::string> FetchDownlink(const std::string& session_id, std::uint32_t max_records, std::chrono::milliseconds) override {
    edgesync::v1::FetchDownlinkRequest req;
    req.set_session_id(session_id);
    req.set_max_records(max_records);
    const auto resp = gateway_->FetchDownlink(req);
    return {resp.records().begin(), resp.records().end()};
  }

  void Close() override {
  }

 private:
  std::shared_ptr<service::GatewayService> gateway_;
};

} // namespace edgesync::testing
