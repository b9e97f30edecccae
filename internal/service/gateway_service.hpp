#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "edgesync/v1/gateway_service.pb.h"
#include "internal/crypto/ed25519.hpp"
#include "internal/gateway/gateway_verifier.hpp"
#include "internal/model/sync_record.hpp"

namespace edgesync::service {

struct GatewayServiceOptions {
  std::string auth_token; // empty = any token accepted
  bool        time_sync_on_auth = true;
};

/*
  Reference cloud gateway logic: node sessions, per-node chain verification
  and signed downlink queues. Stored records are kept in memory only.

  Throws util::AuthenticationFailed for bad tokens, unknown sessions and
  key mismatches; the gRPC adapter maps that to UNAUTHENTICATED.
*/
class GatewayService {
 public:
  GatewayService(std::shared_ptr<const crypto::Ed25519Signer> gateway_key, GatewayServiceOptions options);

  edgesync::v1::AuthenticateResponse Authenticate(const edgesync::v1::AuthenticateRequest& req);

  edgesync::v1::SubmitResponse Submit(const edgesync::v1::SubmitRequest& req);

  edgesync::v1::FetchDownlinkResponse FetchDownlink(const edgesync::v1::FetchDownlinkRequest& req);

  // Signs and queues a downlink record for one node. Priority comes from the
  // fixed downlink table. Returns the queued record.
  model::SyncRecord QueueDownlink(const std::string& node_id, edgesync::v1::MessageType type, const std::string& payload);

  std::uint64_t AcceptedCount(const std::string& node_id) const;
  std::uint64_t LastStoredSequence(const std::string& node_id) const;

  crypto::PublicKey PublicKey() const {
    return gateway_key_->Public();
  }

 private:
  struct NodeState {
    crypto::PublicKey                        public_key{};
    std::unique_ptr<gateway::GatewayVerifier> verifier;
    std::uint64_t                            accepted = 0;
    std::deque<std::string>                  downlink;
  };

  NodeState& SessionNode(const std::string& session_id);
  model::SyncRecord SignDownlink(edgesync::v1::MessageType type, std::uint8_t priority, const std::string& payload);

  std::shared_ptr<const crypto::Ed25519Signer> gateway_key_;
  GatewayServiceOptions                        options_;

  mutable std::mutex                  mutex_;
  std::map<std::string, NodeState>    nodes_;
  std::map<std::string, std::string>  sessions_; // session_id -> node_id
  model::ChainState                   downlink_head_;
};

} // namespace edgesync::service
