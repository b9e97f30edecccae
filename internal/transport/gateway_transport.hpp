#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "edgesync/v1/types.pb.h"
#include "internal/crypto/ed25519.hpp"
#include "internal/model/sync_record.hpp"

namespace edgesync::transport {

struct AuthRequest {
  std::string       node_id;
  crypto::PublicKey public_key{};
  std::string       token;
  model::ChainState head;
  std::uint64_t     node_time_ms = 0;
};

struct AuthResult {
  std::string   session_id;
  std::uint64_t gateway_time_ms      = 0;
  std::uint64_t last_stored_sequence = 0;
};

enum class SendStatus {
  kAcked,
  kRejected,
  kTimeout,
  kTransportError,
};

struct SendResult {
  SendStatus                 status = SendStatus::kTransportError;
  edgesync::v1::RejectReason reason = edgesync::v1::REJECT_REASON_NONE;
  model::RecordId            record_id{}; // as echoed by the gateway
  std::string                detail;
  std::chrono::milliseconds  latency{0};
};

/*
  Link to the cloud sync gateway.

  Connect and Authenticate throw (util::ConnectionLost,
  util::AuthenticationFailed); Send never throws for network problems and
  reports them through SendResult so the engine can classify them.
*/
class GatewayTransport {
 public:
  virtual ~GatewayTransport() = default;

  virtual void Connect(std::chrono::milliseconds timeout) = 0;

  virtual AuthResult Authenticate(const AuthRequest& request, std::chrono::milliseconds timeout) = 0;

  virtual SendResult Send(const std::string& session_id, const model::SyncRecord& record, std::chrono::milliseconds timeout) = 0;

  // Wire encoded downlink records. Throws util::ConnectionLost.
  virtual std::vector<std::string> FetchDownlink(const std::string& session_id, std::uint32_t max_records,
                                                 std::chrono::milliseconds timeout) = 0;

  virtual void Close() = 0;
};

} // namespace edgesync::transport
