#include "gateway_service.hpp"

#include <algorithm>
#include <chrono>

#include "internal/chain/record_hash.hpp"
#include "internal/codec/payload_codec.hpp"
#include "internal/codec/record_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sync/downlink_dispatcher.hpp"
#include "internal/util/bytes.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace edgesync::service {

using namespace edgesync::v1;
using observability::StringField;
using observability::UintField;

GatewayService::GatewayService(std::shared_ptr<const crypto::Ed25519Signer> gateway_key, GatewayServiceOptions options)
    : gateway_key_(std::move(gateway_key)), options_(std::move(options)) {
  if (!gateway_key_) {
    throw std::invalid_argument("GatewayService: gateway key is required");
  }
}

AuthenticateResponse GatewayService::Authenticate(const AuthenticateRequest& req) {
  if (req.node_id().empty()) {
    throw util::AuthenticationFailed("node_id is required");
  }
  if (!options_.auth_token.empty() && req.token() != options_.auth_token) {
    EDGESYNC_LOG_WARN("gateway auth rejected", {StringField("node_id", req.node_id()), StringField("reason", "token")});
    throw util::AuthenticationFailed("invalid token");
  }
  if (req.public_key().size() != crypto::PublicKey{}.size()) {
    throw util::AuthenticationFailed("public key must be 32 bytes");
  }
  const auto key = util::ReadArray<32>(req.public_key());

  AuthenticateResponse resp;
  {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = nodes_.try_emplace(req.node_id());
    auto& node          = it->second;
    if (inserted) {
      node.public_key = key;
      node.verifier   = std::make_unique<gateway::GatewayVerifier>(key);
    } else if (node.public_key != key) {
      EDGESYNC_LOG_WARN("gateway auth rejected", {StringField("node_id", req.node_id()), StringField("reason", "key mismatch")});
      throw util::AuthenticationFailed("public key does not match the key registered for " + req.node_id());
    }

    const auto session_id = util::ToString(util::GenerateUUIDv7());
    sessions_[session_id] = req.node_id();

    resp.set_session_id(session_id);
    resp.set_gateway_time_ms(util::ToUnixMillis(util::Now()));
    resp.set_last_stored_sequence(node.verifier->LastStoredSequence());
  }

  EDGESYNC_LOG_INFO("node authenticated", {StringField("node_id", req.node_id()), UintField("node_last_sequence", req.last_sequence()),
                                           UintField("stored_last_sequence", resp.last_stored_sequence())});

  if (options_.time_sync_on_auth) {
    std::string payload;
    util::AppendU64BE(payload, resp.gateway_time_ms());
    QueueDownlink(req.node_id(), MESSAGE_TYPE_TIME_SYNC, payload);
  }
  return resp;
}

GatewayService::NodeState& GatewayService::SessionNode(const std::string& session_id) {
  auto session = sessions_.find(session_id);
  if (session == sessions_.end()) {
    throw util::AuthenticationFailed("unknown session");
  }
  return nodes_.at(session->second);
}

SubmitResponse GatewayService::Submit(const SubmitRequest& req) {
  SubmitResponse resp;
  resp.set_status(ACK_STATUS_REJECTED);

  model::SyncRecord record;
  try {
    record = codec::DecodeWire(req.record());
  } catch (const util::CodecError& e) {
    resp.set_reason(REJECT_REASON_MALFORMED);
    resp.set_detail(e.what());
    return resp;
  }
  resp.set_record_id(util::ToBytes(record.id));

  std::lock_guard lock(mutex_);
  auto            session = sessions_.find(req.session_id());
  if (session == sessions_.end()) {
    resp.set_reason(REJECT_REASON_UNAUTHENTICATED);
    resp.set_detail("unknown session");
    return resp;
  }
  auto& node = nodes_.at(session->second);

  const auto verdict = node.verifier->Submit(record);
  if (!verdict.accepted) {
    EDGESYNC_LOG_WARN("record rejected", {StringField("node_id", session->second), UintField("sequence", record.sequence),
                                          StringField("reason", RejectReason_Name(verdict.reason)), StringField("detail", verdict.detail)});
    resp.set_reason(verdict.reason);
    resp.set_detail(verdict.detail);
    return resp;
  }

  ++node.accepted;
  resp.set_status(ACK_STATUS_ACCEPTED);
  EDGESYNC_LOG_DEBUG("record accepted", {StringField("node_id", session->second), UintField("sequence", record.sequence),
                                         observability::IntField("priority", record.priority)});
  return resp;
}

FetchDownlinkResponse GatewayService::FetchDownlink(const FetchDownlinkRequest& req) {
  FetchDownlinkResponse resp;

  std::lock_guard lock(mutex_);
  auto&           node  = SessionNode(req.session_id());
  const auto      limit = req.max_records() == 0 ? node.downlink.size() : std::min<std::size_t>(req.max_records(), node.downlink.size());
  for (std::size_t i = 0; i < limit; ++i) {
    resp.add_records(std::move(node.downlink.front()));
    node.downlink.pop_front();
  }
  return resp;
}

model::SyncRecord GatewayService::SignDownlink(MessageType type, std::uint8_t priority, const std::string& payload) {
  model::SyncRecord record;
  record.id           = util::GenerateUUIDv7();
  record.priority     = priority;
  record.msg_type     = type;
  record.payload      = codec::PayloadCodec(codec::PayloadCodec::Kind::kNone).Compress(payload);
  record.digest       = codec::PayloadCodec::Digest(payload);
  record.timestamp_ms = util::ToUnixMillis(util::Now());
  record.sequence     = downlink_head_.last_sequence + 1;
  record.prev_hash    = downlink_head_.last_hash;
  record.hash         = chain::ComputeRecordHash(record);
  record.signature    = gateway_key_->Sign(std::string_view(reinterpret_cast<const char*>(record.hash.data()), record.hash.size()));

  downlink_head_ = model::ChainState{record.sequence, record.hash};
  return record;
}

model::SyncRecord GatewayService::QueueDownlink(const std::string& node_id, MessageType type, const std::string& payload) {
  const auto priority = sync::DownlinkDispatcher::FixedPriority(type);
  if (!priority) {
    throw std::invalid_argument("not a downlink message type: " + MessageType_Name(type));
  }

  std::lock_guard lock(mutex_);
  auto            node = nodes_.find(node_id);
  if (node == nodes_.end()) {
    throw util::NotFound("unknown node " + node_id);
  }

  auto record = SignDownlink(type, *priority, payload);
  node->second.downlink.push_back(codec::EncodeWire(record));
  return record;
}

std::uint64_t GatewayService::AcceptedCount(const std::string& node_id) const {
  std::lock_guard lock(mutex_);
  auto            it = nodes_.find(node_id);
  return it == nodes_.end() ? 0 : it->second.accepted;
}

std::uint64_t GatewayService::LastStoredSequence(const std::string& node_id) const {
  std::lock_guard lock(mutex_);
  auto            it = nodes_.find(node_id);
  return it == nodes_.end() ? 0 : it->second.verifier->LastStoredSequence();
}

} // namespace edgesync::service
