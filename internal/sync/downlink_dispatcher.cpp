#include "downlink_dispatcher.hpp"

#include "internal/chain/chain_verifier.hpp"
#include "internal/codec/payload_codec.hpp"
#include "internal/codec/record_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace edgesync::sync {

using edgesync::v1::MessageType;
using observability::StringField;

DownlinkDispatcher::DownlinkDispatcher(std::optional<crypto::PublicKey> gateway_key) : gateway_key_(gateway_key) {
}

void DownlinkDispatcher::Register(MessageType type, Handler handler) {
  std::lock_guard lock(mutex_);
  handlers_[type] = std::move(handler);
}

std::optional<std::uint8_t> DownlinkDispatcher::FixedPriority(MessageType type) {
  switch (type) {
    case edgesync::v1::MESSAGE_TYPE_MODEL_UPDATE:
      return 2;
    case edgesync::v1::MESSAGE_TYPE_CONFIG_CHANGE:
    case edgesync::v1::MESSAGE_TYPE_THREAT_INTEL:
      return 1;
    case edgesync::v1::MESSAGE_TYPE_TIME_SYNC:
      return 3;
    case edgesync::v1::MESSAGE_TYPE_OPERATOR_COMMAND:
      return 0;
    default:
      return std::nullopt;
  }
}

bool DownlinkDispatcher::Reject(const std::string& reason, const std::string& detail) {
  ++rejected_;
  EDGESYNC_LOG_WARN("downlink record rejected", {StringField("reason", reason), StringField("detail", detail)});
  return false;
}

bool DownlinkDispatcher::Dispatch(std::string_view wire) {
  model::SyncRecord record;
  try {
    record = codec::DecodeWire(wire);
  } catch (const util::CodecError& e) {
    return Reject("malformed", e.what());
  }

  const auto id       = util::ToString(record.id);
  const auto expected = FixedPriority(record.msg_type);
  if (!expected) {
    return Reject("not-downlink", id + " type " + edgesync::v1::MessageType_Name(record.msg_type));
  }
  if (record.priority != *expected) {
    return Reject("priority-mismatch", id + " priority " + std::to_string(record.priority));
  }

  if (gateway_key_) {
    try {
      chain::ChainVerifier(*gateway_key_).VerifyRecord(record);
    } catch (const util::ChainIntegrityViolation& e) {
      return Reject("bad-signature", id + ": " + e.what());
    }
  }

  std::string payload;
  try {
    payload = codec::PayloadCodec::Decompress(record.payload);
  } catch (const util::CodecError& e) {
    return Reject("malformed", id + ": " + e.what());
  }
  if (codec::PayloadCodec::Digest(payload) != record.digest) {
    return Reject("digest-mismatch", id);
  }

  Handler handler;
  {
    std::lock_guard lock(mutex_);
    auto            it = handlers_.find(record.msg_type);
    if (it != handlers_.end()) handler = it->second;
  }
  if (!handler) {
    EDGESYNC_LOG_DEBUG("no handler for downlink type", {StringField("type", edgesync::v1::MessageType_Name(record.msg_type))});
    return false;
  }

  try {
    handler(record, payload);
  } catch (const std::exception& e) {
    return Reject("handler-failed", id + ": " + e.what());
  }
  ++dispatched_;
  EDGESYNC_LOG_INFO("downlink dispatched", {StringField("record_id", id), StringField("type", edgesync::v1::MessageType_Name(record.msg_type))});
  return true;
}

} // namespace edgesync::sync
