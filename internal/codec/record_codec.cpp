#include "record_codec.hpp"

#include "internal/model/priority.hpp"
#include "internal/util/bytes.hpp"
#include "internal/util/errors.hpp"

namespace edgesync::codec {

using edgesync::util::CodecError;

std::string EncodeWire(const model::SyncRecord& record) {
  if (!model::IsValidPriority(record.priority)) {
    throw CodecError("priority out of range: " + std::to_string(record.priority));
  }
  if (record.payload.size() > kMaxPayloadBytes) {
    throw CodecError("payload exceeds wire limit");
  }

  std::string out;
  out.reserve(kWireFixedBytes + record.payload.size());

  util::AppendArray(out, record.id);
  out.push_back(static_cast<char>(record.priority));
  out.push_back(static_cast<char>(static_cast<uint8_t>(record.msg_type)));
  util::AppendU32BE(out, static_cast<uint32_t>(record.payload.size()));
  out.append(record.payload);
  util::AppendArray(out, record.digest);
  util::AppendArray(out, record.signature);
  util::AppendU64BE(out, record.timestamp_ms);
  util::AppendU64BE(out, record.sequence);
  util::AppendArray(out, record.prev_hash);

  return out;
}

model::SyncRecord DecodeWire(std::string_view bytes) {
  if (bytes.size() < kWireFixedBytes) {
    throw CodecError("record truncated: " + std::to_string(bytes.size()) + " bytes");
  }

  model::SyncRecord record;
  std::size_t       pos = 0;

  record.id = util::ReadArray<16>(bytes.substr(pos));
  pos += 16;

  const auto priority = static_cast<uint8_t>(bytes[pos++]);
  if (!model::IsValidPriority(priority)) {
    throw CodecError("priority out of range: " + std::to_string(priority));
  }
  record.priority = priority;

  const auto tag = static_cast<uint8_t>(bytes[pos++]);
  if (!edgesync::v1::MessageType_IsValid(tag)) {
    throw CodecError("unknown msg_type tag: " + std::to_string(tag));
  }
  record.msg_type = static_cast<edgesync::v1::MessageType>(tag);

  const uint32_t payload_len = util::ReadU32BE(bytes.substr(pos));
  pos += 4;
  if (payload_len > kMaxPayloadBytes) {
    throw CodecError("payload exceeds wire limit");
  }
  if (bytes.size() != kWireFixedBytes + payload_len) {
    throw CodecError("record length mismatch: expected " + std::to_string(kWireFixedBytes + payload_len) + " got " +
                     std::to_string(bytes.size()));
  }
  record.payload.assign(bytes.substr(pos, payload_len));
  pos += payload_len;

  record.digest = util::ReadArray<32>(bytes.substr(pos));
  pos += 32;
  record.signature = util::ReadArray<64>(bytes.substr(pos));
  pos += 64;
  record.timestamp_ms = util::ReadU64BE(bytes.substr(pos));
  pos += 8;
  record.sequence = util::ReadU64BE(bytes.substr(pos));
  pos += 8;
  record.prev_hash = util::ReadArray<32>(bytes.substr(pos));

  return record;
}

} // namespace edgesync::codec
