#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/chain/chain_builder.hpp"
#include "internal/codec/payload_codec.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/sync_record.hpp"
#include "internal/store/local_data_store.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace edgesync::testing {

inline model::SyncRecord MakeRecord(std::uint8_t priority, std::uint64_t timestamp_ms, const std::string& raw = "payload",
                                    edgesync::v1::MessageType type = edgesync::v1::MESSAGE_TYPE_TELEMETRY) {
  model::SyncRecord record;
  record.id           = util::GenerateUUIDv7(util::FromUnixMillis(timestamp_ms));
  record.priority     = priority;
  record.msg_type     = type;
  record.payload      = codec::PayloadCodec(codec::PayloadCodec::Kind::kNone).Compress(raw);
  record.digest       = codec::PayloadCodec::Digest(raw);
  record.timestamp_ms = timestamp_ms;
  return record;
}

inline model::SyncRecord MakeRecord(std::uint8_t priority, const std::string& raw = "payload") {
  return MakeRecord(priority, util::ToUnixMillis(util::Now()), raw);
}

inline std::shared_ptr<store::LocalDataStore> MakeMemoryStore(std::uint64_t quota_bytes = 1ULL << 30) {
  return std::make_shared<store::LocalDataStore>(std::make_shared<db::memory::MemoryRepository>(), quota_bytes);
}

// Appends to the store and links into the chain, as the ingest worker does.
inline model::SyncRecord AppendChained(store::LocalDataStore& store, chain::ChainBuilder& chain, const model::SyncRecord& record) {
  store.Append(record);
  return chain.ChainAppend(record);
}

} // namespace edgesync::testing
