#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "edgesync/v1/types.pb.h"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace edgesync::model {

using RecordId  = edgesync::util::UUID;
using Hash256   = std::array<uint8_t, 32>;
using Signature = std::array<uint8_t, 64>;

inline constexpr Hash256 kZeroHash{};

/*
  SyncRecord: the unit of synchronization.

  Producer-side fields (id, priority, msg_type, payload, digest, timestamp)
  are fixed at creation. Chain fields (sequence, prev_hash, hash, signature)
  are filled exactly once by the chain builder; after that the record is
  immutable and only ever copied.
*/
struct SyncRecord {
  RecordId                     id{};
  std::uint8_t                 priority = 0;
  edgesync::v1::MessageType    msg_type = edgesync::v1::MESSAGE_TYPE_UNSPECIFIED;
  std::string                  payload;  // compressed blob, opaque here
  Hash256                      digest{}; // SHA-256 of the uncompressed payload
  std::uint64_t                timestamp_ms = 0;

  // chain fields, sequence == 0 means unchained
  std::uint64_t sequence = 0;
  Hash256       prev_hash{};
  Hash256       hash{};
  Signature     signature{};

  bool IsChained() const {
    return sequence != 0;
  }

  // Bytes charged against the storage quota.
  std::uint64_t StorageBytes() const {
    return payload.size() + kRowOverheadBytes;
  }

  static constexpr std::uint64_t kRowOverheadBytes = 256;
};

/*
  Chain head persisted alongside the records. last_sequence == 0 means no
  record has been chained yet and last_hash is all zero.
*/
struct ChainState {
  std::uint64_t last_sequence = 0;
  Hash256       last_hash{};
};

} // namespace edgesync::model
