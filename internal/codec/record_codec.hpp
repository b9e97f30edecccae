#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/sync_record.hpp"

namespace edgesync::codec {

/*
  SyncRecord wire format, big-endian, in transmission order:

    id          16
    priority     1   (0-5)
    msg_type     1   enum tag
    payload      4 + n  length-prefixed compressed blob
    digest      32
    signature   64
    timestamp    8   epoch millis
    sequence     8
    prev_hash   32   zero-filled for the first record

  hash is not transmitted; receivers recompute it from the fields.
*/

inline constexpr std::size_t kWireFixedBytes  = 16 + 1 + 1 + 4 + 32 + 64 + 8 + 8 + 32;
inline constexpr std::size_t kMaxPayloadBytes = 64ULL * 1024 * 1024;

std::string EncodeWire(const model::SyncRecord& record);

// Throws util::CodecError on truncated input, trailing bytes, bad priority
// or oversized payload. The returned record has hash left zero.
model::SyncRecord DecodeWire(std::string_view bytes);

} // namespace edgesync::codec
