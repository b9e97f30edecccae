#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace edgesync::util {

/*
  UUID helpers

  Record ids are raw 16 byte RFC 9562 version 7 UUIDs: 48 bit unix
  millisecond prefix followed by random bits, so ids sort by creation time.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUIDv7();
UUID GenerateUUIDv7(TimePoint at);

// Unix milliseconds encoded in the first 48 bits.
uint64_t UUIDv7Millis(const UUID& id);

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Raw 16 byte form used in protobuf bytes fields and sqlite blobs.
std::string ToBytes(const UUID& id);
UUID        FromBytes(const std::string& bytes);

} // namespace edgesync::util
