#include "internal/codec/record_codec.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/support/test_records.hpp"

namespace {

using edgesync::codec::DecodeWire;
using edgesync::codec::EncodeWire;
using edgesync::codec::kWireFixedBytes;
using edgesync::model::SyncRecord;
using edgesync::util::CodecError;

SyncRecord ChainedSample() {
  auto record      = edgesync::testing::MakeRecord(2, 1'700'000'000'000ULL, "health: fan stalled", edgesync::v1::MESSAGE_TYPE_HEALTH_ALERT);
  record.sequence  = 42;
  record.prev_hash.fill(0xAB);
  record.signature.fill(0xCD);
  return record;
}

template <typename Fn>
bool ThrowsCodecError(Fn&& fn) {
  try {
    fn();
  } catch (const CodecError&) {
    return true;
  }
  return false;
}

void TestLayoutIsFieldOrderBigEndian() {
  const auto record = ChainedSample();
  const auto wire   = EncodeWire(record);

  assert(wire.size() == kWireFixedBytes + record.payload.size());
  assert(static_cast<uint8_t>(wire[16]) == 2);
  assert(static_cast<uint8_t>(wire[17]) == edgesync::v1::MESSAGE_TYPE_HEALTH_ALERT);

  // payload length prefix
  const auto len = record.payload.size();
  assert(static_cast<uint8_t>(wire[18]) == ((len >> 24) & 0xFF));
  assert(static_cast<uint8_t>(wire[21]) == (len & 0xFF));

  // sequence sits 40 bytes before the end, last byte is the low byte
  assert(static_cast<uint8_t>(wire[wire.size() - 32 - 1]) == 42);
}

void TestDecodeRestoresEveryTransmittedField() {
  const auto record  = ChainedSample();
  const auto decoded = DecodeWire(EncodeWire(record));

  assert(decoded.id == record.id);
  assert(decoded.priority == record.priority);
  assert(decoded.msg_type == record.msg_type);
  assert(decoded.payload == record.payload);
  assert(decoded.digest == record.digest);
  assert(decoded.signature == record.signature);
  assert(decoded.timestamp_ms == record.timestamp_ms);
  assert(decoded.sequence == record.sequence);
  assert(decoded.prev_hash == record.prev_hash);
  assert(decoded.hash == edgesync::model::kZeroHash);
}

void TestTruncatedAndTrailingInputRejected() {
  const auto wire = EncodeWire(ChainedSample());

  assert(ThrowsCodecError([&] { DecodeWire(wire.substr(0, kWireFixedBytes - 1)); }));
  assert(ThrowsCodecError([&] { DecodeWire(wire.substr(0, wire.size() - 1)); }));
  assert(ThrowsCodecError([&] { DecodeWire(wire + "x"); }));
}

void TestBadPriorityAndTagRejected() {
  auto wire = EncodeWire(ChainedSample());

  auto bad_priority = wire;
  bad_priority[16]  = 6;
  assert(ThrowsCodecError([&] { DecodeWire(bad_priority); }));

  auto bad_tag = wire;
  bad_tag[17]  = static_cast<char>(200);
  assert(ThrowsCodecError([&] { DecodeWire(bad_tag); }));

  auto record     = ChainedSample();
  record.priority = 9;
  assert(ThrowsCodecError([&] { EncodeWire(record); }));
}

} // namespace

int main() {
  TestLayoutIsFieldOrderBigEndian();
  TestDecodeRestoresEveryTransmittedField();
  TestTruncatedAndTrailingInputRejected();
  TestBadPriorityAndTagRejected();

  std::cout << "edgesync_unit_record_codec: pass\n";
  return 0;
}
