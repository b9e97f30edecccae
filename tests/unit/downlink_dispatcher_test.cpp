#include "internal/sync/downlink_dispatcher.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/chain/record_hash.hpp"
#include "internal/codec/record_codec.hpp"
#include "internal/sync/clock_drift_monitor.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_records.hpp"

namespace {

using edgesync::model::SyncRecord;
using edgesync::sync::ClockDriftMonitor;
using edgesync::sync::DownlinkDispatcher;
using namespace edgesync::v1;

const auto kGatewayKey = std::shared_ptr<const edgesync::crypto::Ed25519Signer>(edgesync::crypto::Ed25519Signer::Generate());

SyncRecord Signed(MessageType type, std::uint8_t priority, const std::string& payload,
                  const edgesync::crypto::Ed25519Signer& key = *kGatewayKey) {
  auto record     = edgesync::testing::MakeRecord(priority, 1000, payload, type);
  record.sequence = 1;
  record.hash     = edgesync::chain::ComputeRecordHash(record);
  record.signature = key.Sign(std::string_view(reinterpret_cast<const char*>(record.hash.data()), record.hash.size()));
  return record;
}

void TestFixedPriorityTable() {
  assert(DownlinkDispatcher::FixedPriority(MESSAGE_TYPE_OPERATOR_COMMAND) == 0);
  assert(DownlinkDispatcher::FixedPriority(MESSAGE_TYPE_CONFIG_CHANGE) == 1);
  assert(DownlinkDispatcher::FixedPriority(MESSAGE_TYPE_THREAT_INTEL) == 1);
  assert(DownlinkDispatcher::FixedPriority(MESSAGE_TYPE_MODEL_UPDATE) == 2);
  assert(DownlinkDispatcher::FixedPriority(MESSAGE_TYPE_TIME_SYNC) == 3);
  assert(!DownlinkDispatcher::FixedPriority(MESSAGE_TYPE_TELEMETRY).has_value());
}

void TestRoutesByTypeWithDecompressedPayload() {
  DownlinkDispatcher dispatcher(kGatewayKey->Public());
  std::string        seen;
  dispatcher.Register(MESSAGE_TYPE_CONFIG_CHANGE, [&](const SyncRecord&, const std::string& payload) { seen = payload; });

  assert(dispatcher.Dispatch(edgesync::codec::EncodeWire(Signed(MESSAGE_TYPE_CONFIG_CHANGE, 1, "tick_interval_ms: 500"))));
  assert(seen == "tick_interval_ms: 500");
  assert(dispatcher.Dispatched() == 1);

  // no handler registered
  assert(!dispatcher.Dispatch(edgesync::codec::EncodeWire(Signed(MESSAGE_TYPE_MODEL_UPDATE, 2, "weights"))));
  assert(dispatcher.Rejected() == 0);
}

void TestRejections() {
  DownlinkDispatcher dispatcher(kGatewayKey->Public());
  dispatcher.Register(MESSAGE_TYPE_THREAT_INTEL, [](const SyncRecord&, const std::string&) {});
  dispatcher.Register(MESSAGE_TYPE_OPERATOR_COMMAND, [](const SyncRecord&, const std::string&) {
    throw std::runtime_error("unsupported command");
  });

  assert(!dispatcher.Dispatch("short"));
  assert(!dispatcher.Dispatch(edgesync::codec::EncodeWire(Signed(MESSAGE_TYPE_EVIDENCE, 0, "uplink type"))));
  assert(!dispatcher.Dispatch(edgesync::codec::EncodeWire(Signed(MESSAGE_TYPE_THREAT_INTEL, 4, "wrong priority"))));

  auto forged = edgesync::crypto::Ed25519Signer::Generate();
  assert(!dispatcher.Dispatch(edgesync::codec::EncodeWire(Signed(MESSAGE_TYPE_THREAT_INTEL, 1, "forged", *forged))));

  auto tampered = Signed(MESSAGE_TYPE_THREAT_INTEL, 1, "ioc list");
  tampered.payload.back() ^= 0x01;
  assert(!dispatcher.Dispatch(edgesync::codec::EncodeWire(tampered)));

  assert(!dispatcher.Dispatch(edgesync::codec::EncodeWire(Signed(MESSAGE_TYPE_OPERATOR_COMMAND, 0, "reboot"))));

  assert(dispatcher.Rejected() == 6);
  assert(dispatcher.Dispatched() == 0);
}

void TestDigestCheckedWithoutGatewayKey() {
  DownlinkDispatcher dispatcher;
  dispatcher.Register(MESSAGE_TYPE_TIME_SYNC, [](const SyncRecord&, const std::string&) {});

  auto record = Signed(MESSAGE_TYPE_TIME_SYNC, 3, "12345678");
  assert(dispatcher.Dispatch(edgesync::codec::EncodeWire(record)));

  record.digest[0] ^= 0x01;
  assert(!dispatcher.Dispatch(edgesync::codec::EncodeWire(record)));
}

void TestClockDrift() {
  ClockDriftMonitor monitor(std::chrono::milliseconds(5000));
  assert(!monitor.LastDriftMs().has_value());
  monitor.Check();

  assert(monitor.Observe(10'000, 8'000) == 2000);
  monitor.Check();
  assert(monitor.ExceededCount() == 0);

  assert(monitor.Observe(10'000, 20'000) == -10'000);
  assert(monitor.ExceededCount() == 1);

  bool threw = false;
  try {
    monitor.Check();
  } catch (const edgesync::util::ClockDrift& e) {
    threw = e.DriftMs() == -10'000;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFixedPriorityTable();
  TestRoutesByTypeWithDecompressedPayload();
  TestRejections();
  TestDigestCheckedWithoutGatewayKey();
  TestClockDrift();

  std::cout << "edgesync_unit_downlink_dispatcher: pass\n";
  return 0;
}
