#include "internal/service/gateway_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/chain/chain_builder.hpp"
#include "internal/codec/record_codec.hpp"
#include "internal/sync/downlink_dispatcher.hpp"
#include "internal/util/bytes.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_records.hpp"

namespace {

using edgesync::service::GatewayService;
using edgesync::service::GatewayServiceOptions;
using namespace edgesync::v1;

using Signer = std::shared_ptr<const edgesync::crypto::Ed25519Signer>;

struct Fixture {
  Signer         gateway_key{edgesync::crypto::Ed25519Signer::Generate()};
  Signer         node_key{edgesync::crypto::Ed25519Signer::Generate()};
  GatewayService service{gateway_key, GatewayServiceOptions{"letmein", true}};

  AuthenticateRequest Request(const Signer& key, const std::string& token = "letmein") const {
    const auto          pub = key->Public();
    AuthenticateRequest req;
    req.set_node_id("node-1");
    req.set_public_key(std::string(reinterpret_cast<const char*>(pub.data()), pub.size()));
    req.set_token(token);
    return req;
  }
};

template <typename Fn>
bool AuthFails(Fn&& fn) {
  try {
    fn();
  } catch (const edgesync::util::AuthenticationFailed&) {
    return true;
  }
  return false;
}

void TestTokenAndKeyPinning() {
  Fixture f;
  assert(AuthFails([&] { f.service.Authenticate(f.Request(f.node_key, "wrong")); }));

  const auto resp = f.service.Authenticate(f.Request(f.node_key));
  assert(!resp.session_id().empty());
  assert(resp.last_stored_sequence() == 0);

  // node id is now bound to the first key it presented
  Signer impostor(edgesync::crypto::Ed25519Signer::Generate());
  assert(AuthFails([&] { f.service.Authenticate(f.Request(impostor)); }));
}

void TestSubmitVerifiesAndEchoesId() {
  Fixture f;
  const auto session = f.service.Authenticate(f.Request(f.node_key)).session_id();

  auto                          store = edgesync::testing::MakeMemoryStore();
  edgesync::chain::ChainBuilder chain(store, f.node_key);
  const auto record = edgesync::testing::AppendChained(*store, chain, edgesync::testing::MakeRecord(0, 5000, "evidence"));

  SubmitRequest req;
  req.set_session_id(session);
  req.set_record(edgesync::codec::EncodeWire(record));

  auto resp = f.service.Submit(req);
  assert(resp.status() == ACK_STATUS_ACCEPTED);
  assert(edgesync::util::FromBytes(resp.record_id()) == record.id);
  assert(f.service.AcceptedCount("node-1") == 1);
  assert(f.service.LastStoredSequence("node-1") == 1);

  resp = f.service.Submit(req);
  assert(resp.status() == ACK_STATUS_REJECTED);
  assert(resp.reason() == REJECT_REASON_DUPLICATE);

  req.set_session_id("no-such-session");
  assert(f.service.Submit(req).reason() == REJECT_REASON_UNAUTHENTICATED);

  req.set_session_id(session);
  req.set_record("junk");
  assert(f.service.Submit(req).reason() == REJECT_REASON_MALFORMED);
}

void TestTimeSyncQueuedOnAuthenticate() {
  Fixture f;
  const auto resp = f.service.Authenticate(f.Request(f.node_key));

  FetchDownlinkRequest fetch;
  fetch.set_session_id(resp.session_id());
  fetch.set_max_records(10);
  const auto downlink = f.service.FetchDownlink(fetch);
  assert(downlink.records_size() == 1);

  edgesync::sync::DownlinkDispatcher dispatcher(f.service.PublicKey());
  std::uint64_t                      gateway_time = 0;
  dispatcher.Register(MESSAGE_TYPE_TIME_SYNC, [&](const edgesync::model::SyncRecord& record, const std::string& payload) {
    assert(record.priority == 3);
    gateway_time = edgesync::util::ReadU64BE(payload);
  });
  assert(dispatcher.Dispatch(downlink.records(0)));
  assert(gateway_time == resp.gateway_time_ms());

  // queue is drained
  assert(f.service.FetchDownlink(fetch).records_size() == 0);
}

void TestQueueDownlinkValidation() {
  Fixture f;
  f.service.Authenticate(f.Request(f.node_key));

  bool threw = false;
  try {
    f.service.QueueDownlink("node-1", MESSAGE_TYPE_EVIDENCE, "x");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.service.QueueDownlink("node-9", MESSAGE_TYPE_CONFIG_CHANGE, "x");
  } catch (const edgesync::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  const auto first  = f.service.QueueDownlink("node-1", MESSAGE_TYPE_CONFIG_CHANGE, "a");
  const auto second = f.service.QueueDownlink("node-1", MESSAGE_TYPE_OPERATOR_COMMAND, "b");
  assert(first.priority == 1);
  assert(second.priority == 0);
  assert(second.sequence == first.sequence + 1);
  assert(second.prev_hash == first.hash);

  FetchDownlinkRequest fetch;
  fetch.set_session_id("stale");
  assert(AuthFails([&] { f.service.FetchDownlink(fetch); }));
}

} // namespace

int main() {
  TestTokenAndKeyPinning();
  TestSubmitVerifiesAndEchoesId();
  TestTimeSyncQueuedOnAuthenticate();
  TestQueueDownlinkValidation();

  std::cout << "edgesync_unit_gateway_service: pass\n";
  return 0;
}
