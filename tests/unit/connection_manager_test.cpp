#include "internal/connection/connection_manager.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "tests/support/fake_gateway_transport.hpp"

namespace {

using namespace edgesync::connection;
using edgesync::testing::FakeGatewayTransport;
using std::chrono::milliseconds;

ConnectionOptions Options() {
  ConnectionOptions options;
  options.node_id                      = "node-7";
  options.auth_token                   = "secret";
  options.backoff_base                 = milliseconds(1000);
  options.backoff_cap                  = milliseconds(8000);
  options.jitter_ratio                 = 0.0;
  options.auth_failure_alert_threshold = 2;
  return options;
}

struct Fixture {
  std::shared_ptr<FakeGatewayTransport> transport = std::make_shared<FakeGatewayTransport>();
  edgesync::model::ChainState           head{12, {}};
  ConnectionManager                     manager{transport, edgesync::crypto::PublicKey{}, [this] { return head; }, Options(), 1};
};

void TestReconnectAuthenticatesInOneStep() {
  Fixture f;
  assert(std::holds_alternative<Disconnected>(f.manager.State()));

  f.manager.Reconnect(edgesync::util::SteadyClock::now());
  assert(f.manager.CanSend());
  assert(f.manager.SessionId() == "session-1");
  assert(f.transport->last_auth.node_id == "node-7");
  assert(f.transport->last_auth.token == "secret");
  assert(f.transport->last_auth.head.last_sequence == 12);
}

void TestConnectFailuresBackOff() {
  Fixture f;
  f.transport->connect_fails = true;
  const auto t0              = edgesync::util::SteadyClock::now();

  f.manager.Reconnect(t0);
  assert(std::get<Connecting>(f.manager.State()).attempts == 2);
  assert(f.manager.NextAttemptAt() == t0 + milliseconds(1000));

  // too early, no attempt
  f.manager.Reconnect(t0 + milliseconds(500));
  assert(f.transport->connects == 1);

  f.manager.Reconnect(t0 + milliseconds(1000));
  assert(f.transport->connects == 2);
  assert(std::get<Connecting>(f.manager.State()).attempts == 3);
  assert(f.manager.NextAttemptAt() == t0 + milliseconds(1000) + milliseconds(2000));

  f.transport->connect_fails = false;
  f.manager.Reconnect(t0 + milliseconds(3000));
  assert(f.manager.CanSend());
}

void TestAuthFailuresCountAndReset() {
  Fixture f;
  f.transport->auth_fails = true;
  auto now                = edgesync::util::SteadyClock::now();

  f.manager.Reconnect(now);
  assert(f.manager.ConsecutiveAuthFailures() == 1);
  assert(f.transport->closes == 1);
  assert(std::holds_alternative<Connecting>(f.manager.State()));

  now = f.manager.NextAttemptAt();
  f.manager.Reconnect(now);
  assert(f.manager.ConsecutiveAuthFailures() == 2);

  f.transport->auth_fails = false;
  now                     = f.manager.NextAttemptAt();
  f.manager.Reconnect(now);
  assert(f.manager.CanSend());
  assert(f.manager.ConsecutiveAuthFailures() == 0);
}

void TestDegradeAndRecover() {
  Fixture f;
  f.manager.Reconnect(edgesync::util::SteadyClock::now());

  f.manager.ReportSendResult(false, milliseconds(5000));
  assert(std::holds_alternative<Degraded>(f.manager.State()));
  assert(f.manager.CanSend());
  assert(f.manager.SessionId() == "session-1");

  for (int i = 0; i < 10; ++i) f.manager.ReportSendResult(true, milliseconds(10));
  assert(std::holds_alternative<Authenticated>(f.manager.State()));
}

void TestTransportLossDisconnects() {
  Fixture f;
  f.manager.Reconnect(edgesync::util::SteadyClock::now());

  f.manager.ReportTransportFailure("reset by peer");
  assert(std::holds_alternative<Disconnected>(f.manager.State()));
  assert(!f.manager.SessionId().has_value());
  assert(f.transport->closes == 1);

  // ignored once already down
  f.manager.ReportTransportFailure("again");
  assert(f.transport->closes == 1);
}

void TestAuthListenerSeesGatewayTime() {
  Fixture f;
  f.transport->gateway_time_ms = 123456;

  std::uint64_t seen = 0;
  f.manager.SetAuthListener([&](const edgesync::transport::AuthResult& result) { seen = result.gateway_time_ms; });
  f.manager.Reconnect(edgesync::util::SteadyClock::now());
  assert(seen == 123456);
}

} // namespace

int main() {
  TestReconnectAuthenticatesInOneStep();
  TestConnectFailuresBackOff();
  TestAuthFailuresCountAndReset();
  TestDegradeAndRecover();
  TestTransportLossDisconnects();
  TestAuthListenerSeesGatewayTime();

  std::cout << "edgesync_unit_connection_manager: pass\n";
  return 0;
}
