#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/connection/backoff.hpp"
#include "internal/connection/connection_state.hpp"
#include "internal/connection/link_quality.hpp"
#include "internal/crypto/ed25519.hpp"
#include "internal/model/sync_record.hpp"
#include "internal/transport/gateway_transport.hpp"
#include "internal/util/time.hpp"

namespace edgesync::connection {

struct ConnectionOptions {
  std::string node_id;
  std::string auth_token;

  std::chrono::milliseconds connect_timeout{10000};
  std::chrono::milliseconds backoff_base{1000};
  std::chrono::milliseconds backoff_cap{60000};
  double                    jitter_ratio = 0.2;

  std::uint32_t auth_failure_alert_threshold = 5;

  std::size_t               quality_window = 20;
  double                    degraded_failure_rate = 0.3;
  std::chrono::milliseconds degraded_latency{2000};
  double                    recovery_quality = 0.8;

  static ConnectionOptions FromConfig(const edgesync::runtime::config::RuntimeConfig& config);
};

/*
  Owns the link state machine. The sync engine only reads the state and
  reports outcomes; every transition happens in here.

  Reconnect() performs at most one connect + authenticate attempt and only
  when the backoff deadline has passed, so it is cheap to call every tick.
*/
class ConnectionManager {
 public:
  using ChainHeadProvider = std::function<model::ChainState()>;
  using AuthListener      = std::function<void(const transport::AuthResult&)>;

  ConnectionManager(std::shared_ptr<transport::GatewayTransport> transport, crypto::PublicKey node_key, ChainHeadProvider chain_head,
                    ConnectionOptions options, std::uint64_t backoff_seed = std::random_device{}());

  ConnectionState State() const;
  bool            CanSend() const;

  std::optional<std::string> SessionId() const;

  void Reconnect(util::SteadyTimePoint now);

  void ReportSendResult(bool success, std::chrono::milliseconds latency);

  // Authenticated/Degraded -> Disconnected; ignored in other states.
  void ReportTransportFailure(const std::string& reason);

  void SetAuthListener(AuthListener listener);

  std::uint32_t         ConsecutiveAuthFailures() const;
  util::SteadyTimePoint NextAttemptAt() const;
  double                Quality() const;

 private:
  void Transition(ConnectionState next);
  void ScheduleRetry(util::SteadyTimePoint now, std::uint32_t failed_attempt);

  std::shared_ptr<transport::GatewayTransport> transport_;
  crypto::PublicKey                            node_key_;
  ChainHeadProvider                            chain_head_;
  ConnectionOptions                            options_;

  mutable std::mutex    mutex_;
  ConnectionState       state_{Disconnected{}};
  Backoff               backoff_;
  LinkQuality           quality_;
  util::SteadyTimePoint next_attempt_{};
  std::uint32_t         auth_failures_ = 0;
  AuthListener          auth_listener_;
};

} // namespace edgesync::connection
