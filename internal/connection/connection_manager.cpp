#include "connection_manager.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace edgesync::connection {

using observability::StringField;
using observability::UintField;

ConnectionOptions ConnectionOptions::FromConfig(const edgesync::runtime::config::RuntimeConfig& config) {
  ConnectionOptions options;
  options.node_id                      = config.node().node_id();
  options.auth_token                   = config.gateway().auth_token();
  options.connect_timeout              = std::chrono::milliseconds(config.gateway().connect_timeout_ms());
  options.backoff_base                 = std::chrono::milliseconds(config.connection().backoff_base_ms());
  options.backoff_cap                  = std::chrono::milliseconds(config.connection().backoff_cap_ms());
  options.jitter_ratio                 = config.connection().jitter_ratio();
  options.auth_failure_alert_threshold = config.connection().auth_failure_alert_threshold();
  options.quality_window               = config.connection().quality_window();
  options.degraded_failure_rate        = config.connection().degraded_failure_rate();
  options.degraded_latency             = std::chrono::milliseconds(config.connection().degraded_latency_ms());
  options.recovery_quality             = config.connection().recovery_quality();
  return options;
}

ConnectionManager::ConnectionManager(std::shared_ptr<transport::GatewayTransport> transport, crypto::PublicKey node_key,
                                     ChainHeadProvider chain_head, ConnectionOptions options, std::uint64_t backoff_seed)
    : transport_(std::move(transport)),
      node_key_(node_key),
      chain_head_(std::move(chain_head)),
      options_(std::move(options)),
      backoff_(options_.backoff_base, options_.backoff_cap, options_.jitter_ratio, backoff_seed),
      quality_(options_.quality_window, options_.degraded_latency) {
  if (!transport_) {
    throw std::invalid_argument("ConnectionManager: transport is null");
  }
}

ConnectionState ConnectionManager::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

bool ConnectionManager::CanSend() const {
  std::lock_guard lock(mutex_);
  return connection::CanSend(state_);
}

std::optional<std::string> ConnectionManager::SessionId() const {
  std::lock_guard lock(mutex_);
  if (const auto* auth = std::get_if<Authenticated>(&state_)) return auth->session_id;
  if (const auto* degraded = std::get_if<Degraded>(&state_)) return degraded->session_id;
  return std::nullopt;
}

void ConnectionManager::SetAuthListener(AuthListener listener) {
  std::lock_guard lock(mutex_);
  auth_listener_ = std::move(listener);
}

std::uint32_t ConnectionManager::ConsecutiveAuthFailures() const {
  std::lock_guard lock(mutex_);
  return auth_failures_;
}

util::SteadyTimePoint ConnectionManager::NextAttemptAt() const {
  std::lock_guard lock(mutex_);
  return next_attempt_;
}

double ConnectionManager::Quality() const {
  std::lock_guard lock(mutex_);
  return quality_.Quality();
}

void ConnectionManager::Transition(ConnectionState next) {
  EDGESYNC_LOG_DEBUG("connection transition",
                     {StringField("from", StateName(state_)), StringField("to", StateName(next))});
  state_ = std::move(next);
}

void ConnectionManager::ScheduleRetry(util::SteadyTimePoint now, std::uint32_t failed_attempt) {
  next_attempt_ = now + backoff_.Delay(failed_attempt);
}

void ConnectionManager::Reconnect(util::SteadyTimePoint now) {
  AuthListener               listener;
  std::optional<transport::AuthResult> authenticated;

  {
    std::lock_guard lock(mutex_);

    if (connection::CanSend(state_)) return;

    if (std::holds_alternative<Disconnected>(state_)) {
      Transition(OnStart(state_));
      next_attempt_ = now;
    }

    if (now < next_attempt_) return;

    std::uint32_t attempt = 0;
    if (const auto* connecting = std::get_if<Connecting>(&state_)) {
      attempt = connecting->attempts;
      try {
        transport_->Connect(options_.connect_timeout);
      } catch (const util::ConnectionLost& e) {
        EDGESYNC_LOG_WARN("gateway connect failed", {UintField("attempt", attempt), StringField("error", e.what())});
        Transition(OnConnectFailed(state_));
        ScheduleRetry(now, attempt);
        return;
      }
      Transition(OnConnected(state_));
    }

    if (!std::holds_alternative<Connected>(state_)) return;

    transport::AuthRequest request;
    request.node_id      = options_.node_id;
    request.public_key   = node_key_;
    request.token        = options_.auth_token;
    request.head         = chain_head_ ? chain_head_() : model::ChainState{};
    request.node_time_ms = util::ToUnixMillis(util::Now());

    try {
      auto result = transport_->Authenticate(request, options_.connect_timeout);
      Transition(OnAuthenticated(state_, result.session_id));
      auth_failures_ = 0;
      quality_.Reset();
      EDGESYNC_LOG_INFO("authenticated with gateway", {StringField("session_id", result.session_id),
                                                      UintField("gateway_last_sequence", result.last_stored_sequence)});
      listener      = auth_listener_;
      authenticated = std::move(result);
    } catch (const util::AuthenticationFailed& e) {
      ++auth_failures_;
      transport_->Close();
      Transition(OnAuthFailed(state_, attempt + 1));
      ScheduleRetry(now, std::max<std::uint32_t>(attempt, 1));
      if (auth_failures_ >= options_.auth_failure_alert_threshold) {
        EDGESYNC_LOG_ERROR("repeated gateway authentication failures",
                           {observability::AlertField("auth_failures"), UintField("consecutive", auth_failures_), StringField("error", e.what())});
      } else {
        EDGESYNC_LOG_WARN("gateway authentication failed", {UintField("consecutive", auth_failures_), StringField("error", e.what())});
      }
    } catch (const util::ConnectionLost& e) {
      transport_->Close();
      Transition(OnAuthFailed(state_, attempt + 1));
      ScheduleRetry(now, std::max<std::uint32_t>(attempt, 1));
      EDGESYNC_LOG_WARN("gateway lost during authentication", {StringField("error", e.what())});
    }
  }

  if (listener && authenticated) listener(*authenticated);
}

void ConnectionManager::ReportSendResult(bool success, std::chrono::milliseconds latency) {
  std::lock_guard lock(mutex_);
  if (!connection::CanSend(state_)) return;

  quality_.Record(success, latency);

  const double quality   = quality_.Quality();
  const bool   unhealthy = quality_.FailureRate() > options_.degraded_failure_rate ||
                         quality_.MeanLatencyMs() > static_cast<double>(options_.degraded_latency.count());

  if (std::holds_alternative<Authenticated>(state_)) {
    if (unhealthy) {
      EDGESYNC_LOG_WARN("link degraded", {StringField("quality", std::to_string(quality)),
                                          StringField("failure_rate", std::to_string(quality_.FailureRate()))});
      Transition(OnDegraded(state_, quality));
    }
    return;
  }

  if (!unhealthy && quality >= options_.recovery_quality) {
    EDGESYNC_LOG_INFO("link recovered", {StringField("quality", std::to_string(quality))});
    Transition(OnRecovered(state_));
  } else {
    state_ = OnDegraded(state_, quality);
  }
}

void ConnectionManager::ReportTransportFailure(const std::string& reason) {
  std::lock_guard lock(mutex_);
  if (!connection::CanSend(state_)) return;

  EDGESYNC_LOG_WARN("gateway link lost", {StringField("reason", reason), StringField("state", StateName(state_))});
  transport_->Close();
  Transition(OnTransportLost(state_));
}

} // namespace edgesync::connection
