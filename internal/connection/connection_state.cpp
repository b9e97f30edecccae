#include "connection_state.hpp"

#include "internal/util/errors.hpp"

namespace edgesync::connection {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

[[noreturn]] void Reject(std::string_view event, const ConnectionState& from) {
  throw util::InvalidState("illegal connection transition: " + std::string(event) + " from " + std::string(StateName(from)));
}

} // namespace

std::string_view StateName(const ConnectionState& state) {
  return std::visit(Overloaded{
                        [](const Disconnected&) { return std::string_view("disconnected"); },
                        [](const Connecting&) { return std::string_view("connecting"); },
                        [](const Connected&) { return std::string_view("connected"); },
                        [](const Authenticated&) { return std::string_view("authenticated"); },
                        [](const Degraded&) { return std::string_view("degraded"); },
                    },
                    state);
}

bool CanSend(const ConnectionState& state) {
  return std::holds_alternative<Authenticated>(state) || std::holds_alternative<Degraded>(state);
}

ConnectionState OnStart(const ConnectionState& from) {
  if (!std::holds_alternative<Disconnected>(from)) Reject("start", from);
  return Connecting{1};
}

ConnectionState OnConnectFailed(const ConnectionState& from) {
  const auto* connecting = std::get_if<Connecting>(&from);
  if (!connecting) Reject("connect-failed", from);
  return Connecting{connecting->attempts + 1};
}

ConnectionState OnConnected(const ConnectionState& from) {
  if (!std::holds_alternative<Connecting>(from)) Reject("connected", from);
  return Connected{};
}

ConnectionState OnAuthenticated(const ConnectionState& from, std::string session_id) {
  if (!std::holds_alternative<Connected>(from)) Reject("authenticated", from);
  return Authenticated{std::move(session_id)};
}

ConnectionState OnAuthFailed(const ConnectionState& from, std::uint32_t next_attempt) {
  if (!std::holds_alternative<Connected>(from)) Reject("auth-failed", from);
  return Connecting{next_attempt};
}

ConnectionState OnDegraded(const ConnectionState& from, double quality) {
  if (const auto* auth = std::get_if<Authenticated>(&from)) {
    return Degraded{quality, auth->session_id};
  }
  if (const auto* degraded = std::get_if<Degraded>(&from)) {
    return Degraded{quality, degraded->session_id};
  }
  Reject("degraded", from);
}

ConnectionState OnRecovered(const ConnectionState& from) {
  const auto* degraded = std::get_if<Degraded>(&from);
  if (!degraded) Reject("recovered", from);
  return Authenticated{degraded->session_id};
}

ConnectionState OnTransportLost(const ConnectionState& from) {
  if (!CanSend(from)) Reject("transport-lost", from);
  return Disconnected{};
}

} // namespace edgesync::connection
