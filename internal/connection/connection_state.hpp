#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace edgesync::connection {

struct Disconnected {};

struct Connecting {
  std::uint32_t attempts = 1;
};

struct Connected {};

struct Authenticated {
  std::string session_id;
};

// Still draining, with a reduced budget.
struct Degraded {
  double      quality = 0.0;
  std::string session_id;
};

using ConnectionState = std::variant<Disconnected, Connecting, Connected, Authenticated, Degraded>;

std::string_view StateName(const ConnectionState& state);

// Authenticated or Degraded.
bool CanSend(const ConnectionState& state);

/*
  Transition functions. Each accepts only its legal source states and
  throws util::InvalidState for anything else.
*/
ConnectionState OnStart(const ConnectionState& from);                                  // Disconnected -> Connecting{1}
ConnectionState OnConnectFailed(const ConnectionState& from);                          // Connecting{n} -> Connecting{n+1}
ConnectionState OnConnected(const ConnectionState& from);                              // Connecting -> Connected
ConnectionState OnAuthenticated(const ConnectionState& from, std::string session_id);  // Connected -> Authenticated
ConnectionState OnAuthFailed(const ConnectionState& from, std::uint32_t next_attempt); // Connected -> Connecting{n+1}
ConnectionState OnDegraded(const ConnectionState& from, double quality);               // Authenticated|Degraded -> Degraded
ConnectionState OnRecovered(const ConnectionState& from);                              // Degraded -> Authenticated
ConnectionState OnTransportLost(const ConnectionState& from);                          // Authenticated|Degraded -> Disconnected

} // namespace edgesync::connection
