#pragma once

#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "internal/transport/gateway_transport.hpp"
#include "internal/util/errors.hpp"

namespace edgesync::testing {

/*
  Scripted gateway. Acks every record by default; tests override on_send
  to return timeouts, rejections or transport errors.
*/
class FakeGatewayTransport final : public transport::GatewayTransport {
 public:
  using SendHook = std::function<transport::SendResult(const model::SyncRecord&)>;

  void Connect(std::chrono::milliseconds) override {
    std::lock_guard lock(mutex_);
    ++connects;
    if (connect_fails) throw util::ConnectionLost("scripted connect failure");
  }

  transport::AuthResult Authenticate(const transport::AuthRequest& request, std::chrono::milliseconds) override {
    std::lock_guard lock(mutex_);
    ++auths;
    last_auth = request;
    if (auth_fails) throw util::AuthenticationFailed("scripted auth failure");
    return transport::AuthResult{"session-1", gateway_time_ms, 0};
  }

  transport::SendResult Send(const std::string&, const model::SyncRecord& record, std::chrono::milliseconds) override {
    SendHook hook;
    {
      std::lock_guard lock(mutex_);
      sent.push_back(record);
      hook = on_send;
    }
    if (hook) return hook(record);
    return Ack(record);
  }

  std::vector<std::string> FetchDownlink(const std::string&, std::uint32_t max_records, std::chrono::milliseconds) override {
    std::lock_guard          lock(mutex_);
    std::vector<std::string> out;
    while (!downlink.empty() && out.size() < max_records) {
      out.push_back(downlink.front());
      downlink.pop_front();
    }
    return out;
  }

  void Close() override {
    std::lock_guard lock(mutex_);
    ++closes;
  }

  static transport::SendResult Ack(const model::SyncRecord& record, std::chrono::milliseconds latency = std::chrono::milliseconds(5)) {
    transport::SendResult result;
    result.status    = transport::SendStatus::kAcked;
    result.record_id = record.id;
    result.latency   = latency;
    return result;
  }

  static transport::SendResult Reject(const model::SyncRecord& record, edgesync::v1::RejectReason reason) {
    transport::SendResult result;
    result.status    = transport::SendStatus::kRejected;
    result.reason    = reason;
    result.record_id = record.id;
    return result;
  }

  static transport::SendResult Timeout() {
    transport::SendResult result;
    result.status = transport::SendStatus::kTimeout;
    return result;
  }

  std::vector<model::SyncRecord> Sent() {
    std::lock_guard lock(mutex_);
    return sent;
  }

  std::mutex mutex_;

  bool                           connect_fails   = false;
  bool                           auth_fails      = false;
  std::uint64_t                  gateway_time_ms = 0;
  int                            connects        = 0;
  int                            auths           = 0;
  int                            closes          = 0;
  transport::AuthRequest         last_auth;
  SendHook                       on_send;
  std::vector<model::SyncRecord> sent;
  std::deque<std::string>        downlink;
};

} // namespace edgesync::testing
