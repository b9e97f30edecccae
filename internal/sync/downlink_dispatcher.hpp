#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "edgesync/v1/types.pb.h"
#include "internal/crypto/ed25519.hpp"
#include "internal/model/sync_record.hpp"

namespace edgesync::sync {

/*
  Validates downlink records from the gateway and routes them by type.

  A record is dropped when it fails to decode, carries a type outside the
  downlink set, has a priority other than the fixed one for its type, fails
  the gateway signature (when a gateway key is configured), or its payload
  does not match its digest.
*/
class DownlinkDispatcher {
 public:
  // payload is the decompressed body
  using Handler = std::function<void(const model::SyncRecord& record, const std::string& payload)>;

  explicit DownlinkDispatcher(std::optional<crypto::PublicKey> gateway_key = std::nullopt);

  void Register(edgesync::v1::MessageType type, Handler handler);

  // True when a handler ran.
  bool Dispatch(std::string_view wire);

  static std::optional<std::uint8_t> FixedPriority(edgesync::v1::MessageType type);

  std::uint64_t Dispatched() const {
    return dispatched_.load();
  }
  std::uint64_t Rejected() const {
    return rejected_.load();
  }

 private:
  bool Reject(const std::string& reason, const std::string& detail);

  std::optional<crypto::PublicKey> gateway_key_;

  std::mutex                                          mutex_;
  std::map<edgesync::v1::MessageType, Handler>        handlers_;
  std::atomic<std::uint64_t>                          dispatched_{0};
  std::atomic<std::uint64_t>                          rejected_{0};
};

} // namespace edgesync::sync
