#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace edgesync::util {

/*
  Central error types.

  Storage and chain errors are never swallowed; network errors are
  recovered by the connection manager. Server side these get translated
  to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Append rejected: the record cannot fit even after quota eviction.
class StorageFull : public std::runtime_error {
 public:
  explicit StorageFull(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Fatal to the whole chain. Carries the first sequence that failed.
class ChainIntegrityViolation : public std::runtime_error {
 public:
  ChainIntegrityViolation(const std::string& msg, uint64_t sequence) : std::runtime_error(msg), sequence_(sequence) {
  }

  uint64_t Sequence() const {
    return sequence_;
  }

 private:
  uint64_t sequence_;
};

class AckTimeout : public std::runtime_error {
 public:
  explicit AckTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConnectionLost : public std::runtime_error {
 public:
  explicit ConnectionLost(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AuthenticationFailed : public std::runtime_error {
 public:
  explicit AuthenticationFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ClockDrift : public std::runtime_error {
 public:
  ClockDrift(const std::string& msg, int64_t drift_ms) : std::runtime_error(msg), drift_ms_(drift_ms) {
  }

  int64_t DriftMs() const {
    return drift_ms_;
  }

 private:
  int64_t drift_ms_;
};

class CodecError : public std::runtime_error {
 public:
  explicit CodecError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CryptoError : public std::runtime_error {
 public:
  explicit CryptoError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace edgesync::util
