#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace edgesync::runtime::config {
class RuntimeConfig;
}

namespace edgesync::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"edge-sync"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeMetrics(const edgesync::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Sync counters. All calls are no-ops unless built with ENABLE_OTEL and
  metrics are enabled in config.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordSend(int priority, bool acked);
  void ObserveAckLatencyMs(double latency_ms);
  void RecordEvicted(int priority, std::uint64_t count);
  void RecordIngestDrop(int priority);
  void SetQueueDepth(int priority, std::uint64_t depth);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const edgesync::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordSend(int, bool) {
}

inline void Metrics::ObserveAckLatencyMs(double) {
}

inline void Metrics::RecordEvicted(int, std::uint64_t) {
}

inline void Metrics::RecordIngestDrop(int) {
}

inline void Metrics::SetQueueDepth(int, std::uint64_t) {
}
#endif

} // namespace edgesync::observability
