#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

namespace edgesync::sync {

/*
  Tracks node clock offset against gateway time samples (authentication
  responses and TimeSync downlinks). Drift beyond the threshold is logged as
  an operational alert; callers that need a hard stop use Check().
*/
class ClockDriftMonitor {
 public:
  explicit ClockDriftMonitor(std::chrono::milliseconds threshold);

  // Returns gateway_time - node_time in milliseconds.
  std::int64_t Observe(std::uint64_t gateway_time_ms, std::uint64_t node_time_ms);

  // Throws util::ClockDrift if the last observation exceeded the threshold.
  void Check() const;

  std::optional<std::int64_t> LastDriftMs() const;
  std::uint64_t               ExceededCount() const;

 private:
  std::chrono::milliseconds threshold_;

  mutable std::mutex          mutex_;
  std::optional<std::int64_t> last_drift_ms_;
  std::uint64_t               exceeded_ = 0;
};

} // namespace edgesync::sync
