#include "clock_drift_monitor.hpp"

#include <cstdlib>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace edgesync::sync {

ClockDriftMonitor::ClockDriftMonitor(std::chrono::milliseconds threshold) : threshold_(threshold) {
}

std::int64_t ClockDriftMonitor::Observe(std::uint64_t gateway_time_ms, std::uint64_t node_time_ms) {
  const auto drift = static_cast<std::int64_t>(gateway_time_ms) - static_cast<std::int64_t>(node_time_ms);

  std::lock_guard lock(mutex_);
  last_drift_ms_ = drift;
  if (std::llabs(drift) > threshold_.count()) {
    ++exceeded_;
    EDGESYNC_LOG_WARN("node clock drift exceeds threshold",
                      {observability::AlertField("clock_drift"), observability::IntField("drift_ms", drift),
                       observability::IntField("threshold_ms", threshold_.count())});
  }
  return drift;
}

void ClockDriftMonitor::Check() const {
  std::lock_guard lock(mutex_);
  if (last_drift_ms_ && std::llabs(*last_drift_ms_) > threshold_.count()) {
    throw util::ClockDrift("clock drift of " + std::to_string(*last_drift_ms_) + " ms", *last_drift_ms_);
  }
}

std::optional<std::int64_t> ClockDriftMonitor::LastDriftMs() const {
  std::lock_guard lock(mutex_);
  return last_drift_ms_;
}

std::uint64_t ClockDriftMonitor::ExceededCount() const {
  std::lock_guard lock(mutex_);
  return exceeded_;
}

} // namespace edgesync::sync
