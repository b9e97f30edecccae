#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace edgesync::model {

/*
  Fixed priority table. Transmission order and retention both derive from
  the class; neither is configurable per record.
*/

inline constexpr std::uint8_t kPriorityCount  = 6;
inline constexpr std::uint8_t kHighestPriority = 0;
inline constexpr std::uint8_t kLowestPriority  = 5;

struct PriorityClass {
  std::uint8_t     priority;
  std::string_view data_class;
  std::string_view latency_target;
  // nullopt = retained until acked
  std::optional<std::chrono::milliseconds> retention;
};

inline constexpr std::array<PriorityClass, kPriorityCount> kPriorityTable = {{
    {0, "critical-evidence", "immediate", std::nullopt},
    {1, "detections", "1m", std::chrono::hours(24 * 30)},
    {2, "health-alerts", "5m", std::chrono::hours(24 * 7)},
    {3, "track-history", "1h", std::chrono::hours(24 * 7)},
    {4, "telemetry", "best-effort", std::chrono::hours(24)},
    {5, "debug-logs", "best-effort", std::chrono::hours(12)},
}};

constexpr bool IsValidPriority(int priority) {
  return priority >= kHighestPriority && priority <= kLowestPriority;
}

constexpr const PriorityClass& ClassOf(std::uint8_t priority) {
  return kPriorityTable[priority];
}

constexpr std::optional<std::chrono::milliseconds> RetentionOf(std::uint8_t priority) {
  return kPriorityTable[priority].retention;
}

// P0 and P1 are never dropped at the producer handoff.
constexpr bool IsCritical(std::uint8_t priority) {
  return priority <= 1;
}

} // namespace edgesync::model
