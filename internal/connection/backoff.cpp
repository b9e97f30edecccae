#include "backoff.hpp"

#include <algorithm>

namespace edgesync::connection {

Backoff::Backoff(std::chrono::milliseconds base, std::chrono::milliseconds cap, double jitter_ratio, std::uint64_t seed)
    : base_(base), cap_(std::max(cap, base)), jitter_ratio_(std::clamp(jitter_ratio, 0.0, 1.0)), rng_(seed) {
}

std::chrono::milliseconds Backoff::Nominal(std::uint32_t attempt) const {
  const std::uint32_t exponent = std::min<std::uint32_t>(attempt > 0 ? attempt - 1 : 0, 30);
  const auto          raw      = base_.count() * (std::int64_t{1} << exponent);
  return std::chrono::milliseconds(std::min<std::int64_t>(raw, cap_.count()));
}

std::chrono::milliseconds Backoff::Delay(std::uint32_t attempt) {
  const auto nominal = static_cast<double>(Nominal(attempt).count());
  if (jitter_ratio_ == 0.0) {
    return std::chrono::milliseconds(static_cast<std::int64_t>(nominal));
  }

  std::uniform_real_distribution<double> dist(1.0 - jitter_ratio_, 1.0 + jitter_ratio_);
  double                                 factor;
  {
    std::lock_guard lock(mutex_);
    factor = dist(rng_);
  }
  return std::chrono::milliseconds(static_cast<std::int64_t>(nominal * factor));
}

} // namespace edgesync::connection
