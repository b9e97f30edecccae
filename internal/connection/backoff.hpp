#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace edgesync::connection {

/*
  Exponential backoff: base * 2^(attempt-1), capped, then scaled by a
  uniform factor in [1 - jitter, 1 + jitter].
*/
class Backoff {
 public:
  Backoff(std::chrono::milliseconds base, std::chrono::milliseconds cap, double jitter_ratio, std::uint64_t seed = std::random_device{}());

  // attempt starts at 1
  std::chrono::milliseconds Delay(std::uint32_t attempt);

  // Unjittered delay for the attempt.
  std::chrono::milliseconds Nominal(std::uint32_t attempt) const;

 private:
  std::chrono::milliseconds base_;
  std::chrono::milliseconds cap_;
  double                    jitter_ratio_;

  std::mutex      mutex_;
  std::mt19937_64 rng_;
};

} // namespace edgesync::connection
