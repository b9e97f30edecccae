#pragma once

#include <chrono>
#include <cstddef>
#include <deque>

namespace edgesync::connection {

/*
  Rolling window over the last N send results.

  quality = success_ratio * latency_factor, latency_factor = 1 while the
  mean latency is at or under the threshold, threshold / mean above it.
  An empty window scores 1.
*/
class LinkQuality {
 public:
  LinkQuality(std::size_t window, std::chrono::milliseconds latency_threshold);

  void Record(bool success, std::chrono::milliseconds latency);
  void Reset();

  double      Quality() const;
  double      FailureRate() const;
  double      MeanLatencyMs() const;
  std::size_t Samples() const {
    return samples_.size();
  }

 private:
  struct Sample {
    bool                      success;
    std::chrono::milliseconds latency;
  };

  std::size_t               window_;
  std::chrono::milliseconds latency_threshold_;
  std::deque<Sample>        samples_;
};

} // namespace edgesync::connection
