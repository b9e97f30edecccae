#include "link_quality.hpp"

#include <algorithm>

namespace edgesync::connection {

LinkQuality::LinkQuality(std::size_t window, std::chrono::milliseconds latency_threshold)
    : window_(std::max<std::size_t>(window, 1)), latency_threshold_(latency_threshold) {
}

void LinkQuality::Record(bool success, std::chrono::milliseconds latency) {
  samples_.push_back(Sample{success, latency});
  while (samples_.size() > window_) {
    samples_.pop_front();
  }
}

void LinkQuality::Reset() {
  samples_.clear();
}

double LinkQuality::FailureRate() const {
  if (samples_.empty()) return 0.0;
  const auto failures = std::count_if(samples_.begin(), samples_.end(), [](const Sample& s) { return !s.success; });
  return static_cast<double>(failures) / static_cast<double>(samples_.size());
}

double LinkQuality::MeanLatencyMs() const {
  if (samples_.empty()) return 0.0;
  double total = 0.0;
  for (const auto& s : samples_) total += static_cast<double>(s.latency.count());
  return total / static_cast<double>(samples_.size());
}

double LinkQuality::Quality() const {
  if (samples_.empty()) return 1.0;

  const double success_ratio = 1.0 - FailureRate();
  const double mean          = MeanLatencyMs();
  const double threshold     = static_cast<double>(latency_threshold_.count());
  const double latency_factor = (mean <= threshold || mean <= 0.0) ? 1.0 : threshold / mean;
  return success_ratio * latency_factor;
}

} // namespace edgesync::connection
