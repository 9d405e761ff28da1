#include "uusid/id/metrics.h"

#include <algorithm>

namespace uusid::id {

void GenerationMetrics::record(const std::int64_t now_ms) {
  ++total_;
  samples_.push_back(now_ms);
  prune(now_ms);
  peak_rate_ = std::max(peak_rate_, window_rate(samples_.size()));
}

void GenerationMetrics::prune(const std::int64_t now_ms) {
  const std::int64_t cutoff = now_ms - kRateWindow.count();
  while (!samples_.empty() && samples_.front() <= cutoff) {
    samples_.pop_front();
  }
}

double GenerationMetrics::window_rate(const std::size_t samples) const {
  return static_cast<double>(samples) * 1000.0 / static_cast<double>(kRateWindow.count());
}

MetricsSnapshot GenerationMetrics::snapshot(const std::int64_t now_ms) const {
  MetricsSnapshot snap;
  snap.total_generated = total_;
  snap.uptime_ms = std::max<std::int64_t>(now_ms - started_at_ms_, 0);
  snap.peak_rate = peak_rate_;

  const std::int64_t cutoff = now_ms - kRateWindow.count();
  const auto in_window = std::count_if(samples_.begin(), samples_.end(),
                                       [cutoff](const std::int64_t t) { return t > cutoff; });
  snap.current_rate = window_rate(static_cast<std::size_t>(in_window));

  // Under one second of uptime the average is reported per whole second.
  const std::int64_t elapsed = std::max<std::int64_t>(snap.uptime_ms, 1000);
  snap.average_rate = static_cast<double>(total_) * 1000.0 / static_cast<double>(elapsed);
  return snap;
}

}  // namespace uusid::id
