#pragma once

#include <chrono>
#include <cstdint>
#include <deque>

namespace uusid::id {

struct MetricsSnapshot {
  std::uint64_t total_generated{0};  // NOLINT(readability-identifier-naming)
  double average_rate{0.0};          // NOLINT(readability-identifier-naming) ids/s since start
  double current_rate{0.0};          // NOLINT(readability-identifier-naming) ids/s, trailing window
  double peak_rate{0.0};             // NOLINT(readability-identifier-naming)
  std::int64_t uptime_ms{0};         // NOLINT(readability-identifier-naming)
};

// GenerationMetrics counts generation calls of one generator instance.
// Samples older than kRateWindow are pruned on every record(), so memory stays
// proportional to the trailing-window throughput. Not thread-safe.
class GenerationMetrics {
 public:
  static constexpr std::chrono::milliseconds kRateWindow{10000};

  explicit GenerationMetrics(std::int64_t started_at_ms) : started_at_ms_(started_at_ms) {}

  void record(std::int64_t now_ms);

  [[nodiscard]] MetricsSnapshot snapshot(std::int64_t now_ms) const;

 private:
  void prune(std::int64_t now_ms);
  [[nodiscard]] double window_rate(std::size_t samples) const;

  std::int64_t started_at_ms_;
  std::uint64_t total_{0};
  std::deque<std::int64_t> samples_;
  double peak_rate_{0.0};
};

}  // namespace uusid::id
