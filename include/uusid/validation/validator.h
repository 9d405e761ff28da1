#pragma once

#include "uusid/core/result.h"
#include "uusid/core/separator.h"
#include "uusid/id/canonical_id.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uusid::validation {

// Generation volume at which collision probability is reported.
inline constexpr double kReferenceVolume = 1e6;

// Normalised entropy below which validate() adds a warning.
inline constexpr double kLowEntropyThreshold = 0.7;

// Closed interval of Unix milliseconds.
struct TimeRange {
  std::int64_t start_ms{0};  // NOLINT(readability-identifier-naming)
  std::int64_t end_ms{0};    // NOLINT(readability-identifier-naming)
};

struct ValidationOptions {
  // Reject ids whose version nibble or variant bits differ from the time-based markers.
  // Without strict, mismatches are warnings only (content-addressed ids have neither).
  bool strict{false};                   // NOLINT(readability-identifier-naming)
  std::optional<TimeRange> time_range;  // NOLINT(readability-identifier-naming)
};

// ValidationResult is immutable once returned. reason is empty when valid.
struct ValidationResult {
  bool valid{false};                        // NOLINT(readability-identifier-naming)
  std::string reason;                       // NOLINT(readability-identifier-naming)
  std::optional<unsigned> version;          // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> timestamp_ms;  // NOLINT(readability-identifier-naming)
  double entropy{0.0};                      // NOLINT(readability-identifier-naming)
  double collision_probability{0.0};        // NOLINT(readability-identifier-naming)
  std::vector<std::string> warnings;        // NOLINT(readability-identifier-naming)
  bool window_violation{false};             // NOLINT(readability-identifier-naming)
};

struct AnalysisResult {
  std::size_t total_ids{0};       // NOLINT(readability-identifier-naming)
  std::size_t unique_ids{0};      // NOLINT(readability-identifier-naming)
  std::size_t duplicates{0};      // NOLINT(readability-identifier-naming)
  std::size_t valid_ids{0};       // NOLINT(readability-identifier-naming)
  std::size_t invalid_ids{0};     // NOLINT(readability-identifier-naming)
  std::int64_t time_span_ms{0};   // NOLINT(readability-identifier-naming)
  double generation_rate{0.0};    // NOLINT(readability-identifier-naming) ids per second
};

// ValidatorConfig mirrors the generator options that affect parsing.
struct ValidatorConfig {
  char separator{core::kDefaultSeparator};     // NOLINT(readability-identifier-naming)
  std::optional<std::string> prefix;           // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> valid_after_ms;   // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> valid_before_ms;  // NOLINT(readability-identifier-naming)
};

// hex_entropy is the Shannon entropy of the hex-digit frequencies of text (case-folded,
// non-hex characters ignored), divided by the 4-bit maximum. Range [0, 1].
// A heuristic for spotting degenerate ids, not a measurement of randomness.
[[nodiscard]] double hex_entropy(std::string_view text);

// effective_random_bits counts layout bits not fixed by time or markers: the 14
// clock-sequence bits, plus 47 node bits when the node carries the random marker.
[[nodiscard]] unsigned effective_random_bits(const id::CanonicalId& id);

// collision_probability is the birthday bound k^2 / 2^(b+1), clamped to [0, 1].
[[nodiscard]] double collision_probability(unsigned random_bits,
                                           double volume = kReferenceVolume);

// Validator parses and checks id text without throwing. Every failure is reported in
// the returned ValidationResult so untrusted input can be processed in bulk.
class Validator {
 public:
  explicit Validator(ValidatorConfig config = {});

  [[nodiscard]] ValidationResult validate(std::string_view text,
                                          const ValidationOptions& options = {}) const;

  // extract_timestamp returns the embedded Unix milliseconds (kFormat on bad text).
  [[nodiscard]] core::Result<std::int64_t> extract_timestamp(std::string_view text) const;

  // is_in_time_range is true when text parses and its timestamp lies in [start, end].
  [[nodiscard]] bool is_in_time_range(std::string_view text, std::int64_t start_ms,
                                      std::int64_t end_ms) const;

  [[nodiscard]] AnalysisResult analyze(const std::vector<std::string>& ids) const;

  [[nodiscard]] const ValidatorConfig& config() const { return config_; }

 private:
  [[nodiscard]] core::Result<id::CanonicalId> parse(std::string_view text) const;

  ValidatorConfig config_;
};

}  // namespace uusid::validation
