#include "uusid/validation/validator.h"

#include "uusid/core/hex.h"
#include "uusid/core/time.h"
#include "uusid/core/version.h"
#include "uusid/id/formats.h"
#include "uusid/id/identity.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace uusid::validation {

namespace {

constexpr unsigned kClockSeqRandomBits = 14;
constexpr unsigned kRandomNodeBits = 47;  // 48 minus the marker bit
constexpr unsigned kTimeBasedVariant = 0b10;

std::string window_reason(const std::int64_t ts) {
  return "timestamp " + core::format_iso8601(ts) + " is outside the validity window";
}

}  // namespace

double hex_entropy(const std::string_view text) {
  std::array<std::size_t, 16> counts{};
  std::size_t total = 0;
  for (const char ch : text) {
    if (core::is_hex_digit(ch)) {
      ++counts[core::hex_value(ch)];
      ++total;
    }
  }
  if (total == 0) {
    return 0.0;
  }

  double entropy = 0.0;
  for (const std::size_t count : counts) {
    if (count == 0) {
      continue;
    }
    const double p = static_cast<double>(count) / static_cast<double>(total);
    entropy -= p * std::log2(p);
  }
  return entropy / 4.0;
}

unsigned effective_random_bits(const id::CanonicalId& id) {
  return kClockSeqRandomBits + (id::is_random_node(id.node) ? kRandomNodeBits : 0U);
}

double collision_probability(const unsigned random_bits, const double volume) {
  const double p = std::ldexp(volume * volume, -static_cast<int>(random_bits + 1U));
  return std::clamp(p, 0.0, 1.0);
}

Validator::Validator(ValidatorConfig config) : config_(std::move(config)) {}

core::Result<id::CanonicalId> Validator::parse(std::string_view text) const {
  if (config_.prefix.has_value()) {
    const auto rest = id::strip_prefix(text, config_.prefix.value(), config_.separator);
    if (rest.has_value()) {
      text = rest.value();
    }
  }
  return id::decode(text, config_.separator);
}

ValidationResult Validator::validate(const std::string_view text,
                                     const ValidationOptions& options) const {
  ValidationResult result;

  const auto parsed = parse(text);
  if (!parsed.has_value()) {
    result.reason = parsed.error().message;
    return result;
  }
  const id::CanonicalId& cid = parsed.value();

  result.version = cid.version();
  result.timestamp_ms = cid.timestamp_millis();
  result.entropy = hex_entropy(id::compact_hex(cid));
  result.collision_probability = collision_probability(effective_random_bits(cid));
  result.valid = true;

  if (cid.version() != core::kFormatVersion) {
    result.warnings.push_back("version nibble " + std::to_string(cid.version()) +
                              " is not the time-based version " +
                              std::to_string(core::kFormatVersion));
  }
  if (cid.variant() != kTimeBasedVariant) {
    result.warnings.push_back("variant bits are not 10");
  }
  if (options.strict && !result.warnings.empty()) {
    result.valid = false;
    result.reason = result.warnings.front();
  }

  if (result.entropy < kLowEntropyThreshold) {
    result.warnings.emplace_back("low character entropy (heuristic)");
  }

  const std::int64_t ts = result.timestamp_ms.value();
  std::int64_t lower = std::numeric_limits<std::int64_t>::min();
  std::int64_t upper = std::numeric_limits<std::int64_t>::max();
  if (config_.valid_after_ms.has_value()) {
    lower = config_.valid_after_ms.value();
  }
  if (config_.valid_before_ms.has_value()) {
    upper = config_.valid_before_ms.value();
  }
  if (options.time_range.has_value()) {
    lower = std::max(lower, options.time_range->start_ms);
    upper = std::min(upper, options.time_range->end_ms);
  }

  if (ts < lower || ts > upper) {
    result.window_violation = true;
    result.warnings.push_back(window_reason(ts));
    if (result.valid) {
      result.valid = false;
      result.reason = window_reason(ts);
    }
  }

  return result;
}

core::Result<std::int64_t> Validator::extract_timestamp(const std::string_view text) const {
  const auto parsed = parse(text);
  if (!parsed.has_value()) {
    return core::Result<std::int64_t>::err(parsed.error());
  }
  return core::Result<std::int64_t>::ok(parsed.value().timestamp_millis());
}

bool Validator::is_in_time_range(const std::string_view text, const std::int64_t start_ms,
                                 const std::int64_t end_ms) const {
  const auto ts = extract_timestamp(text);
  return ts.has_value() && ts.value() >= start_ms && ts.value() <= end_ms;
}

AnalysisResult Validator::analyze(const std::vector<std::string>& ids) const {
  AnalysisResult result;
  result.total_ids = ids.size();

  std::unordered_set<std::string> seen;
  seen.reserve(ids.size());
  std::int64_t earliest = std::numeric_limits<std::int64_t>::max();
  std::int64_t latest = std::numeric_limits<std::int64_t>::min();

  for (const auto& text : ids) {
    seen.insert(text);

    const auto parsed = parse(text);
    if (!parsed.has_value()) {
      ++result.invalid_ids;
      continue;
    }
    ++result.valid_ids;
    const std::int64_t ts = parsed.value().timestamp_millis();
    earliest = std::min(earliest, ts);
    latest = std::max(latest, ts);
  }

  result.unique_ids = seen.size();
  result.duplicates = result.total_ids - result.unique_ids;

  if (result.valid_ids > 0) {
    result.time_span_ms = latest - earliest;
    result.generation_rate =
        result.time_span_ms > 0
            ? static_cast<double>(result.valid_ids) * 1000.0 /
                  static_cast<double>(result.time_span_ms)
            : static_cast<double>(result.valid_ids);
  }

  return result;
}

}  // namespace uusid::validation
