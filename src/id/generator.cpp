#include "uusid/id/generator.h"

#include "uusid/core/separator.h"
#include "uusid/core/time.h"
#include "uusid/id/content.h"

#include <algorithm>

namespace uusid::id {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

const GeneratorOptions& checked(const GeneratorOptions& options) {
  const auto ok = validate_options(options);
  if (!ok.has_value()) {
    throw core::UusidException(ok.error());
  }
  return options;
}

GeneratorSnapshot fresh_snapshot(const GeneratorOptions& options) {
  std::optional<std::uint16_t> clock_seq;
  if (options.clock_seq.has_value()) {
    clock_seq = static_cast<std::uint16_t>(options.clock_seq.value());
  }
  return GeneratorSnapshot{make_identity(options.node_id, clock_seq, options.node_source), {}};
}

std::optional<crypto::IdCipher> make_cipher(const GeneratorOptions& options) {
  if (!options.secret_key.has_value()) {
    return std::nullopt;
  }
  auto cipher = crypto::IdCipher::create(options.secret_key.value());
  if (!cipher.has_value()) {
    throw core::UusidException(cipher.error());
  }
  return cipher.value();
}

OutputDecoration make_decoration(const GeneratorOptions& options) {
  if (options.encrypt_output) {
    return EncryptedOutput{};
  }
  if (options.prefix.has_value()) {
    return PrefixedOutput{options.prefix.value()};
  }
  return PlainOutput{};
}

bool has_space_or_colon(const std::string_view text) {
  return std::any_of(text.begin(), text.end(),
                     [](const char ch) { return ch <= ' ' || ch == ':' || ch > '~'; });
}

}  // namespace

core::Result<bool> validate_options(const GeneratorOptions& options) {
  const auto sep = core::parse_separator(options.separator);
  if (!sep.has_value()) {
    return core::Result<bool>::err(sep.error());
  }

  if (options.node_id.has_value() && options.node_id.value() > kNodeMask) {
    return core::fail<bool>(core::ErrorKind::kConfiguration, "node id exceeds 48 bits");
  }
  if (options.clock_seq.has_value() && options.clock_seq.value() > kClockSeqMask) {
    return core::fail<bool>(core::ErrorKind::kConfiguration, "clock sequence exceeds 14 bits");
  }

  if (options.valid_after_ms.has_value() && options.valid_before_ms.has_value() &&
      options.valid_after_ms.value() > options.valid_before_ms.value()) {
    return core::fail<bool>(core::ErrorKind::kConfiguration,
                            "valid_after is later than valid_before");
  }

  if (options.prefix.has_value() &&
      (options.prefix->empty() || has_space_or_colon(options.prefix.value()))) {
    return core::fail<bool>(core::ErrorKind::kConfiguration,
                            "prefix must be non-empty printable text without ':' or spaces");
  }

  if (options.secret_key.has_value() && options.secret_key->empty()) {
    return core::fail<bool>(core::ErrorKind::kEncryptionKeyMissing, "secret key is empty");
  }
  if (options.encrypt_output && !options.secret_key.has_value()) {
    return core::fail<bool>(core::ErrorKind::kEncryptionKeyMissing,
                            "encrypted output requires a secret key");
  }

  return core::Result<bool>::ok(true);
}

validation::ValidatorConfig validator_config(const GeneratorOptions& options) {
  validation::ValidatorConfig config;
  config.separator = options.separator.front();
  config.prefix = options.prefix;
  config.valid_after_ms = options.valid_after_ms;
  config.valid_before_ms = options.valid_before_ms;
  return config;
}

Generator::Generator(const GeneratorOptions& options, core::IClock& clock)
    : Generator(options, clock, fresh_snapshot(checked(options))) {}

Generator::Generator(const GeneratorOptions& options, core::IClock& clock,
                     const GeneratorSnapshot& restored)
    : options_(checked(options)),
      separator_(options_.separator.front()),
      clock_(clock),
      identity_(restored.identity),
      sequencer_(clock, restored.state),
      metrics_(clock.now_unix_millis()),
      validator_(validator_config(options_)),
      cipher_(make_cipher(options_)),
      decoration_(make_decoration(options_)) {
  identity_.node_id &= kNodeMask;
  identity_.clock_seq &= kClockSeqMask;
}

void Generator::check_window(const std::int64_t now_ms) const {
  const bool too_early = options_.valid_after_ms.has_value() && now_ms < *options_.valid_after_ms;
  const bool too_late = options_.valid_before_ms.has_value() && now_ms > *options_.valid_before_ms;
  if (too_early || too_late) {
    throw core::UusidException(
        core::Error{core::ErrorKind::kTimeWindowViolation,
                    "generation at " + core::format_iso8601(now_ms) +
                        " is outside the configured validity window"});
  }
}

CanonicalId Generator::next_id() {
  const std::int64_t now = clock_.now_unix_millis();
  check_window(now);

  const SequencerTick tick = sequencer_.next(identity_);
  metrics_.record(now);
  return encode(identity_, tick.timestamp_ticks, tick.sequence);
}

std::string Generator::decorate(const CanonicalId& id) const {
  std::string canonical = format(id, separator_);
  return std::visit(
      Overloaded{
          [&](const PlainOutput&) { return canonical; },
          [&](const PrefixedOutput& p) { return prefixed(p.prefix, canonical, separator_); },
          [&](const EncryptedOutput&) {
            auto envelope = cipher_->encrypt(canonical, separator_);
            if (!envelope.has_value()) {
              throw core::UusidException(envelope.error());
            }
            return envelope.value();
          },
      },
      decoration_);
}

std::string Generator::generate() {
  return decorate(next_id());
}

std::string Generator::next_canonical() {
  return format(next_id(), separator_);
}

std::string Generator::url_safe() {
  return id::url_safe(format(next_id(), separator_), separator_);
}

std::string Generator::compact() {
  return id::compact(format(next_id(), separator_), separator_);
}

std::string Generator::base32() {
  return base32_encode(next_id().to_bytes());
}

core::Result<std::string> Generator::with_separator(const std::string_view separator) {
  const auto sep = core::parse_separator(separator);
  if (!sep.has_value()) {
    return core::Result<std::string>::err(sep.error());
  }
  return core::Result<std::string>::ok(format(next_id(), sep.value()));
}

std::string Generator::hierarchical(const std::size_t levels) {
  return hierarchical_root(next_id(), levels);
}

std::string Generator::hierarchical_child(const std::string_view parent) {
  return id::hierarchical_child(parent, next_id());
}

HierarchyInfo Generator::parse_hierarchy(const std::string_view hierarchical_id) {
  return id::parse_hierarchy(hierarchical_id);
}

std::vector<std::string> Generator::generate_batch(const std::size_t count) {
  std::vector<std::string> out;
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back(generate());
  }
  return out;
}

std::vector<std::string> Generator::generate_sorted_batch(const std::size_t count) {
  std::vector<CanonicalId> ids;
  ids.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    ids.push_back(next_id());
  }
  std::stable_sort(ids.begin(), ids.end(), [](const CanonicalId& a, const CanonicalId& b) {
    return a.timestamp_ticks() < b.timestamp_ticks();
  });

  std::vector<std::string> out;
  out.reserve(count);
  for (const auto& id : ids) {
    out.push_back(decorate(id));
  }
  return out;
}

core::Result<std::string> Generator::from_content(const std::string_view content,
                                                  const std::string_view content_namespace,
                                                  const std::string_view algorithm) const {
  return id::from_content(content, content_namespace, algorithm, separator_);
}

std::string_view Generator::without_prefix(const std::string_view text) const {
  if (options_.prefix.has_value()) {
    const auto rest = strip_prefix(text, options_.prefix.value(), separator_);
    if (rest.has_value()) {
      return rest.value();
    }
  }
  return text;
}

core::Result<std::string> Generator::encrypt(const std::string_view canonical) const {
  if (!cipher_.has_value()) {
    return core::fail<std::string>(core::ErrorKind::kEncryptionKeyMissing,
                                   "no secret key configured");
  }
  return cipher_->encrypt(without_prefix(canonical), separator_);
}

core::Result<std::string> Generator::encrypt(const std::string_view canonical,
                                             const std::string_view secret) const {
  return crypto::encrypt_id(without_prefix(canonical), secret, separator_);
}

core::Result<std::string> Generator::decrypt(const std::string_view envelope) const {
  if (!cipher_.has_value()) {
    return core::fail<std::string>(core::ErrorKind::kEncryptionKeyMissing,
                                   "no secret key configured");
  }
  return cipher_->decrypt(envelope, separator_);
}

core::Result<std::string> Generator::decrypt(const std::string_view envelope,
                                             const std::string_view secret) const {
  return crypto::decrypt_id(envelope, secret, separator_);
}

core::Result<std::int64_t> Generator::extract_timestamp(const std::string_view text) const {
  return validator_.extract_timestamp(text);
}

validation::ValidationResult Generator::validate(
    const std::string_view text, const validation::ValidationOptions& options) const {
  return validator_.validate(text, options);
}

bool Generator::is_in_time_range(const std::string_view text, const std::int64_t start_ms,
                                 const std::int64_t end_ms) const {
  return validator_.is_in_time_range(text, start_ms, end_ms);
}

MetricsSnapshot Generator::metrics() const {
  return metrics_.snapshot(clock_.now_unix_millis());
}

HealthReport Generator::health_check() {
  HealthReport report;
  report.checked_at_ms = clock_.now_unix_millis();

  try {
    report.last_generated = next_canonical();
  } catch (const core::UusidException& e) {
    report.reason = e.what();
    return report;
  }

  const auto result = validator_.validate(report.last_generated);
  report.healthy = result.valid;
  report.entropy_good = result.entropy >= validation::kLowEntropyThreshold;
  report.reason = result.reason;
  return report;
}

GeneratorSnapshot Generator::snapshot() const {
  return GeneratorSnapshot{identity_, sequencer_.state()};
}

}  // namespace uusid::id
