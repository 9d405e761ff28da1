#pragma once

#include "uusid/core/clock.h"
#include "uusid/core/result.h"
#include "uusid/crypto/id_cipher.h"
#include "uusid/id/canonical_id.h"
#include "uusid/id/formats.h"
#include "uusid/id/id_generator.h"
#include "uusid/id/identity.h"
#include "uusid/id/metrics.h"
#include "uusid/id/sequencer.h"
#include "uusid/validation/validator.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace uusid::id {

// GeneratorOptions configures one generator instance. Every field has an explicit default;
// validate_options() checks the whole set before any state is created.
struct GeneratorOptions {
  std::optional<std::uint64_t> node_id;         // NOLINT(readability-identifier-naming) 48 bits
  std::optional<std::uint32_t> clock_seq;       // NOLINT(readability-identifier-naming) 14 bits
  std::string separator{"-"};                   // NOLINT(readability-identifier-naming)
  std::optional<std::string> prefix;            // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> valid_after_ms;   // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> valid_before_ms;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> secret_key;        // NOLINT(readability-identifier-naming)
  bool encrypt_output{false};                   // NOLINT(readability-identifier-naming)
  NodeSource node_source{NodeSource::kHardwareThenRandom};  // NOLINT(readability-identifier-naming)
};

// validate_options returns the first problem found:
// - kConfiguration: bad separator, node id over 48 bits, clock seq over 14 bits,
//   valid_after later than valid_before, empty prefix or one containing ':' or whitespace
// - kEncryptionKeyMissing: empty secret key, or encrypt_output without a key
[[nodiscard]] core::Result<bool> validate_options(const GeneratorOptions& options);

// validator_config extracts the parsing-related options for a Validator.
// Expects options that passed validate_options().
[[nodiscard]] validation::ValidatorConfig validator_config(const GeneratorOptions& options);

// Persistable part of a running generator.
struct GeneratorSnapshot {
  GeneratorIdentity identity;  // NOLINT(readability-identifier-naming)
  SequencerState state;        // NOLINT(readability-identifier-naming)
};

struct HealthReport {
  bool healthy{false};          // NOLINT(readability-identifier-naming)
  bool entropy_good{false};     // NOLINT(readability-identifier-naming)
  std::string last_generated;   // NOLINT(readability-identifier-naming)
  std::int64_t checked_at_ms{0};  // NOLINT(readability-identifier-naming)
  std::string reason;           // NOLINT(readability-identifier-naming) empty when healthy
};

// Output decoration applied by generate(), fixed at construction.
struct PlainOutput {};
struct PrefixedOutput {
  std::string prefix;  // NOLINT(readability-identifier-naming)
};
struct EncryptedOutput {};  // uses the configured cipher
using OutputDecoration = std::variant<PlainOutput, PrefixedOutput, EncryptedOutput>;

// Generator owns one identity, its sequencer, its metrics and its decoration.
//
// Not thread-safe: confine an instance to one thread or wrap it in SynchronizedIdGenerator.
// Generation outside [valid_after_ms, valid_before_ms] throws UusidException
// (kTimeWindowViolation) before the sequencer is touched.
class Generator final : public IIdGenerator {
 public:
  // Throws UusidException when validate_options() fails.
  Generator(const GeneratorOptions& options, core::IClock& clock);

  // Resumes a persisted identity and sequencer state; options.node_id and
  // options.clock_seq are ignored.
  Generator(const GeneratorOptions& options, core::IClock& clock,
            const GeneratorSnapshot& restored);

  ~Generator() override = default;

  Generator(const Generator&) = delete;
  Generator& operator=(const Generator&) = delete;
  Generator(Generator&&) = delete;
  Generator& operator=(Generator&&) = delete;

  // ── generation ─────────────────────────────────────────────────────────
  std::string next() override { return generate(); }

  // generate returns one id in the configured decoration.
  [[nodiscard]] std::string generate();

  // next_id returns the raw layout of a fresh id (no decoration).
  [[nodiscard]] CanonicalId next_id();

  [[nodiscard]] std::string next_canonical();
  [[nodiscard]] std::string url_safe();
  [[nodiscard]] std::string compact();
  [[nodiscard]] std::string base32();

  // with_separator renders a fresh id with another separator. The separator is checked
  // first; kConfiguration is returned without generating.
  [[nodiscard]] core::Result<std::string> with_separator(std::string_view separator);

  [[nodiscard]] std::string hierarchical(std::size_t levels = kDefaultHierarchyLevels);
  [[nodiscard]] std::string hierarchical_child(std::string_view parent);
  [[nodiscard]] static HierarchyInfo parse_hierarchy(std::string_view hierarchical_id);

  // Decorated batches. The sorted form orders by embedded timestamp before decorating.
  [[nodiscard]] std::vector<std::string> generate_batch(std::size_t count);
  [[nodiscard]] std::vector<std::string> generate_sorted_batch(std::size_t count);

  [[nodiscard]] core::Result<std::string> from_content(
      std::string_view content, std::string_view content_namespace = "default",
      std::string_view algorithm = "sha256") const;

  // ── encryption ─────────────────────────────────────────────────────────
  // The one-argument forms use the configured key (kEncryptionKeyMissing without one).
  // encrypt takes a canonical id with this generator's separator, optionally carrying the
  // configured prefix, which is dropped; decrypt returns the bare canonical id.
  [[nodiscard]] core::Result<std::string> encrypt(std::string_view canonical) const;
  [[nodiscard]] core::Result<std::string> encrypt(std::string_view canonical,
                                                  std::string_view secret) const;
  [[nodiscard]] core::Result<std::string> decrypt(std::string_view envelope) const;
  [[nodiscard]] core::Result<std::string> decrypt(std::string_view envelope,
                                                  std::string_view secret) const;

  // ── inspection ─────────────────────────────────────────────────────────
  [[nodiscard]] core::Result<std::int64_t> extract_timestamp(std::string_view text) const;
  [[nodiscard]] validation::ValidationResult validate(
      std::string_view text, const validation::ValidationOptions& options = {}) const;
  [[nodiscard]] bool is_in_time_range(std::string_view text, std::int64_t start_ms,
                                      std::int64_t end_ms) const;

  [[nodiscard]] MetricsSnapshot metrics() const;

  // health_check generates and validates one probe id.
  [[nodiscard]] HealthReport health_check();

  [[nodiscard]] GeneratorSnapshot snapshot() const;
  [[nodiscard]] const GeneratorIdentity& identity() const { return identity_; }
  [[nodiscard]] char separator() const { return separator_; }
  [[nodiscard]] std::uint64_t regressions() const { return sequencer_.regressions(); }
  [[nodiscard]] const validation::Validator& validator() const { return validator_; }

 private:
  [[nodiscard]] std::string decorate(const CanonicalId& id) const;
  void check_window(std::int64_t now_ms) const;
  [[nodiscard]] std::string_view without_prefix(std::string_view text) const;

  GeneratorOptions options_;
  char separator_;
  core::IClock& clock_;
  GeneratorIdentity identity_;
  TimestampSequencer sequencer_;
  GenerationMetrics metrics_;
  validation::Validator validator_;
  std::optional<crypto::IdCipher> cipher_;
  OutputDecoration decoration_;
};

}  // namespace uusid::id
