#pragma once

#include "uusid/core/clock.h"
#include "uusid/id/generator.h"
#include "uusid/id/identity.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace uusid::storage {

// PersistedIdentity is the record kept for one named generator between runs.
struct PersistedIdentity {
  std::string name;                   // NOLINT(readability-identifier-naming)
  std::uint64_t node_id{0};           // NOLINT(readability-identifier-naming)
  std::uint16_t clock_seq{0};         // NOLINT(readability-identifier-naming)
  std::int64_t last_timestamp_ms{0};  // NOLINT(readability-identifier-naming)

  bool operator==(const PersistedIdentity&) const = default;
};

// IIdentityStore persists generator identities by name.
// Implementations overwrite on save(); load() returns nullopt for an unknown name.
class IIdentityStore {
 public:
  virtual ~IIdentityStore() = default;

  virtual void save(const PersistedIdentity& identity) = 0;
  [[nodiscard]] virtual std::optional<PersistedIdentity> load(const std::string& name) const = 0;
  [[nodiscard]] virtual std::vector<PersistedIdentity> list_all() const = 0;

 protected:
  IIdentityStore() = default;
  IIdentityStore(const IIdentityStore&) = default;
  IIdentityStore& operator=(const IIdentityStore&) = default;
  IIdentityStore(IIdentityStore&&) = default;
  IIdentityStore& operator=(IIdentityStore&&) = default;
};

// InMemoryIdentityStore keeps identities in a std::map (sorted by name).
// For tests and single-process use.
class InMemoryIdentityStore final : public IIdentityStore {
 public:
  void save(const PersistedIdentity& identity) override;
  [[nodiscard]] std::optional<PersistedIdentity> load(const std::string& name) const override;
  [[nodiscard]] std::vector<PersistedIdentity> list_all() const override;

 private:
  std::map<std::string, PersistedIdentity> identities_;
};

// restore_identity returns the starting state for the generator called `name`.
//
// - no record:  a fresh identity from the identity sources, empty sequencer state
// - a record:   the stored node id and clock sequence; when the stored last timestamp is
//               not earlier than the clock, the clock sequence is bumped (mod 2^14) because
//               the clock went backwards across the restart or the same millisecond may
//               be reissued
//
// The sequencer state always starts empty: the new process never continues the old
// process's per-millisecond counter.
[[nodiscard]] id::GeneratorSnapshot restore_identity(
    const IIdentityStore& store, const std::string& name, core::IClock& clock,
    id::NodeSource source = id::NodeSource::kHardwareThenRandom);

// persist_identity writes the generator's current identity and last timestamp.
void persist_identity(IIdentityStore& store, const std::string& name,
                      const id::Generator& generator);

}  // namespace uusid::storage
