#include "uusid/storage/identity_store.h"

namespace uusid::storage {

void InMemoryIdentityStore::save(const PersistedIdentity& identity) {
  identities_[identity.name] = identity;
}

std::optional<PersistedIdentity> InMemoryIdentityStore::load(const std::string& name) const {
  auto it = identities_.find(name);
  if (it != identities_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::vector<PersistedIdentity> InMemoryIdentityStore::list_all() const {
  std::vector<PersistedIdentity> result;
  result.reserve(identities_.size());
  for (const auto& [name, identity] : identities_) {
    result.push_back(identity);
  }
  return result;
}

id::GeneratorSnapshot restore_identity(const IIdentityStore& store, const std::string& name,
                                       core::IClock& clock, const id::NodeSource source) {
  const auto record = store.load(name);
  if (!record.has_value()) {
    return id::GeneratorSnapshot{id::make_identity(std::nullopt, std::nullopt, source), {}};
  }

  id::GeneratorIdentity identity;
  identity.node_id = record->node_id & id::kNodeMask;
  identity.clock_seq = static_cast<std::uint16_t>(record->clock_seq & id::kClockSeqMask);
  if (record->last_timestamp_ms >= clock.now_unix_millis()) {
    identity.clock_seq = static_cast<std::uint16_t>((identity.clock_seq + 1U) & id::kClockSeqMask);
  }
  return id::GeneratorSnapshot{identity, {}};
}

void persist_identity(IIdentityStore& store, const std::string& name,
                      const id::Generator& generator) {
  const id::GeneratorSnapshot snap = generator.snapshot();

  PersistedIdentity record;
  record.name = name;
  record.node_id = snap.identity.node_id;
  record.clock_seq = snap.identity.clock_seq;
  record.last_timestamp_ms = snap.state.last_timestamp_ms;
  store.save(record);
}

}  // namespace uusid::storage
