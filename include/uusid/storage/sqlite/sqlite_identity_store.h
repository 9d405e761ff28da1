#pragma once

#include "uusid/storage/identity_store.h"
#include "uusid/storage/sqlite/sqlite_db.h"

#include <memory>

namespace uusid::storage::sqlite {

// SqliteIdentityStore persists PersistedIdentity records to the generator_identities
// table (schema v1). save() is an upsert keyed by name.
//
// Failures to prepare or step a write throw std::runtime_error; a failed read is
// reported as "no record".
class SqliteIdentityStore final : public IIdentityStore {
 public:
  explicit SqliteIdentityStore(std::shared_ptr<SqliteDb> db);

  void save(const PersistedIdentity& identity) override;
  [[nodiscard]] std::optional<PersistedIdentity> load(const std::string& name) const override;
  [[nodiscard]] std::vector<PersistedIdentity> list_all() const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace uusid::storage::sqlite
