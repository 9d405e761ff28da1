#include "uusid/storage/sqlite/sqlite_identity_store.h"

#include <sqlite3.h>
#include <stdexcept>
#include <string>

namespace uusid::storage::sqlite {

namespace {

PersistedIdentity read_row(sqlite3_stmt* stmt) {
  PersistedIdentity identity;
  identity.name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));  // NOLINT
  identity.node_id = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 1));
  identity.clock_seq = static_cast<std::uint16_t>(sqlite3_column_int(stmt, 2));
  identity.last_timestamp_ms = sqlite3_column_int64(stmt, 3);
  return identity;
}

}  // namespace

SqliteIdentityStore::SqliteIdentityStore(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

void SqliteIdentityStore::save(const PersistedIdentity& identity) {
  const char* sql = R"(
    INSERT INTO generator_identities (name, node_id, clock_seq, last_timestamp_ms, updated_at)
    VALUES (?, ?, ?, ?, datetime('now'))
    ON CONFLICT(name) DO UPDATE SET
      node_id = excluded.node_id,
      clock_seq = excluded.clock_seq,
      last_timestamp_ms = excluded.last_timestamp_ms,
      updated_at = excluded.updated_at
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("SqliteIdentityStore::save failed to prepare: " + stmt.error());
  }

  sqlite3_bind_text(stmt.get(), 1, identity.name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(identity.node_id));
  sqlite3_bind_int(stmt.get(), 3, identity.clock_seq);
  sqlite3_bind_int64(stmt.get(), 4, identity.last_timestamp_ms);

  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    throw std::runtime_error("SqliteIdentityStore::save failed: " +
                             std::string(sqlite3_errmsg(db_->connection())));
  }
}

std::optional<PersistedIdentity> SqliteIdentityStore::load(const std::string& name) const {
  const char* sql = R"(
    SELECT name, node_id, clock_seq, last_timestamp_ms
    FROM generator_identities WHERE name = ?
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  sqlite3_bind_text(stmt.get(), 1, name.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return read_row(stmt.get());
  }
  return std::nullopt;
}

std::vector<PersistedIdentity> SqliteIdentityStore::list_all() const {
  std::vector<PersistedIdentity> result;

  PreparedStatement stmt(db_->connection(),
                         "SELECT name, node_id, clock_seq, last_timestamp_ms "
                         "FROM generator_identities ORDER BY name");
  if (!stmt.is_valid()) {
    return result;
  }

  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    result.push_back(read_row(stmt.get()));
  }
  return result;
}

}  // namespace uusid::storage::sqlite
