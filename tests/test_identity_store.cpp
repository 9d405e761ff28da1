#include "uusid/core/clock.h"
#include "uusid/id/generator.h"
#include "uusid/id/identity.h"
#include "uusid/storage/identity_store.h"
#include "uusid/storage/sqlite/sqlite_db.h"
#include "uusid/storage/sqlite/sqlite_identity_store.h"

#include <catch2/catch.hpp>

#include <memory>
#include <stdexcept>

using namespace uusid;

namespace {

constexpr std::int64_t kNow = 1700000000000;

std::shared_ptr<storage::sqlite::SqliteDb> open_memory_db() {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema_v1().has_value());
  return db;
}

void check_store_basics(storage::IIdentityStore& store) {
  CHECK_FALSE(store.load("orders").has_value());
  CHECK(store.list_all().empty());

  const storage::PersistedIdentity orders{"orders", 0x0023456789abULL, 0x0100, kNow};
  const storage::PersistedIdentity users{"users", 0x0123456789abULL, 0x3FFF, kNow - 5};
  store.save(users);
  store.save(orders);

  const auto loaded = store.load("orders");
  REQUIRE(loaded.has_value());
  CHECK(loaded.value() == orders);

  auto updated = orders;
  updated.clock_seq = 0x0101;
  updated.last_timestamp_ms = kNow + 10;
  store.save(updated);
  CHECK(store.load("orders").value() == updated);

  const auto all = store.list_all();
  REQUIRE(all.size() == 2);
  CHECK(all[0].name == "orders");
  CHECK(all[1] == users);
}

}  // namespace

TEST_CASE("InMemoryIdentityStore save, load, list", "[storage][identity]") {
  storage::InMemoryIdentityStore store;
  check_store_basics(store);
}

TEST_CASE("SqliteIdentityStore save, load, list", "[storage][identity][sqlite]") {
  storage::sqlite::SqliteIdentityStore store(open_memory_db());
  check_store_basics(store);
}

TEST_CASE("schema setup is repeatable", "[storage][sqlite]") {
  auto fresh = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(fresh.has_value());
  CHECK(fresh.value()->get_schema_version() == 0);

  auto db = open_memory_db();
  CHECK(db->ensure_schema_v1().has_value());
  CHECK(db->get_schema_version() == 1);
}

TEST_CASE("schema rejects out-of-range identity fields", "[storage][sqlite]") {
  storage::sqlite::SqliteIdentityStore store(open_memory_db());
  CHECK_THROWS_AS(store.save({"wide", 0x0023456789abULL, 0xFFFF, kNow}), std::runtime_error);
  CHECK_FALSE(store.load("wide").has_value());
}

TEST_CASE("restore without a record draws a fresh identity", "[storage][restore]") {
  core::ManualClock clock(kNow);
  storage::InMemoryIdentityStore store;

  const auto snap = storage::restore_identity(store, "orders", clock, id::NodeSource::kRandom);
  CHECK(id::is_random_node(snap.identity.node_id));
  CHECK(snap.identity.clock_seq <= id::kClockSeqMask);
  CHECK(snap.state.sequence == 0);
}

TEST_CASE("restore keeps or bumps the clock sequence", "[storage][restore]") {
  core::ManualClock clock(kNow);
  storage::InMemoryIdentityStore store;

  SECTION("stored timestamp in the past keeps the clock sequence") {
    store.save({"orders", 0x0023456789abULL, 0x0100, kNow - 1000});
    const auto snap = storage::restore_identity(store, "orders", clock);
    CHECK(snap.identity.node_id == 0x0023456789abULL);
    CHECK(snap.identity.clock_seq == 0x0100);
  }

  SECTION("stored timestamp ahead of the clock bumps the clock sequence") {
    store.save({"orders", 0x0023456789abULL, 0x0100, kNow + 60000});
    const auto snap = storage::restore_identity(store, "orders", clock);
    CHECK(snap.identity.clock_seq == 0x0101);
  }

  SECTION("the bump wraps at 14 bits") {
    store.save({"orders", 0x0023456789abULL, 0x3FFF, kNow});
    const auto snap = storage::restore_identity(store, "orders", clock);
    CHECK(snap.identity.clock_seq == 0);
  }
}

TEST_CASE("persist then restore continues the same node", "[storage][restore][sqlite]") {
  core::ManualClock clock(kNow);
  storage::sqlite::SqliteIdentityStore store(open_memory_db());

  id::GeneratorOptions options;
  options.node_id = 0x0023456789abULL;
  options.clock_seq = 0x0200;
  id::Generator first(options, clock);
  static_cast<void>(first.generate_batch(10));
  storage::persist_identity(store, "orders", first);

  const auto record = store.load("orders");
  REQUIRE(record.has_value());
  CHECK(record->node_id == 0x0023456789abULL);
  CHECK(record->clock_seq == 0x0200);
  CHECK(record->last_timestamp_ms == kNow);

  // Same millisecond on restart: the clock sequence moves on.
  id::Generator second(id::GeneratorOptions{}, clock,
                       storage::restore_identity(store, "orders", clock));
  CHECK(second.identity().node_id == 0x0023456789abULL);
  CHECK(second.identity().clock_seq == 0x0201);
}
