#include "uusid/core/clock.h"
#include "uusid/core/result.h"
#include "uusid/id/canonical_id.h"
#include "uusid/id/identity.h"
#include "uusid/pool/worker_pool.h"

#include <catch2/catch.hpp>

#include <set>
#include <string>
#include <unordered_set>

using namespace uusid;

TEST_CASE("pool returns exactly the requested number of distinct ids", "[pool]") {
  core::SystemClock clock;
  pool::WorkerPool workers(pool::PoolOptions{3, 1000}, id::GeneratorOptions{}, clock);
  REQUIRE(workers.worker_count() == 3);

  const auto ids = workers.generate_batch(2500);
  REQUIRE(ids.size() == 2500);
  CHECK(std::unordered_set<std::string>(ids.begin(), ids.end()).size() == 2500);
  for (const auto& text : ids) {
    CHECK(id::is_canonical(text));
  }
}

TEST_CASE("every worker has its own random node", "[pool]") {
  core::SystemClock clock;
  id::GeneratorOptions options;
  options.node_id = 0x0023456789abULL;
  pool::WorkerPool workers(pool::PoolOptions{4, 10}, options, clock);

  std::set<std::uint64_t> nodes;
  for (std::size_t i = 0; i < workers.worker_count(); ++i) {
    const auto node = workers.worker(i).identity().node_id;
    CHECK(id::is_random_node(node));
    CHECK(node != 0x0023456789abULL);
    nodes.insert(node);
  }
  CHECK(nodes.size() == 4);
}

TEST_CASE("small and empty pool batches", "[pool]") {
  core::SystemClock clock;
  pool::WorkerPool workers(pool::PoolOptions{4, 100}, id::GeneratorOptions{}, clock);

  CHECK(workers.generate_batch(0).empty());

  // Fewer chunks than workers.
  const auto ids = workers.generate_batch(150);
  CHECK(ids.size() == 150);
  CHECK(std::unordered_set<std::string>(ids.begin(), ids.end()).size() == 150);
}

TEST_CASE("pool keeps the template decoration", "[pool]") {
  core::SystemClock clock;
  id::GeneratorOptions options;
  options.prefix = "ord";
  pool::WorkerPool workers(pool::PoolOptions{2, 5}, options, clock);

  for (const auto& text : workers.generate_batch(12)) {
    CHECK(text.rfind("ord-", 0) == 0);
  }
}

TEST_CASE("pool rejects bad options", "[pool][config]") {
  core::SystemClock clock;

  try {
    pool::WorkerPool workers(pool::PoolOptions{0, 10}, id::GeneratorOptions{}, clock);
    FAIL("expected zero workers to be rejected");
  } catch (const core::UusidException& e) {
    CHECK(e.kind() == core::ErrorKind::kConfiguration);
  }

  try {
    pool::WorkerPool workers(pool::PoolOptions{2, 0}, id::GeneratorOptions{}, clock);
    FAIL("expected a zero batch size to be rejected");
  } catch (const core::UusidException& e) {
    CHECK(e.kind() == core::ErrorKind::kConfiguration);
  }

  id::GeneratorOptions bad;
  bad.separator = "--";
  CHECK_THROWS_AS(pool::WorkerPool(pool::PoolOptions{}, bad, clock), core::UusidException);
}

TEST_CASE("pool output keeps chunk order", "[pool]") {
  core::SystemClock clock;
  pool::WorkerPool workers(pool::PoolOptions{2, 3}, id::GeneratorOptions{}, clock);

  // Chunks of 3, 3, 3, 1 dealt round-robin: worker 0, 1, 0, 1.
  const auto ids = workers.generate_batch(10);
  REQUIRE(ids.size() == 10);

  for (std::size_t i = 0; i < ids.size(); ++i) {
    const std::size_t chunk = i / 3;
    const auto cid = id::decode(ids[i]);
    REQUIRE(cid.has_value());
    CHECK(cid.value().node == workers.worker(chunk % 2).identity().node_id);
  }
  CHECK(workers.worker(0).metrics().total_generated == 6);
  CHECK(workers.worker(1).metrics().total_generated == 4);
}
