#include "uusid/core/time.h"
#include "uusid/id/canonical_id.h"
#include "uusid/id/formats.h"
#include "uusid/validation/validator.h"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace uusid;
using Catch::Matchers::WithinAbs;

namespace {

std::string id_at(const std::int64_t ms, const std::uint32_t seq) {
  const id::GeneratorIdentity identity{0x0123456789abULL, 0};
  return id::format(id::encode(identity, core::unix_millis_to_ticks(ms), seq));
}

}  // namespace

TEST_CASE("analyze counts duplicates, invalid ids and the time span", "[analyze]") {
  const std::vector<std::string> ids{
      id_at(1000000, 0), id_at(1000000, 1), id_at(1000500, 0), id_at(1002000, 0),
      id_at(1000000, 0),  // duplicate
      "not-an-id",
  };

  const validation::Validator validator;
  const auto result = validator.analyze(ids);

  CHECK(result.total_ids == 6);
  CHECK(result.unique_ids == 5);
  CHECK(result.duplicates == 1);
  CHECK(result.valid_ids == 5);
  CHECK(result.invalid_ids == 1);
  CHECK(result.time_span_ms == 2000);
  CHECK_THAT(result.generation_rate, WithinAbs(2.5, 1e-9));
}

TEST_CASE("analyze with a zero span reports the valid count as the rate", "[analyze]") {
  const validation::Validator validator;
  const auto result = validator.analyze({id_at(5000, 0), id_at(5000, 1), id_at(5000, 2)});
  CHECK(result.time_span_ms == 0);
  CHECK_THAT(result.generation_rate, WithinAbs(3.0, 1e-9));
}

TEST_CASE("analyze of nothing is all zeros", "[analyze]") {
  const validation::Validator validator;
  const auto result = validator.analyze({});
  CHECK(result.total_ids == 0);
  CHECK(result.unique_ids == 0);
  CHECK(result.duplicates == 0);
  CHECK(result.time_span_ms == 0);
  CHECK(result.generation_rate == 0.0);
}

TEST_CASE("analyze reads the batch interchange format", "[analyze]") {
  const std::string file = id_at(1000, 0) + "\n" + id_at(2000, 0) + "\n\n";
  const validation::Validator validator;
  const auto result = validator.analyze(id::parse_id_lines(file));
  CHECK(result.total_ids == 2);
  CHECK(result.valid_ids == 2);
  CHECK(result.time_span_ms == 1000);
}
