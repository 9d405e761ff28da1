#include "uusid/core/clock.h"
#include "uusid/core/hex.h"
#include "uusid/core/random.h"
#include "uusid/core/result.h"
#include "uusid/core/separator.h"
#include "uusid/core/time.h"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace uusid;

TEST_CASE("parse_separator accepts punctuation and rejects the rest", "[core][separator]") {
  SECTION("accepted") {
    for (const char* ok : {"-", "_", "~", "#", "@", "!", "/", "%", "&", "=", ","}) {
      const auto sep = core::parse_separator(ok);
      REQUIRE(sep.has_value());
      CHECK(sep.value() == ok[0]);
    }
  }

  SECTION("rejected") {
    for (const char* bad : {"", "--", "a", "Z", "7", " ", "\t", ".", "*", "+", "?", "(", ")",
                            "[", "]", "{", "}", "^", "$", "|", "\\", ":"}) {
      const auto sep = core::parse_separator(bad);
      REQUIRE_FALSE(sep.has_value());
      CHECK(sep.error().kind == core::ErrorKind::kConfiguration);
    }
  }
}

TEST_CASE("hex helpers", "[core][hex]") {
  const std::vector<std::uint8_t> bytes{0x00, 0x7f, 0xab, 0xff};
  CHECK(core::to_hex(bytes) == "007fabff");

  const auto decoded = core::from_hex("007FabFF");
  REQUIRE(decoded.has_value());
  CHECK(decoded.value() == bytes);

  CHECK_FALSE(core::from_hex("abc").has_value());
  CHECK_FALSE(core::from_hex("zz").has_value());
  CHECK(core::ascii_lower("AbC-12") == "abc-12");
}

TEST_CASE("Gregorian tick conversion", "[core][time]") {
  CHECK(core::unix_millis_to_ticks(0) == 122192928000000000ULL);
  CHECK(core::ticks_to_unix_millis(122192928000000000ULL) == 0);

  const std::int64_t ms = 1700000000123;
  CHECK(core::ticks_to_unix_millis(core::unix_millis_to_ticks(ms)) == ms);
  // Sub-millisecond ticks truncate.
  CHECK(core::ticks_to_unix_millis(core::unix_millis_to_ticks(ms) + 9999) == ms);
}

TEST_CASE("format_iso8601 renders UTC with milliseconds", "[core][time]") {
  CHECK(core::format_iso8601(0) == "1970-01-01T00:00:00.000Z");
  CHECK(core::format_iso8601(1700000000123) == "2023-11-14T22:13:20.123Z");
  CHECK(core::format_iso8601(-1) == "1969-12-31T23:59:59.999Z");
}

TEST_CASE("ManualClock moves only when told", "[core][clock]") {
  core::ManualClock clock(1000);
  CHECK(clock.now_unix_millis() == 1000);
  clock.advance(5);
  CHECK(clock.now_unix_millis() == 1005);
  clock.set(10);
  CHECK(clock.now_unix_millis() == 10);
}

TEST_CASE("secure_random_bytes returns the requested length", "[core][random]") {
  CHECK(core::secure_random_bytes(0).empty());
  const auto a = core::secure_random_bytes(32);
  const auto b = core::secure_random_bytes(32);
  REQUIRE(a.size() == 32);
  CHECK(a != b);
}

TEST_CASE("UusidException carries the error kind", "[core][result]") {
  const core::UusidException e(core::Error{core::ErrorKind::kTimeWindowViolation, "late"});
  CHECK(e.kind() == core::ErrorKind::kTimeWindowViolation);
  CHECK(std::string(e.what()) == "late");
  CHECK(std::string(core::error_kind_name(e.kind())) == "TimeWindowViolation");
}
