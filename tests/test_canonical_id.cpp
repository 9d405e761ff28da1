#include "uusid/core/random.h"
#include "uusid/core/time.h"
#include "uusid/id/canonical_id.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace uusid;

TEST_CASE("decode recovers every field of a known id", "[canonical]") {
  const auto parsed = id::decode("01928374-5678-1abc-8def-123456789abc");
  REQUIRE(parsed.has_value());
  const auto& cid = parsed.value();

  CHECK(cid.version() == 1);
  CHECK(cid.variant() == 0b10);
  CHECK(cid.node == 0x123456789abcULL);
  CHECK(cid.clock_seq() == 0x0def);
  CHECK(cid.time_low == 0x01928374U);
  CHECK(cid.time_mid == 0x5678);
  CHECK(cid.timestamp_ticks() == 773588309423326068ULL);
  CHECK(cid.timestamp_millis() == 65139538142332LL);
}

TEST_CASE("decode is case-insensitive and format emits lower case", "[canonical]") {
  const auto parsed = id::decode("01928374-5678-1ABC-8DEF-123456789ABC");
  REQUIRE(parsed.has_value());
  CHECK(id::format(parsed.value()) == "01928374-5678-1abc-8def-123456789abc");
}

TEST_CASE("decode rejects malformed text", "[canonical]") {
  SECTION("wrong length") {
    const auto r = id::decode("01928374-5678-1abc-8def-123456789ab");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().kind == core::ErrorKind::kFormat);
  }
  SECTION("separator in the wrong place") {
    CHECK_FALSE(id::is_canonical("0192837-45678-1abc-8def-123456789abc"));
  }
  SECTION("non-hex digit") {
    CHECK_FALSE(id::is_canonical("01928374-5678-1abc-8deg-123456789abc"));
  }
  SECTION("different separator than configured") {
    CHECK_FALSE(id::is_canonical("01928374_5678_1abc_8def_123456789abc"));
    CHECK(id::is_canonical("01928374_5678_1abc_8def_123456789abc", '_'));
  }
}

TEST_CASE("encode stamps version, variant and the combined clock sequence", "[canonical]") {
  const id::GeneratorIdentity identity{0xaabbccddeeffULL, 0x3ffe};
  const std::uint64_t ticks = core::unix_millis_to_ticks(1700000000000);

  const auto first = id::encode(identity, ticks, 0);
  CHECK(first.version() == 1);
  CHECK(first.variant() == 0b10);
  CHECK(first.clock_seq() == 0x3ffe);
  CHECK(first.node == 0xaabbccddeeffULL);
  CHECK(first.timestamp_ticks() == ticks);
  CHECK(first.timestamp_millis() == 1700000000000);

  // clock_seq + sequence wraps inside the 14-bit field.
  const auto third = id::encode(identity, ticks, 2);
  CHECK(third.clock_seq() == 0x0000);
  CHECK(third.variant() == 0b10);
}

TEST_CASE("format and decode are exact inverses", "[canonical]") {
  const id::GeneratorIdentity identity{0x0123456789abULL, 42};
  const auto original = id::encode(identity, core::unix_millis_to_ticks(1234567890123), 7);

  for (const char sep : {'-', '_', '~'}) {
    const std::string text = id::format(original, sep);
    CHECK(text.size() == id::kCanonicalLength);
    const auto back = id::decode(text, sep);
    REQUIRE(back.has_value());
    CHECK(back.value() == original);
  }

  CHECK(id::CanonicalId::from_bytes(original.to_bytes()) == original);
  CHECK(id::compact_hex(original).size() == id::kCompactLength);
}

TEST_CASE("byte and text forms round trip at the field limits", "[canonical]") {
  id::CanonicalId::Bytes zeros{};
  id::CanonicalId::Bytes ones{};
  ones.fill(0xFF);

  std::vector<id::CanonicalId::Bytes> samples = {zeros, ones};
  for (int i = 0; i < 8; ++i) {
    const auto random = core::secure_random_bytes(16);
    id::CanonicalId::Bytes bytes{};
    std::copy(random.begin(), random.end(), bytes.begin());
    samples.push_back(bytes);
  }

  for (const auto& bytes : samples) {
    const auto cid = id::CanonicalId::from_bytes(bytes);
    CHECK(cid.to_bytes() == bytes);
    const auto back = id::decode(id::format(cid));
    REQUIRE(back.has_value());
    CHECK(back.value() == cid);
  }

  const auto top = id::CanonicalId::from_bytes(ones);
  CHECK(top.time_low == 0xFFFFFFFFU);
  CHECK(top.time_mid == 0xFFFF);
  CHECK(top.node == 0xFFFFFFFFFFFFULL);
  CHECK(id::format(top) == "ffffffff-ffff-ffff-ffff-ffffffffffff");
  CHECK(id::format(id::CanonicalId::from_bytes(zeros)) == "00000000-0000-0000-0000-000000000000");
}

TEST_CASE("encode keeps the widest field values", "[canonical]") {
  const id::GeneratorIdentity widest{id::kNodeMask, id::kClockSeqMask};
  const auto cid = id::encode(widest, core::kMaxTicks, 0);
  CHECK(cid.timestamp_ticks() == core::kMaxTicks);
  CHECK(cid.node == id::kNodeMask);
  CHECK(cid.clock_seq() == id::kClockSeqMask);
  CHECK(cid.version() == 1);
  CHECK(cid.variant() == 0b10);

  const auto back = id::decode(id::format(cid, '_'), '_');
  REQUIRE(back.has_value());
  CHECK(back.value() == cid);

  const auto floor = id::encode(id::GeneratorIdentity{0, 0}, 0, 0);
  CHECK(floor.timestamp_ticks() == 0);
  CHECK(id::decode(id::format(floor)).value() == floor);
}
