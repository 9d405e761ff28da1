#include "uusid/core/clock.h"
#include "uusid/core/time.h"
#include "uusid/id/canonical_id.h"
#include "uusid/id/sequencer.h"

#include <catch2/catch.hpp>

#include <set>

using namespace uusid;

TEST_CASE("sequencer counts within one millisecond", "[sequencer]") {
  core::ManualClock clock(1700000000000);
  id::TimestampSequencer sequencer(clock);
  id::GeneratorIdentity identity{0x123456789abcULL, 100};

  const auto a = sequencer.next(identity);
  const auto b = sequencer.next(identity);
  const auto c = sequencer.next(identity);

  CHECK(a.sequence == 0);
  CHECK(b.sequence == 1);
  CHECK(c.sequence == 2);
  CHECK(a.unix_millis == 1700000000000);
  CHECK(a.timestamp_ticks == core::unix_millis_to_ticks(1700000000000));
  CHECK(identity.clock_seq == 100);
}

TEST_CASE("sequencer resets when the clock advances", "[sequencer]") {
  core::ManualClock clock(1000);
  id::TimestampSequencer sequencer(clock);
  id::GeneratorIdentity identity{1, 0};

  static_cast<void>(sequencer.next(identity));
  static_cast<void>(sequencer.next(identity));
  clock.advance(1);
  const auto tick = sequencer.next(identity);

  CHECK(tick.sequence == 0);
  CHECK(tick.unix_millis == 1001);
  CHECK(sequencer.state().last_timestamp_ms == 1001);
}

TEST_CASE("clock regression bumps the clock sequence", "[sequencer]") {
  core::ManualClock clock(5000);
  id::TimestampSequencer sequencer(clock);
  id::GeneratorIdentity identity{1, id::kClockSeqMask};

  static_cast<void>(sequencer.next(identity));
  clock.set(4000);
  const auto tick = sequencer.next(identity);

  CHECK(identity.clock_seq == 0);  // wrapped modulo 2^14
  CHECK(sequencer.regressions() == 1);
  CHECK(tick.sequence == 0);
  CHECK(tick.unix_millis == 4000);
}

TEST_CASE("frozen clock overflow advances the logical millisecond", "[sequencer]") {
  core::ManualClock clock(2000);
  id::TimestampSequencer sequencer(clock);
  id::GeneratorIdentity identity{0x0123456789abULL, 7};

  std::set<std::pair<std::uint64_t, std::uint16_t>> seen;
  std::uint64_t last_ticks = 0;
  const std::uint32_t total = id::kMaxSequence + 10U;
  for (std::uint32_t i = 0; i < total; ++i) {
    const auto tick = sequencer.next(identity);
    REQUIRE(tick.timestamp_ticks >= last_ticks);
    last_ticks = tick.timestamp_ticks;

    const auto cid = id::encode(identity, tick.timestamp_ticks, tick.sequence);
    seen.emplace(cid.timestamp_ticks(), cid.clock_seq_and_variant);
  }

  CHECK(seen.size() == total);
  CHECK(sequencer.state().last_timestamp_ms == 2001);
  CHECK(sequencer.regressions() == 0);
  CHECK(identity.clock_seq == 7);

  // The clock catching up to the logical time is not a regression.
  clock.set(2001);
  static_cast<void>(sequencer.next(identity));
  CHECK(sequencer.regressions() == 0);
}

TEST_CASE("all sequence values of one millisecond encode distinctly", "[sequencer]") {
  const id::GeneratorIdentity identity{0x0123456789abULL, 0x1fff};
  const std::uint64_t base = core::unix_millis_to_ticks(1700000000000);

  std::set<std::pair<std::uint64_t, std::uint16_t>> seen;
  for (std::uint32_t seq = 0; seq <= id::kMaxSequence; ++seq) {
    const auto cid = id::encode(identity, base + (seq >> 14U), seq);
    seen.emplace(cid.timestamp_ticks(), cid.clock_seq());
    CHECK(cid.timestamp_millis() == 1700000000000);
  }
  CHECK(seen.size() == id::kMaxSequence + 1U);
}
