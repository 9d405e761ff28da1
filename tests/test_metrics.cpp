#include "uusid/id/metrics.h"

#include <catch2/catch.hpp>

using namespace uusid;
using Catch::Matchers::WithinRel;

TEST_CASE("fresh metrics report nothing generated", "[metrics]") {
  id::GenerationMetrics metrics(1000);
  const auto snap = metrics.snapshot(1000);
  CHECK(snap.total_generated == 0);
  CHECK(snap.current_rate == 0.0);
  CHECK(snap.peak_rate == 0.0);
  CHECK(snap.average_rate == 0.0);
  CHECK(snap.uptime_ms == 0);
}

TEST_CASE("rates over the trailing window", "[metrics]") {
  id::GenerationMetrics metrics(1000);
  for (int i = 0; i < 5; ++i) {
    metrics.record(1000);
  }

  auto snap = metrics.snapshot(1000);
  CHECK(snap.total_generated == 5);
  CHECK(snap.current_rate == 0.5);
  CHECK(snap.peak_rate == 0.5);
  // Uptime under one second counts as one second.
  CHECK(snap.average_rate == 5.0);

  snap = metrics.snapshot(3000);
  CHECK(snap.uptime_ms == 2000);
  CHECK(snap.average_rate == 2.5);
  CHECK(snap.current_rate == 0.5);
}

TEST_CASE("samples leave the window but the peak is kept", "[metrics]") {
  id::GenerationMetrics metrics(0);
  for (int i = 0; i < 20; ++i) {
    metrics.record(500);
  }
  metrics.record(12000);

  const auto snap = metrics.snapshot(12000);
  CHECK(snap.total_generated == 21);
  CHECK_THAT(snap.current_rate, WithinRel(0.1, 1e-9));
  CHECK_THAT(snap.peak_rate, WithinRel(2.0, 1e-9));
  CHECK_THAT(snap.average_rate, WithinRel(21.0 / 12.0, 1e-9));

  const auto later = metrics.snapshot(30000);
  CHECK(later.current_rate == 0.0);
  CHECK_THAT(later.peak_rate, WithinRel(2.0, 1e-9));
}
