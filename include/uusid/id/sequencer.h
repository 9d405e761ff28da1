#pragma once

#include "uusid/core/clock.h"
#include "uusid/id/identity.h"

#include <chrono>
#include <cstdint>
#include <limits>

namespace uusid::id {

// Highest per-millisecond sequence value before the sequencer waits for the next tick.
inline constexpr std::uint32_t kMaxSequence = 0xFFFF;

// SequencerState is the mutable part of a generator. It is never shared between
// instances; an instance used from several threads must be externally serialised.
struct SequencerState {
  std::int64_t last_timestamp_ms{  // NOLINT(readability-identifier-naming)
                                 std::numeric_limits<std::int64_t>::min()};
  std::uint32_t sequence{0};  // NOLINT(readability-identifier-naming)
};

// One (timestamp, sequence) pair handed to the encoder.
struct SequencerTick {
  std::uint64_t timestamp_ticks{0};  // NOLINT(readability-identifier-naming)
  std::uint32_t sequence{0};         // NOLINT(readability-identifier-naming)
  std::int64_t unix_millis{0};       // NOLINT(readability-identifier-naming)
};

// TimestampSequencer produces a monotonically non-decreasing (timestamp, sequence) stream.
//
// Per call, comparing the clock against the last recorded millisecond:
// - equal:   sequence + 1; past kMaxSequence, wait for the next millisecond, then reset
// - greater: reset sequence, record the new millisecond
// - less:    clock regression; bump identity.clock_seq (mod 2^14), reset sequence
//
// The overflow wait sleeps in short slices and re-reads the clock. It is bounded by
// kOverflowWaitBudget: a clock that does not move within the budget is treated as frozen
// and the sequencer advances its own millisecond, running ahead of the clock until the
// clock catches up.
//
// Not thread-safe.
class TimestampSequencer {
 public:
  static constexpr std::chrono::microseconds kOverflowPollInterval{50};
  static constexpr std::chrono::milliseconds kOverflowWaitBudget{5};

  explicit TimestampSequencer(core::IClock& clock, SequencerState initial = {});

  [[nodiscard]] SequencerTick next(GeneratorIdentity& identity);

  [[nodiscard]] const SequencerState& state() const { return state_; }

  // Number of clock regressions observed over the instance lifetime.
  [[nodiscard]] std::uint64_t regressions() const { return regressions_; }

 private:
  std::int64_t wait_for_next_millis(std::int64_t last_millis);

  core::IClock& clock_;
  SequencerState state_;
  std::uint64_t regressions_{0};
  bool ahead_of_clock_{false};
};

}  // namespace uusid::id
