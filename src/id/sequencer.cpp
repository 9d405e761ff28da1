#include "uusid/id/sequencer.h"

#include "uusid/core/time.h"

#include <thread>

namespace uusid::id {

namespace {

// Sequence bits that do not fit the 14-bit clock-sequence field are carried in the
// sub-millisecond tick digits, so every sequence value of one millisecond stays distinct.
constexpr unsigned kClockSeqBits = 14;

}  // namespace

TimestampSequencer::TimestampSequencer(core::IClock& clock, const SequencerState initial)
    : clock_(clock), state_(initial) {}

SequencerTick TimestampSequencer::next(GeneratorIdentity& identity) {
  std::int64_t now = clock_.now_unix_millis();

  if (ahead_of_clock_) {
    if (now <= state_.last_timestamp_ms) {
      now = state_.last_timestamp_ms;
    } else {
      ahead_of_clock_ = false;
    }
  }

  if (now == state_.last_timestamp_ms) {
    if (state_.sequence < kMaxSequence) {
      ++state_.sequence;
    } else {
      state_.last_timestamp_ms = wait_for_next_millis(state_.last_timestamp_ms);
      state_.sequence = 0;
    }
  } else if (now > state_.last_timestamp_ms) {
    state_.last_timestamp_ms = now;
    state_.sequence = 0;
  } else {
    // Clock moved backwards: a new clock sequence separates the two temporal segments.
    identity.clock_seq = static_cast<std::uint16_t>((identity.clock_seq + 1U) & kClockSeqMask);
    ++regressions_;
    state_.last_timestamp_ms = now;
    state_.sequence = 0;
  }

  SequencerTick tick;
  tick.unix_millis = state_.last_timestamp_ms;
  tick.sequence = state_.sequence;
  tick.timestamp_ticks =
      core::unix_millis_to_ticks(state_.last_timestamp_ms) + (state_.sequence >> kClockSeqBits);
  return tick;
}

std::int64_t TimestampSequencer::wait_for_next_millis(const std::int64_t last_millis) {
  const auto deadline = std::chrono::steady_clock::now() + kOverflowWaitBudget;
  while (std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(kOverflowPollInterval);
    const std::int64_t now = clock_.now_unix_millis();
    if (now > last_millis) {
      return now;
    }
  }

  ahead_of_clock_ = true;
  return last_millis + 1;
}

}  // namespace uusid::id
