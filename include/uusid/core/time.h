#pragma once

#include <cstdint>
#include <string>

namespace uusid::core {

// Timestamps inside an id are 100 ns ticks counted from the Gregorian reform,
// 1582-10-15T00:00:00Z. The generation clock counts milliseconds from the Unix epoch.
inline constexpr std::int64_t kGregorianToUnixMillis = 12219292800000LL;
inline constexpr std::int64_t kTicksPerMilli = 10000;

// Largest tick value the 60-bit timestamp field can hold.
inline constexpr std::uint64_t kMaxTicks = (std::uint64_t{1} << 60U) - 1U;

[[nodiscard]] constexpr std::uint64_t unix_millis_to_ticks(const std::int64_t unix_millis) {
  return static_cast<std::uint64_t>(unix_millis + kGregorianToUnixMillis) *
         static_cast<std::uint64_t>(kTicksPerMilli);
}

// Exact inverse at millisecond precision: sub-millisecond ticks are truncated.
[[nodiscard]] constexpr std::int64_t ticks_to_unix_millis(const std::uint64_t ticks) {
  return static_cast<std::int64_t>(ticks / static_cast<std::uint64_t>(kTicksPerMilli)) -
         kGregorianToUnixMillis;
}

// format_iso8601 renders Unix milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC).
[[nodiscard]] std::string format_iso8601(std::int64_t unix_millis);

}  // namespace uusid::core
