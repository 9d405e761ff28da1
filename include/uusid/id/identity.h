#pragma once

#include "uusid/core/result.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace uusid::id {

inline constexpr std::uint64_t kNodeMask = 0xFFFFFFFFFFFFULL;
inline constexpr std::uint16_t kClockSeqMask = 0x3FFF;

// Least significant bit of the first node octet. Set on every randomly drawn node id
// so it can never equal a real (unicast) hardware address.
inline constexpr std::uint64_t kMulticastBit = 0x010000000000ULL;

// GeneratorIdentity is owned by exactly one generator instance.
// node_id never changes for the instance lifetime; clock_seq changes only on clock regression.
struct GeneratorIdentity {
  std::uint64_t node_id{0};    // NOLINT(readability-identifier-naming) 48 bits
  std::uint16_t clock_seq{0};  // NOLINT(readability-identifier-naming) 14 bits

  bool operator==(const GeneratorIdentity&) const = default;
};

// Where make_identity takes the node id from when none is supplied.
enum class NodeSource {
  kHardwareThenRandom,
  kRandom,
};

// hardware_node_id returns the link-layer address of the first non-loopback interface
// with a non-zero 6-byte address, or nullopt when none is available.
[[nodiscard]] std::optional<std::uint64_t> hardware_node_id();

// random_node_id draws 48 bits from the CSPRNG with the multicast marker bit set.
[[nodiscard]] std::uint64_t random_node_id();

// random_clock_seq draws 14 bits from the CSPRNG.
[[nodiscard]] std::uint16_t random_clock_seq();

[[nodiscard]] constexpr bool is_random_node(const std::uint64_t node_id) {
  return (node_id & kMulticastBit) != 0U;
}

// parse_node_id accepts 12 hex digits, optionally grouped with ':' or '-'
// (e.g. "aabbccddeeff", "aa:bb:cc:dd:ee:ff"). Case-insensitive.
[[nodiscard]] core::Result<std::uint64_t> parse_node_id(std::string_view text);

// format_node_id renders 12 lower-case hex digits.
[[nodiscard]] std::string format_node_id(std::uint64_t node_id);

// make_identity resolves the identity for a new generator instance.
// Supplied values are masked to their field widths; missing values are drawn from
// the identity sources.
[[nodiscard]] GeneratorIdentity make_identity(std::optional<std::uint64_t> node_id,
                                              std::optional<std::uint16_t> clock_seq,
                                              NodeSource source = NodeSource::kHardwareThenRandom);

}  // namespace uusid::id
