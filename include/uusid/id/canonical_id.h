#pragma once

#include "uusid/core/result.h"
#include "uusid/core/separator.h"
#include "uusid/id/identity.h"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace uusid::id {

// Fixed markers of every time-based id.
inline constexpr std::uint16_t kVersionMask = 0xF000;
inline constexpr std::uint16_t kVersionBits = 0x1000;  // version nibble 1
inline constexpr std::uint16_t kVariantMask = 0xC000;
inline constexpr std::uint16_t kVariantBits = 0x8000;  // variant bits 10

// Text length of the canonical form: 32 hex digits and 4 separators.
inline constexpr std::size_t kCanonicalLength = 36;
inline constexpr std::size_t kCompactLength = 32;

// Group widths of the text form (8,4,4,4,12).
inline constexpr std::array<std::size_t, 5> kGroupWidths = {8, 4, 4, 4, 12};

// CanonicalId is the 128-bit layout, field by field, most significant first:
//
//   time_low(32) | time_mid(16) | time_hi_and_version(16) | clock_seq_and_variant(16) | node(48)
//
// The byte form is big-endian in that order. Values built by decode() or from_bytes()
// carry whatever markers the input had; only encode() guarantees version 1 / variant 10.
struct CanonicalId {
  using Bytes = std::array<std::uint8_t, 16>;

  std::uint32_t time_low{0};               // NOLINT(readability-identifier-naming)
  std::uint16_t time_mid{0};               // NOLINT(readability-identifier-naming)
  std::uint16_t time_hi_and_version{0};    // NOLINT(readability-identifier-naming)
  std::uint16_t clock_seq_and_variant{0};  // NOLINT(readability-identifier-naming)
  std::uint64_t node{0};                   // NOLINT(readability-identifier-naming) 48 bits

  bool operator==(const CanonicalId&) const = default;

  [[nodiscard]] unsigned version() const { return time_hi_and_version >> 12U; }

  // Top two bits of the clock-sequence high byte.
  [[nodiscard]] unsigned variant() const { return clock_seq_and_variant >> 14U; }

  // 60-bit timestamp in 100 ns ticks since 1582-10-15.
  [[nodiscard]] std::uint64_t timestamp_ticks() const;

  [[nodiscard]] std::int64_t timestamp_millis() const;

  // Clock sequence composite (clock_seq + sequence, low 14 bits). The two addends
  // cannot be separated again.
  [[nodiscard]] std::uint16_t clock_seq() const { return clock_seq_and_variant & kClockSeqMask; }

  [[nodiscard]] Bytes to_bytes() const;
  [[nodiscard]] static CanonicalId from_bytes(const Bytes& bytes);
};

// encode packs a sequencer tick and the instance identity into the layout.
// The sequence is added to the clock sequence modulo 2^16 before the variant marker
// replaces the top two bits.
[[nodiscard]] CanonicalId encode(const GeneratorIdentity& identity, std::uint64_t timestamp_ticks,
                                 std::uint32_t sequence);

// format renders five lower-case hex groups joined by separator.
[[nodiscard]] std::string format(const CanonicalId& id,
                                 char separator = core::kDefaultSeparator);

// compact_hex renders the 32 hex digits without separators.
[[nodiscard]] std::string compact_hex(const CanonicalId& id);

// decode parses the five-group text form. Case-insensitive.
// Returns kFormat when the length, a separator position or a hex digit is wrong.
[[nodiscard]] core::Result<CanonicalId> decode(std::string_view text,
                                               char separator = core::kDefaultSeparator);

// is_canonical reports whether decode() would succeed.
[[nodiscard]] bool is_canonical(std::string_view text, char separator = core::kDefaultSeparator);

}  // namespace uusid::id
