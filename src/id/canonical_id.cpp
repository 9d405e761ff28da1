#include "uusid/id/canonical_id.h"

#include "uusid/core/hex.h"
#include "uusid/core/time.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>

namespace uusid::id {

std::uint64_t CanonicalId::timestamp_ticks() const {
  return (static_cast<std::uint64_t>(time_hi_and_version & 0x0FFFU) << 48U) |
         (static_cast<std::uint64_t>(time_mid) << 32U) | static_cast<std::uint64_t>(time_low);
}

std::int64_t CanonicalId::timestamp_millis() const {
  return core::ticks_to_unix_millis(timestamp_ticks());
}

CanonicalId::Bytes CanonicalId::to_bytes() const {
  Bytes b{};
  b[0] = static_cast<std::uint8_t>(time_low >> 24U);
  b[1] = static_cast<std::uint8_t>(time_low >> 16U);
  b[2] = static_cast<std::uint8_t>(time_low >> 8U);
  b[3] = static_cast<std::uint8_t>(time_low);
  b[4] = static_cast<std::uint8_t>(time_mid >> 8U);
  b[5] = static_cast<std::uint8_t>(time_mid);
  b[6] = static_cast<std::uint8_t>(time_hi_and_version >> 8U);
  b[7] = static_cast<std::uint8_t>(time_hi_and_version);
  b[8] = static_cast<std::uint8_t>(clock_seq_and_variant >> 8U);
  b[9] = static_cast<std::uint8_t>(clock_seq_and_variant);
  for (unsigned i = 0; i < 6U; ++i) {
    b[10U + i] = static_cast<std::uint8_t>(node >> ((5U - i) * 8U));
  }
  return b;
}

CanonicalId CanonicalId::from_bytes(const Bytes& b) {
  CanonicalId id;
  id.time_low = (static_cast<std::uint32_t>(b[0]) << 24U) |
                (static_cast<std::uint32_t>(b[1]) << 16U) |
                (static_cast<std::uint32_t>(b[2]) << 8U) | static_cast<std::uint32_t>(b[3]);
  id.time_mid = static_cast<std::uint16_t>((b[4] << 8U) | b[5]);
  id.time_hi_and_version = static_cast<std::uint16_t>((b[6] << 8U) | b[7]);
  id.clock_seq_and_variant = static_cast<std::uint16_t>((b[8] << 8U) | b[9]);
  for (unsigned i = 0; i < 6U; ++i) {
    id.node = (id.node << 8U) | b[10U + i];
  }
  return id;
}

CanonicalId encode(const GeneratorIdentity& identity, const std::uint64_t timestamp_ticks,
                   const std::uint32_t sequence) {
  const std::uint64_t ticks = timestamp_ticks & core::kMaxTicks;
  const auto clock_seq_with_seq =
      static_cast<std::uint16_t>((identity.clock_seq + sequence) & 0xFFFFU);

  CanonicalId id;
  id.time_low = static_cast<std::uint32_t>(ticks & 0xFFFFFFFFU);
  id.time_mid = static_cast<std::uint16_t>((ticks >> 32U) & 0xFFFFU);
  id.time_hi_and_version = static_cast<std::uint16_t>(((ticks >> 48U) & 0x0FFFU) | kVersionBits);
  id.clock_seq_and_variant =
      static_cast<std::uint16_t>((clock_seq_with_seq & kClockSeqMask) | kVariantBits);
  id.node = identity.node_id & kNodeMask;
  return id;
}

std::string format(const CanonicalId& id, const char separator) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0')
      << std::setw(8) << id.time_low << separator
      << std::setw(4) << id.time_mid << separator
      << std::setw(4) << id.time_hi_and_version << separator
      << std::setw(4) << id.clock_seq_and_variant << separator
      << std::setw(12) << (id.node & kNodeMask);
  return oss.str();
}

std::string compact_hex(const CanonicalId& id) {
  const auto bytes = id.to_bytes();
  return core::to_hex(bytes.data(), bytes.size());
}

core::Result<CanonicalId> decode(const std::string_view text, const char separator) {
  if (text.size() != kCanonicalLength) {
    return core::fail<CanonicalId>(core::ErrorKind::kFormat,
                                   "expected " + std::to_string(kCanonicalLength) +
                                       " characters, got " + std::to_string(text.size()));
  }

  std::string hex;
  hex.reserve(kCompactLength);
  std::size_t pos = 0;
  for (std::size_t group = 0; group < kGroupWidths.size(); ++group) {
    if (group > 0) {
      if (text[pos] != separator) {
        return core::fail<CanonicalId>(
            core::ErrorKind::kFormat,
            "expected separator '" + std::string(1, separator) + "' at offset " +
                std::to_string(pos));
      }
      ++pos;
    }
    for (std::size_t i = 0; i < kGroupWidths[group]; ++i, ++pos) {
      if (!core::is_hex_digit(text[pos])) {
        return core::fail<CanonicalId>(core::ErrorKind::kFormat,
                                       "non-hex character at offset " + std::to_string(pos));
      }
      hex.push_back(text[pos]);
    }
  }

  const auto raw = core::from_hex(hex);
  CanonicalId::Bytes bytes{};
  std::copy(raw->begin(), raw->end(), bytes.begin());
  return core::Result<CanonicalId>::ok(CanonicalId::from_bytes(bytes));
}

bool is_canonical(const std::string_view text, const char separator) {
  return decode(text, separator).has_value();
}

}  // namespace uusid::id
