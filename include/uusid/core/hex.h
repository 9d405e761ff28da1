#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uusid::core {

// Locale-independent ASCII helpers. Emission is always lower-case; parsing
// accepts either case.

[[nodiscard]] constexpr bool is_hex_digit(const char ch) {
  return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');
}

// hex_value maps a hex digit to 0..15; caller guarantees is_hex_digit(ch).
[[nodiscard]] constexpr std::uint8_t hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return static_cast<std::uint8_t>(ch - '0');
  }
  if (ch >= 'a' && ch <= 'f') {
    return static_cast<std::uint8_t>(ch - 'a' + 10);
  }
  return static_cast<std::uint8_t>(ch - 'A' + 10);
}

[[nodiscard]] std::string to_hex(const std::uint8_t* data, std::size_t size);
[[nodiscard]] std::string to_hex(const std::vector<std::uint8_t>& bytes);

// from_hex decodes an even-length hex string; nullopt on odd length or a non-hex digit.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> from_hex(std::string_view hex);

// ascii_lower converts A-Z to a-z and leaves every other byte unchanged.
[[nodiscard]] std::string ascii_lower(std::string_view input);

}  // namespace uusid::core
