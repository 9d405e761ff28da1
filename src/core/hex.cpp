#include "uusid/core/hex.h"

namespace uusid::core {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

}  // namespace

std::string to_hex(const std::uint8_t* data, const std::size_t size) {
  std::string out;
  out.reserve(size * 2U);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHexDigits[data[i] >> 4U]);
    out.push_back(kHexDigits[data[i] & 0x0FU]);
  }
  return out;
}

std::string to_hex(const std::vector<std::uint8_t>& bytes) {
  return to_hex(bytes.data(), bytes.size());
}

std::optional<std::vector<std::uint8_t>> from_hex(const std::string_view hex) {
  if (hex.size() % 2U != 0U) {
    return std::nullopt;
  }

  std::vector<std::uint8_t> out;
  out.reserve(hex.size() / 2U);
  for (std::size_t i = 0; i < hex.size(); i += 2U) {
    if (!is_hex_digit(hex[i]) || !is_hex_digit(hex[i + 1U])) {
      return std::nullopt;
    }
    out.push_back(static_cast<std::uint8_t>((hex_value(hex[i]) << 4U) | hex_value(hex[i + 1U])));
  }
  return out;
}

std::string ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

}  // namespace uusid::core
