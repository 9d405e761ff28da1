#include "uusid/core/separator.h"

#include <string>

namespace uusid::core {

namespace {

constexpr std::string_view kPatternSpecial = ".^$|?*+()[]{}\\";

}  // namespace

Result<char> parse_separator(const std::string_view text) {
  if (text.size() != 1U) {
    return fail<char>(ErrorKind::kConfiguration,
                      "separator must be exactly one character, got '" + std::string{text} + "'");
  }

  const char ch = text.front();
  if (ch <= ' ' || ch > '~') {
    return fail<char>(ErrorKind::kConfiguration,
                      "separator must be a printable, non-space ASCII character");
  }
  if ((ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z')) {
    return fail<char>(ErrorKind::kConfiguration,
                      std::string{"separator '"} + ch + "' collides with id characters");
  }
  if (kPatternSpecial.find(ch) != std::string_view::npos) {
    return fail<char>(ErrorKind::kConfiguration,
                      std::string{"separator '"} + ch + "' is a pattern-special character");
  }
  if (ch == ':') {
    return fail<char>(ErrorKind::kConfiguration,
                      "separator ':' is reserved for the encryption envelope");
  }

  return Result<char>::ok(ch);
}

}  // namespace uusid::core
