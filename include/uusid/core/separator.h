#pragma once

#include "uusid/core/result.h"

#include <string_view>

namespace uusid::core {

inline constexpr char kDefaultSeparator = '-';

// parse_separator validates a configured group separator once, at construction time.
//
// Accepts exactly one printable ASCII character that cannot be confused with id content
// or with the other derived forms.
// Rejects (kConfiguration):
// - empty or multi-character input
// - letters and digits (collide with hex groups and base-32 symbols)
// - whitespace and control characters
// - pattern-special characters . ^ $ | ? * + ( ) [ ] { } and backslash
// - ':' (encryption envelope delimiter)
[[nodiscard]] Result<char> parse_separator(std::string_view text);

}  // namespace uusid::core
