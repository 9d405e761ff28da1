#pragma once

#include "uusid/core/result.h"
#include "uusid/core/separator.h"
#include "uusid/id/canonical_id.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uusid::id {

// Symbols of the base-32 form: 'A'-'Z' then '2'-'7'. 128 bits encode to 26 symbols.
inline constexpr std::string_view kBase32Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
inline constexpr std::size_t kBase32Length = 26;

inline constexpr std::size_t kDefaultHierarchyLevels = 3;
inline constexpr std::size_t kHierarchyChildSegmentLength = 10;
inline constexpr char kHierarchySeparator = '.';

// ── separator-free forms ───────────────────────────────────────────────────

// compact removes every occurrence of separator, leaving case unchanged.
[[nodiscard]] std::string compact(std::string_view canonical,
                                  char separator = core::kDefaultSeparator);

// url_safe is compact() folded to lower case.
[[nodiscard]] std::string url_safe(std::string_view canonical,
                                   char separator = core::kDefaultSeparator);

// expand_compact re-inserts separators at the (8,4,4,4) boundaries.
// Returns kFormat unless the input is exactly 32 hex digits.
[[nodiscard]] core::Result<std::string> expand_compact(std::string_view compact_text,
                                                       char separator = core::kDefaultSeparator);

// ── base-32 ────────────────────────────────────────────────────────────────

// base32_encode consumes the 16 bytes as a bit stream, 5 bits per symbol, most significant
// first. The last symbol is padded with zero bits; no '=' padding is emitted.
[[nodiscard]] std::string base32_encode(const CanonicalId::Bytes& bytes);

// base32_decode is the exact inverse for 26-symbol input (case-insensitive).
// Returns kFormat on a wrong length, a symbol outside the alphabet, or non-zero pad bits.
[[nodiscard]] core::Result<CanonicalId::Bytes> base32_decode(std::string_view text);

// ── hierarchical ───────────────────────────────────────────────────────────

// HierarchyInfo describes a parsed hierarchical id.
// depth counts segments beyond the root levels; parent drops the last segment and
// grand_parent the last two. They are empty when the id is not deep enough.
struct HierarchyInfo {
  std::size_t depth{0};                      // NOLINT(readability-identifier-naming)
  std::optional<std::string> parent;         // NOLINT(readability-identifier-naming)
  std::optional<std::string> grand_parent;   // NOLINT(readability-identifier-naming)
  std::vector<std::string> segments;         // NOLINT(readability-identifier-naming)
};

// hierarchical_root splits the 32 compact hex digits into `levels` contiguous segments
// joined by '.'. Segments have 32 / levels digits; the last absorbs the remainder.
// levels is clamped to [1, 32].
[[nodiscard]] std::string hierarchical_root(const CanonicalId& id,
                                            std::size_t levels = kDefaultHierarchyLevels);

// hierarchical_child appends the first 10 compact hex digits of `fresh` to parent.
// The child segment is not derived from the parent's bits; parent/child is a naming
// relationship only and carries no integrity guarantee.
[[nodiscard]] std::string hierarchical_child(std::string_view parent, const CanonicalId& fresh);

// parse_hierarchy splits on '.' and reports depth relative to root_levels.
[[nodiscard]] HierarchyInfo parse_hierarchy(std::string_view hierarchical_id,
                                            std::size_t root_levels = kDefaultHierarchyLevels);

// ── prefixed ───────────────────────────────────────────────────────────────

[[nodiscard]] std::string prefixed(std::string_view prefix, std::string_view canonical,
                                   char separator = core::kDefaultSeparator);

// strip_prefix returns the remainder when text starts with prefix + separator.
[[nodiscard]] std::optional<std::string_view> strip_prefix(std::string_view text,
                                                           std::string_view prefix,
                                                           char separator);

// ── batch interchange ──────────────────────────────────────────────────────

// parse_id_lines splits newline-delimited ids. Surrounding whitespace and '\r' are trimmed;
// blank lines, including trailing ones, are skipped.
[[nodiscard]] std::vector<std::string> parse_id_lines(std::string_view text);

// format_id_lines writes one id per line, each terminated by '\n'.
[[nodiscard]] std::string format_id_lines(const std::vector<std::string>& ids);

}  // namespace uusid::id
