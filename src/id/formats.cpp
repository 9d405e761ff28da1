#include "uusid/id/formats.h"

#include "uusid/core/hex.h"

#include <algorithm>

namespace uusid::id {

namespace {

std::string join(const std::vector<std::string>& parts, const std::size_t count, const char sep) {
  std::string out;
  for (std::size_t i = 0; i < count; ++i) {
    if (i > 0) {
      out.push_back(sep);
    }
    out += parts[i];
  }
  return out;
}

std::string_view trim_line(std::string_view line) {
  while (!line.empty() &&
         (line.front() == ' ' || line.front() == '\t' || line.front() == '\r')) {
    line.remove_prefix(1);
  }
  while (!line.empty() && (line.back() == ' ' || line.back() == '\t' || line.back() == '\r')) {
    line.remove_suffix(1);
  }
  return line;
}

int base32_value(const char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    return ch - 'A';
  }
  if (ch >= 'a' && ch <= 'z') {
    return ch - 'a';
  }
  if (ch >= '2' && ch <= '7') {
    return ch - '2' + 26;
  }
  return -1;
}

}  // namespace

std::string compact(const std::string_view canonical, const char separator) {
  std::string out;
  out.reserve(canonical.size());
  for (const char ch : canonical) {
    if (ch != separator) {
      out.push_back(ch);
    }
  }
  return out;
}

std::string url_safe(const std::string_view canonical, const char separator) {
  return core::ascii_lower(compact(canonical, separator));
}

core::Result<std::string> expand_compact(const std::string_view compact_text,
                                         const char separator) {
  if (compact_text.size() != kCompactLength) {
    return core::fail<std::string>(core::ErrorKind::kFormat,
                                   "compact id must be 32 hex digits, got " +
                                       std::to_string(compact_text.size()) + " characters");
  }
  if (!std::all_of(compact_text.begin(), compact_text.end(), core::is_hex_digit)) {
    return core::fail<std::string>(core::ErrorKind::kFormat, "compact id contains non-hex digits");
  }

  std::string out;
  out.reserve(kCanonicalLength);
  std::size_t pos = 0;
  for (std::size_t group = 0; group < kGroupWidths.size(); ++group) {
    if (group > 0) {
      out.push_back(separator);
    }
    out.append(compact_text.substr(pos, kGroupWidths[group]));
    pos += kGroupWidths[group];
  }
  return core::Result<std::string>::ok(std::move(out));
}

std::string base32_encode(const CanonicalId::Bytes& bytes) {
  std::string out;
  out.reserve(kBase32Length);

  std::uint32_t buffer = 0;
  unsigned bits = 0;
  for (const std::uint8_t byte : bytes) {
    buffer = (buffer << 8U) | byte;
    bits += 8U;
    while (bits >= 5U) {
      out.push_back(kBase32Alphabet[(buffer >> (bits - 5U)) & 0x1FU]);
      bits -= 5U;
    }
  }
  if (bits > 0U) {
    // Zero-pad the final partial group on the right.
    out.push_back(kBase32Alphabet[(buffer << (5U - bits)) & 0x1FU]);
  }
  return out;
}

core::Result<CanonicalId::Bytes> base32_decode(const std::string_view text) {
  if (text.size() != kBase32Length) {
    return core::fail<CanonicalId::Bytes>(core::ErrorKind::kFormat,
                                          "base-32 id must be 26 symbols, got " +
                                              std::to_string(text.size()));
  }

  CanonicalId::Bytes out{};
  std::size_t index = 0;
  std::uint32_t buffer = 0;
  unsigned bits = 0;
  for (const char ch : text) {
    const int value = base32_value(ch);
    if (value < 0) {
      return core::fail<CanonicalId::Bytes>(core::ErrorKind::kFormat,
                                            std::string{"invalid base-32 symbol '"} + ch + "'");
    }
    buffer = (buffer << 5U) | static_cast<std::uint32_t>(value);
    bits += 5U;
    if (bits >= 8U) {
      out[index++] = static_cast<std::uint8_t>(buffer >> (bits - 8U));
      bits -= 8U;
      buffer &= (1U << bits) - 1U;
    }
  }

  // 26 * 5 = 130 bits: exactly two pad bits remain and they must be zero.
  if (buffer != 0U) {
    return core::fail<CanonicalId::Bytes>(core::ErrorKind::kFormat,
                                          "base-32 id has non-zero padding bits");
  }
  return core::Result<CanonicalId::Bytes>::ok(out);
}

std::string hierarchical_root(const CanonicalId& id, std::size_t levels) {
  levels = std::clamp<std::size_t>(levels, 1, kCompactLength);
  const std::string hex = compact_hex(id);
  const std::size_t width = hex.size() / levels;

  std::string out;
  out.reserve(hex.size() + levels);
  for (std::size_t level = 0; level < levels; ++level) {
    if (level > 0) {
      out.push_back(kHierarchySeparator);
    }
    const std::size_t start = level * width;
    const std::size_t len = (level + 1 == levels) ? hex.size() - start : width;
    out.append(hex, start, len);
  }
  return out;
}

std::string hierarchical_child(const std::string_view parent, const CanonicalId& fresh) {
  std::string out{parent};
  out.push_back(kHierarchySeparator);
  out.append(compact_hex(fresh), 0, kHierarchyChildSegmentLength);
  return out;
}

HierarchyInfo parse_hierarchy(const std::string_view hierarchical_id,
                              const std::size_t root_levels) {
  HierarchyInfo info;

  std::size_t start = 0;
  while (true) {
    const std::size_t dot = hierarchical_id.find(kHierarchySeparator, start);
    if (dot == std::string_view::npos) {
      info.segments.emplace_back(hierarchical_id.substr(start));
      break;
    }
    info.segments.emplace_back(hierarchical_id.substr(start, dot - start));
    start = dot + 1;
  }

  const std::size_t count = info.segments.size();
  info.depth = count > root_levels ? count - root_levels : 0;
  if (info.depth >= 1) {
    info.parent = join(info.segments, count - 1, kHierarchySeparator);
  }
  if (info.depth >= 2) {
    info.grand_parent = join(info.segments, count - 2, kHierarchySeparator);
  }
  return info;
}

std::string prefixed(const std::string_view prefix, const std::string_view canonical,
                     const char separator) {
  std::string out;
  out.reserve(prefix.size() + 1 + canonical.size());
  out.append(prefix);
  out.push_back(separator);
  out.append(canonical);
  return out;
}

std::optional<std::string_view> strip_prefix(const std::string_view text,
                                             const std::string_view prefix,
                                             const char separator) {
  if (prefix.empty() || text.size() <= prefix.size() || !text.starts_with(prefix) ||
      text[prefix.size()] != separator) {
    return std::nullopt;
  }
  return text.substr(prefix.size() + 1);
}

std::vector<std::string> parse_id_lines(const std::string_view text) {
  std::vector<std::string> ids;
  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    const std::string_view line = trim_line(text.substr(start, end - start));
    if (!line.empty()) {
      ids.emplace_back(line);
    }
    start = end + 1;
  }
  return ids;
}

std::string format_id_lines(const std::vector<std::string>& ids) {
  std::string out;
  for (const auto& id : ids) {
    out += id;
    out.push_back('\n');
  }
  return out;
}

}  // namespace uusid::id
