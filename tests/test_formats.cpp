#include "uusid/id/canonical_id.h"
#include "uusid/id/formats.h"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace uusid;

namespace {

id::CanonicalId known_id() {
  return id::decode("01928374-5678-1abc-8def-123456789abc").value();
}

}  // namespace

TEST_CASE("compact and url-safe forms drop separators", "[formats]") {
  CHECK(id::compact("01928374-5678-1ABC-8def-123456789abc") == "0192837456781ABC8def123456789abc");
  CHECK(id::url_safe("01928374-5678-1ABC-8def-123456789abc") == "0192837456781abc8def123456789abc");
  CHECK(id::url_safe("01928374_5678_1abc_8def_123456789abc", '_') ==
        "0192837456781abc8def123456789abc");

  const auto expanded = id::expand_compact("0192837456781abc8def123456789abc");
  REQUIRE(expanded.has_value());
  CHECK(expanded.value() == "01928374-5678-1abc-8def-123456789abc");

  const auto short_input = id::expand_compact("0192837456781abc");
  REQUIRE_FALSE(short_input.has_value());
  CHECK(short_input.error().kind == core::ErrorKind::kFormat);
  CHECK_FALSE(id::expand_compact("0192837456781abc8def123456789abz").has_value());
}

TEST_CASE("base-32 form is 26 symbols and reversible", "[formats][base32]") {
  const auto bytes = known_id().to_bytes();
  const std::string encoded = id::base32_encode(bytes);
  CHECK(encoded == "AGJIG5CWPANLZDPPCI2FM6E2XQ");
  CHECK(encoded.size() == id::kBase32Length);

  const auto decoded = id::base32_decode(encoded);
  REQUIRE(decoded.has_value());
  CHECK(decoded.value() == bytes);

  const auto lower = id::base32_decode("agjig5cwpanlzdppci2fm6e2xq");
  REQUIRE(lower.has_value());
  CHECK(lower.value() == bytes);
}

TEST_CASE("base-32 decode rejects bad input", "[formats][base32]") {
  CHECK_FALSE(id::base32_decode("AGJIG5CWPANLZDPPCI2FM6E2X").has_value());
  CHECK_FALSE(id::base32_decode("AGJIG5CWPANLZDPPCI2FM6E2X1").has_value());
  // Last symbol 'R' sets one of the two pad bits.
  CHECK_FALSE(id::base32_decode("AGJIG5CWPANLZDPPCI2FM6E2XR").has_value());
}

TEST_CASE("hierarchical roots split the compact hex", "[formats][hierarchy]") {
  const auto cid = known_id();

  const std::string root = id::hierarchical_root(cid);
  CHECK(root == "0192837456.781abc8def.123456789abc");

  CHECK(id::hierarchical_root(cid, 1) == "0192837456781abc8def123456789abc");
  CHECK(id::hierarchical_root(cid, 4) == "01928374.56781abc.8def1234.56789abc");

  const auto info = id::parse_hierarchy(root);
  CHECK(info.depth == 0);
  CHECK(info.segments.size() == 3);
  CHECK_FALSE(info.parent.has_value());
  CHECK_FALSE(info.grand_parent.has_value());
}

TEST_CASE("hierarchical children report depth and ancestors", "[formats][hierarchy]") {
  const auto cid = known_id();
  std::string current = id::hierarchical_root(cid);
  std::vector<std::string> chain{current};

  for (std::size_t k = 1; k <= 4; ++k) {
    current = id::hierarchical_child(current, cid);
    chain.push_back(current);

    const auto info = id::parse_hierarchy(current);
    CHECK(info.depth == k);
    CHECK(info.segments.back() == "0192837456");
    REQUIRE(info.parent.has_value());
    CHECK(info.parent.value() == chain[k - 1]);
    if (k >= 2) {
      REQUIRE(info.grand_parent.has_value());
      CHECK(info.grand_parent.value() == chain[k - 2]);
    } else {
      CHECK_FALSE(info.grand_parent.has_value());
    }
  }
}

TEST_CASE("prefixes are added and stripped with the separator", "[formats][prefix]") {
  const std::string text = id::prefixed("user", "01928374-5678-1abc-8def-123456789abc");
  CHECK(text == "user-01928374-5678-1abc-8def-123456789abc");

  const auto stripped = id::strip_prefix(text, "user", '-');
  REQUIRE(stripped.has_value());
  CHECK(stripped.value() == "01928374-5678-1abc-8def-123456789abc");

  CHECK_FALSE(id::strip_prefix(text, "order", '-').has_value());
  CHECK_FALSE(id::strip_prefix("user_x", "user", '-').has_value());
}

TEST_CASE("batch interchange is newline delimited", "[formats][batch]") {
  const auto ids = id::parse_id_lines("a\r\n  b \n\n\tc\n\n");
  REQUIRE(ids.size() == 3);
  CHECK(ids[0] == "a");
  CHECK(ids[1] == "b");
  CHECK(ids[2] == "c");

  CHECK(id::format_id_lines(ids) == "a\nb\nc\n");
  CHECK(id::parse_id_lines(id::format_id_lines(ids)) == ids);
  CHECK(id::parse_id_lines("").empty());
}
