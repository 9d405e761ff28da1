#include "uusid/core/clock.h"
#include "uusid/crypto/id_cipher.h"
#include "uusid/id/canonical_id.h"
#include "uusid/id/generator.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <string>

using namespace uusid;

namespace {

const std::string kId = "01928374-5678-1abc-8def-123456789abc";

}  // namespace

TEST_CASE("encrypt then decrypt recovers the id", "[cipher]") {
  const auto cipher = crypto::IdCipher::create("correct horse");
  REQUIRE(cipher.has_value());

  const auto envelope = cipher.value().encrypt(kId);
  REQUIRE(envelope.has_value());
  CHECK(std::count(envelope.value().begin(), envelope.value().end(), ':') == 1);
  CHECK(envelope.value().find(':') == 2 * crypto::kIvLength);

  const auto plain = cipher.value().decrypt(envelope.value());
  REQUIRE(plain.has_value());
  CHECK(plain.value() == kId);

  // One-shot helpers derive the same key.
  const auto again = crypto::decrypt_id(envelope.value(), "correct horse");
  REQUIRE(again.has_value());
  CHECK(again.value() == kId);
}

TEST_CASE("every encryption uses a fresh IV", "[cipher]") {
  const auto cipher = crypto::IdCipher::create("k").value();
  const auto a = cipher.encrypt(kId).value();
  const auto b = cipher.encrypt(kId).value();
  CHECK(a != b);
  CHECK(a.substr(0, 32) != b.substr(0, 32));
}

TEST_CASE("empty key is reported as missing", "[cipher]") {
  const auto cipher = crypto::IdCipher::create("");
  REQUIRE_FALSE(cipher.has_value());
  CHECK(cipher.error().kind == core::ErrorKind::kEncryptionKeyMissing);

  const auto r = crypto::encrypt_id(kId, "");
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().kind == core::ErrorKind::kEncryptionKeyMissing);
}

TEST_CASE("malformed envelopes are rejected", "[cipher]") {
  const auto cipher = crypto::IdCipher::create("secret").value();
  const std::string good = cipher.encrypt(kId).value();
  const std::string iv = good.substr(0, good.find(':'));
  const std::string ct = good.substr(good.find(':') + 1);

  for (const std::string& bad :
       {std::string{"no-delimiter"}, iv + ":" + ct + ":00", iv.substr(2) + ":" + ct,
        iv + ":" + ct.substr(1), iv + ":zz" + ct.substr(2), std::string{":"}, iv + ":"}) {
    const auto r = cipher.decrypt(bad);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().kind == core::ErrorKind::kDecryptionEnvelope);
  }
}

TEST_CASE("a different key does not recover the id", "[cipher]") {
  const auto envelope = crypto::encrypt_id(kId, "alpha").value();
  const auto r = crypto::decrypt_id(envelope, "beta");
  // Either the padding check or the canonical-text check fails.
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().kind == core::ErrorKind::kDecryptionEnvelope);
}

TEST_CASE("only canonical ids are encrypted", "[cipher]") {
  const auto cipher = crypto::IdCipher::create("secret").value();

  for (const std::string& text :
       {std::string{"hello"}, std::string{""}, "ord-" + kId, kId.substr(1)}) {
    const auto r = cipher.encrypt(text);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().kind == core::ErrorKind::kFormat);
  }

  const auto helper = crypto::encrypt_id("hello", "secret");
  REQUIRE_FALSE(helper.has_value());
  CHECK(helper.error().kind == core::ErrorKind::kFormat);
}

TEST_CASE("encrypt and decrypt agree on the separator", "[cipher]") {
  const auto cipher = crypto::IdCipher::create("secret").value();
  const std::string underscored = "01928374_5678_1abc_8def_123456789abc";

  const auto wrong = cipher.encrypt(kId, '_');
  REQUIRE_FALSE(wrong.has_value());
  CHECK(wrong.error().kind == core::ErrorKind::kFormat);

  const auto envelope = cipher.encrypt(underscored, '_');
  REQUIRE(envelope.has_value());
  const auto plain = cipher.decrypt(envelope.value(), '_');
  REQUIRE(plain.has_value());
  CHECK(plain.value() == underscored);
}

TEST_CASE("generator encryption round trips its own output", "[cipher][generator]") {
  core::ManualClock clock(1700000000000);

  SECTION("prefixed output") {
    id::GeneratorOptions options;
    options.node_id = 0x0123456789abULL;
    options.prefix = "ord";
    options.secret_key = "s3cret";
    id::Generator generator(options, clock);

    const auto text = generator.generate();
    REQUIRE(text.rfind("ord-", 0) == 0);

    const auto envelope = generator.encrypt(text);
    REQUIRE(envelope.has_value());
    const auto plain = generator.decrypt(envelope.value());
    REQUIRE(plain.has_value());
    CHECK(plain.value() == text.substr(4));
    CHECK(generator.validate(plain.value()).valid);

    const auto explicit_key = generator.encrypt(text, "other");
    REQUIRE(explicit_key.has_value());
    CHECK(generator.decrypt(explicit_key.value(), "other").value() == text.substr(4));
  }

  SECTION("custom separator") {
    id::GeneratorOptions options;
    options.separator = "_";
    options.secret_key = "s3cret";
    id::Generator generator(options, clock);

    const auto dashed = generator.encrypt(kId);
    REQUIRE_FALSE(dashed.has_value());
    CHECK(dashed.error().kind == core::ErrorKind::kFormat);

    const auto text = generator.next_canonical();
    const auto envelope = generator.encrypt(text);
    REQUIRE(envelope.has_value());
    CHECK(generator.decrypt(envelope.value()).value() == text);
  }

  SECTION("encrypted output with a custom separator") {
    id::GeneratorOptions options;
    options.separator = "~";
    options.secret_key = "s3cret";
    options.encrypt_output = true;
    id::Generator generator(options, clock);

    const auto plain = generator.decrypt(generator.generate());
    REQUIRE(plain.has_value());
    CHECK(id::is_canonical(plain.value(), '~'));
  }
}

TEST_CASE("cipher failures have their own error kind", "[cipher]") {
  CHECK(std::string{core::error_kind_name(core::ErrorKind::kCipher)} == "CipherError");
  CHECK(core::error_kind_name(core::ErrorKind::kCipher) !=
        std::string{core::error_kind_name(core::ErrorKind::kEncryptionKeyMissing)});
}
