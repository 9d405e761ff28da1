#pragma once

#include "uusid/core/result.h"
#include "uusid/core/separator.h"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace uusid::crypto {

inline constexpr std::size_t kKeyLength = 32;  // AES-256
inline constexpr std::size_t kIvLength = 16;
inline constexpr int kKdfIterations = 10000;
inline constexpr std::string_view kKdfSalt = "uusid.v1";
inline constexpr char kEnvelopeDelimiter = ':';

// IdCipher encrypts canonical id text into an "ivHex:ciphertextHex" envelope.
//
// - Cipher: AES-256-CBC with PKCS#7 padding, fresh 16-byte IV from the CSPRNG per call
// - Key:    PBKDF2-HMAC-SHA256 over the caller secret, derived once in create()
//
// The envelope is confidential only; it carries no authentication tag. A tampered
// envelope is rejected only when the padding or the recovered text fails to check.
class IdCipher {
 public:
  // create derives the key. Returns kEncryptionKeyMissing for an empty secret and
  // kCipher when the derivation itself fails.
  [[nodiscard]] static core::Result<IdCipher> create(std::string_view secret);

  // encrypt accepts exactly the text decrypt() gives back: a canonical id with the given
  // separator. Anything else is kFormat; a failure inside the cipher is kCipher.
  [[nodiscard]] core::Result<std::string> encrypt(
      std::string_view canonical, char separator = core::kDefaultSeparator) const;

  // decrypt returns kDecryptionEnvelope when the envelope does not have exactly one ':',
  // either half is not hex, the IV is not 16 bytes, the cipher rejects the input, or the
  // recovered text is not a canonical id with the given separator.
  [[nodiscard]] core::Result<std::string> decrypt(
      std::string_view envelope, char separator = core::kDefaultSeparator) const;

 private:
  explicit IdCipher(const std::array<std::uint8_t, kKeyLength>& key) : key_(key) {}

  std::array<std::uint8_t, kKeyLength> key_{};
};

// One-shot helpers that derive the key on every call.
[[nodiscard]] core::Result<std::string> encrypt_id(std::string_view canonical,
                                                   std::string_view secret,
                                                   char separator = core::kDefaultSeparator);
[[nodiscard]] core::Result<std::string> decrypt_id(std::string_view envelope,
                                                   std::string_view secret,
                                                   char separator = core::kDefaultSeparator);

}  // namespace uusid::crypto
