#include "uusid/crypto/id_cipher.h"

#include "uusid/core/hex.h"
#include "uusid/core/random.h"
#include "uusid/id/canonical_id.h"

#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <vector>

namespace uusid::crypto {

namespace {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

core::Result<std::string> envelope_error(std::string message) {
  return core::fail<std::string>(core::ErrorKind::kDecryptionEnvelope, std::move(message));
}

}  // namespace

core::Result<IdCipher> IdCipher::create(const std::string_view secret) {
  if (secret.empty()) {
    return core::fail<IdCipher>(core::ErrorKind::kEncryptionKeyMissing,
                                "encryption requires a non-empty secret key");
  }

  std::array<std::uint8_t, kKeyLength> key{};
  const int rc = PKCS5_PBKDF2_HMAC(
      secret.data(), static_cast<int>(secret.size()),
      reinterpret_cast<const unsigned char*>(kKdfSalt.data()),  // NOLINT
      static_cast<int>(kKdfSalt.size()), kKdfIterations, EVP_sha256(),
      static_cast<int>(key.size()), key.data());
  if (rc != 1) {
    return core::fail<IdCipher>(core::ErrorKind::kCipher, "key derivation failed");
  }
  return core::Result<IdCipher>::ok(IdCipher(key));
}

core::Result<std::string> IdCipher::encrypt(const std::string_view canonical,
                                            const char separator) const {
  if (!id::is_canonical(canonical, separator)) {
    return core::fail<std::string>(core::ErrorKind::kFormat,
                                   "only canonical ids can be encrypted");
  }

  std::array<std::uint8_t, kIvLength> iv{};
  core::fill_secure_random(iv.data(), iv.size());

  const CipherCtx ctx(EVP_CIPHER_CTX_new());
  std::vector<std::uint8_t> out(canonical.size() + kIvLength);
  int written = 0;
  int final_len = 0;

  if (!ctx ||
      EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key_.data(), iv.data()) != 1 ||
      EVP_EncryptUpdate(ctx.get(), out.data(), &written,
                        reinterpret_cast<const unsigned char*>(canonical.data()),  // NOLINT
                        static_cast<int>(canonical.size())) != 1 ||
      EVP_EncryptFinal_ex(ctx.get(), out.data() + written, &final_len) != 1) {
    return core::fail<std::string>(core::ErrorKind::kCipher, "AES-256-CBC encryption failed");
  }
  out.resize(static_cast<std::size_t>(written + final_len));

  std::string envelope = core::to_hex(iv.data(), iv.size());
  envelope.push_back(kEnvelopeDelimiter);
  envelope += core::to_hex(out);
  return core::Result<std::string>::ok(std::move(envelope));
}

core::Result<std::string> IdCipher::decrypt(const std::string_view envelope,
                                            const char separator) const {
  if (std::count(envelope.begin(), envelope.end(), kEnvelopeDelimiter) != 1) {
    return envelope_error("envelope must be ivHex:ciphertextHex");
  }
  const std::size_t colon = envelope.find(kEnvelopeDelimiter);

  const auto iv = core::from_hex(envelope.substr(0, colon));
  if (!iv.has_value() || iv->size() != kIvLength) {
    return envelope_error("envelope IV must be 32 hex digits");
  }
  const auto ciphertext = core::from_hex(envelope.substr(colon + 1));
  if (!ciphertext.has_value() || ciphertext->empty() || ciphertext->size() % kIvLength != 0U) {
    return envelope_error("envelope ciphertext is not whole AES blocks of hex");
  }

  const CipherCtx ctx(EVP_CIPHER_CTX_new());
  std::vector<std::uint8_t> out(ciphertext->size() + kIvLength);
  int written = 0;
  int final_len = 0;

  if (!ctx ||
      EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key_.data(), iv->data()) != 1 ||
      EVP_DecryptUpdate(ctx.get(), out.data(), &written, ciphertext->data(),
                        static_cast<int>(ciphertext->size())) != 1 ||
      EVP_DecryptFinal_ex(ctx.get(), out.data() + written, &final_len) != 1) {
    return envelope_error("decryption failed (wrong key or corrupted ciphertext)");
  }

  std::string plain(out.begin(), out.begin() + written + final_len);
  if (!id::is_canonical(plain, separator)) {
    return envelope_error("decrypted text is not a canonical id");
  }
  return core::Result<std::string>::ok(std::move(plain));
}

core::Result<std::string> encrypt_id(const std::string_view canonical,
                                     const std::string_view secret, const char separator) {
  const auto cipher = IdCipher::create(secret);
  if (!cipher.has_value()) {
    return core::Result<std::string>::err(cipher.error());
  }
  return cipher.value().encrypt(canonical, separator);
}

core::Result<std::string> decrypt_id(const std::string_view envelope,
                                     const std::string_view secret, const char separator) {
  const auto cipher = IdCipher::create(secret);
  if (!cipher.has_value()) {
    return core::Result<std::string>::err(cipher.error());
  }
  return cipher.value().decrypt(envelope, separator);
}

}  // namespace uusid::crypto
