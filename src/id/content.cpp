#include "uusid/id/content.h"

#include "uusid/core/hex.h"
#include "uusid/id/formats.h"

#include <openssl/evp.h>

#include <memory>

namespace uusid::id {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

}  // namespace

core::Result<std::string> digest_hex(const std::string_view algorithm,
                                     const std::string_view input) {
  const std::string name{algorithm};
  const EVP_MD* md = EVP_get_digestbyname(name.c_str());
  if (md == nullptr) {
    return core::fail<std::string>(core::ErrorKind::kContentDerive,
                                   "unknown hash algorithm '" + name + "'");
  }

  const std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  unsigned char digest[EVP_MAX_MD_SIZE];  // NOLINT(modernize-avoid-c-arrays)
  unsigned int digest_len = 0;

  if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    return core::fail<std::string>(core::ErrorKind::kContentDerive,
                                   "digest computation failed for '" + name + "'");
  }

  return core::Result<std::string>::ok(core::to_hex(digest, digest_len));
}

core::Result<std::string> from_content(const std::string_view content,
                                       const std::string_view content_namespace,
                                       const std::string_view algorithm, const char separator) {
  std::string input;
  input.reserve(content_namespace.size() + content.size());
  input.append(content_namespace);
  input.append(content);

  auto digest = digest_hex(algorithm, input);
  if (!digest.has_value()) {
    return digest;
  }
  if (digest.value().size() < kCompactLength) {
    return core::fail<std::string>(core::ErrorKind::kContentDerive,
                                   "hash algorithm '" + std::string{algorithm} +
                                       "' yields fewer than 128 bits");
  }

  return expand_compact(std::string_view{digest.value()}.substr(0, kCompactLength), separator);
}

}  // namespace uusid::id
