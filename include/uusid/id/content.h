#pragma once

#include "uusid/core/result.h"
#include "uusid/core/separator.h"

#include <string>
#include <string_view>

namespace uusid::id {

inline constexpr std::string_view kDefaultContentNamespace = "default";
inline constexpr std::string_view kDefaultContentAlgorithm = "sha256";

// digest_hex returns the lower-case hex digest of input under the named algorithm
// ("sha256", "sha512", "sha1", "md5", ... as resolved by OpenSSL).
// Returns kContentDerive for an unknown algorithm or a digest failure.
[[nodiscard]] core::Result<std::string> digest_hex(std::string_view algorithm,
                                                   std::string_view input);

// from_content derives a canonical-shaped id from content:
//
//   digest = Hash(namespace || content)
//   id     = digest[0..32) reshaped to 8-4-4-4-12 with separator
//
// Pure and deterministic. The result carries no version or variant marker, so it cannot be
// told apart from a time-based id by inspection alone.
// Returns kContentDerive when the algorithm is unknown or its digest is shorter than 128 bits.
[[nodiscard]] core::Result<std::string> from_content(
    std::string_view content, std::string_view content_namespace = kDefaultContentNamespace,
    std::string_view algorithm = kDefaultContentAlgorithm,
    char separator = core::kDefaultSeparator);

}  // namespace uusid::id
