#include "uusid/core/result.h"

namespace uusid::core {

const char* error_kind_name(const ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kFormat:
      return "FormatError";
    case ErrorKind::kTimeWindowViolation:
      return "TimeWindowViolation";
    case ErrorKind::kEncryptionKeyMissing:
      return "EncryptionKeyMissing";
    case ErrorKind::kDecryptionEnvelope:
      return "DecryptionEnvelopeError";
    case ErrorKind::kContentDerive:
      return "ContentDeriveError";
    case ErrorKind::kConfiguration:
      return "ConfigurationError";
    case ErrorKind::kCipher:
      return "CipherError";
  }
  return "UnknownError";
}

}  // namespace uusid::core
