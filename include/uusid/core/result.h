#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace uusid::core {

// ErrorKind names every failure the library can report.
// Each kind is scoped to the single call that produced it; none is process-fatal.
enum class ErrorKind {
  kFormat,               // text fails the structural pattern
  kTimeWindowViolation,  // generation or validation outside the configured range
  kEncryptionKeyMissing,
  kDecryptionEnvelope,  // malformed iv:ciphertext or cipher failure
  kContentDerive,
  kConfiguration,
  kCipher,  // key derivation or encryption failed inside the crypto library
};

struct Error {
  ErrorKind kind{ErrorKind::kFormat};
  std::string message;
};

[[nodiscard]] const char* error_kind_name(ErrorKind kind);

// UusidException is thrown only on the hard-failure paths: generation outside the
// configured time window and construction from invalid options.
class UusidException : public std::runtime_error {
 public:
  explicit UusidException(Error error)
      : std::runtime_error(error.message), error_(std::move(error)) {}

  [[nodiscard]] ErrorKind kind() const { return error_.kind; }
  [[nodiscard]] const Error& error() const { return error_; }

 private:
  Error error_;
};

// Result<T, E> encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E = Error>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename U>
  Result(std::in_place_index_t<I> tag, U&& v) : data_(tag, std::forward<U>(v)) {}

  std::variant<T, E> data_;
};

// Shorthand for the common error-returning paths.
template <typename T>
Result<T> fail(ErrorKind kind, std::string message) {
  return Result<T>::err(Error{kind, std::move(message)});
}

}  // namespace uusid::core
