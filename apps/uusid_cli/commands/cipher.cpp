#include "cipher.h"

#include "uusid/crypto/id_cipher.h"

#include "common.h"

#include <iostream>
#include <string>
#include <vector>

namespace {

struct CipherCliConfig {
  GeneratorFlags generator;
};

enum class Direction { kEncrypt, kDecrypt };

int run_cipher(int argc, char* argv[], const Direction direction) {  // NOLINT
  std::vector<uusid::apps::Option<CipherCliConfig>> options;
  add_generator_flags(options);

  const bool encrypting = direction == Direction::kEncrypt;
  const auto parsed = uusid::apps::parse_options(argc, argv, options);
  if (!parsed.ok || parsed.positional.size() != 1) {
    uusid::apps::print_usage(
        std::cerr, encrypting ? "uusid_cli encrypt <id> --secret-key K" :
                                "uusid_cli decrypt <envelope> --secret-key K",
        options);
    return 1;
  }

  const auto generator_options = resolve_generator_options(parsed.config.generator);
  if (!generator_options.has_value()) {
    print_error(generator_options.error());
    return 1;
  }

  const std::string secret = generator_options.value().secret_key.value_or("");
  const char separator = generator_options.value().separator.front();
  const std::string& input = parsed.positional.front();
  const auto result = encrypting ? uusid::crypto::encrypt_id(input, secret, separator)
                                 : uusid::crypto::decrypt_id(input, secret, separator);
  if (!result.has_value()) {
    print_error(result.error());
    return 1;
  }
  std::cout << result.value() << "\n";
  return 0;
}

}  // namespace

int cmd_encrypt(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return run_cipher(argc, argv, Direction::kEncrypt);
}

int cmd_decrypt(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return run_cipher(argc, argv, Direction::kDecrypt);
}
