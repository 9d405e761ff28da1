#pragma once

// cmd_encrypt / cmd_decrypt: wrap or unwrap one id with a secret key.
// Usage: uusid_cli encrypt <id> --secret-key K [--separator C]
//        uusid_cli decrypt <ivHex:ciphertextHex> --secret-key K [--separator C]
int cmd_encrypt(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
int cmd_decrypt(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
