#pragma once

// cmd_generate: generate ids, one per line.
// Usage: uusid_cli generate [--count N] [--format standard|base32|url-safe|compact|hierarchical]
//                           [--levels N] [--sorted] [--encrypt] [--output <file>]
//                           [--workers W] [--batch-size B]
//                           [--state-db <path> [--name <generator>]] [generator flags]
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_content: derive the content-addressed id of a text.
// Usage: uusid_cli content <text> [--namespace NS] [--algorithm sha256|sha512|...]
//                                 [--separator C]
int cmd_content(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
