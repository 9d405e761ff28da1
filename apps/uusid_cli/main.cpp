#include "uusid/core/version.h"

#include "commands/cipher.h"
#include "commands/generate.h"
#include "commands/inspect.h"
#include "commands/status.h"

#include <iostream>
#include <string>

namespace {

void print_help() {
  std::cout << "uusid v" << uusid::core::kBuildVersion << "\n"
            << "Usage: uusid_cli <command> [options]\n\n"
            << "Commands:\n"
            << "  generate    Generate ids (default command)\n"
            << "  content     Derive a content-addressed id\n"
            << "  validate    Validate ids\n"
            << "  analyze     Analyse a file of ids\n"
            << "  hierarchy   Describe a hierarchical id\n"
            << "  timestamp   Print the generation time embedded in an id\n"
            << "  encrypt     Encrypt an id\n"
            << "  decrypt     Decrypt an encrypted id\n"
            << "  metrics     Generate ids and report throughput\n"
            << "  health      Run the generator health probe\n"
            << "  version     Print the version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    return cmd_generate(argc, argv);
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "content") {
    return cmd_content(argc, argv);
  }
  if (subcommand == "validate") {
    return cmd_validate(argc, argv);
  }
  if (subcommand == "analyze") {
    return cmd_analyze(argc, argv);
  }
  if (subcommand == "hierarchy") {
    return cmd_hierarchy(argc, argv);
  }
  if (subcommand == "timestamp") {
    return cmd_timestamp(argc, argv);
  }
  if (subcommand == "encrypt") {
    return cmd_encrypt(argc, argv);
  }
  if (subcommand == "decrypt") {
    return cmd_decrypt(argc, argv);
  }
  if (subcommand == "metrics") {
    return cmd_metrics(argc, argv);
  }
  if (subcommand == "health") {
    return cmd_health(argc, argv);
  }
  if (subcommand == "version" || subcommand == "--version") {
    std::cout << uusid::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand == "help" || subcommand == "--help" || subcommand == "-h") {
    print_help();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}
