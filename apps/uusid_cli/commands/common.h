#pragma once

#include "uusid/core/result.h"
#include "uusid/id/generator.h"

#include "shared/arg_parser.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// GeneratorFlags collects the generator-related flags shared by several subcommands.
// Flag values are kept as JSON overrides and merged over the --config file, so the
// file and the flags go through the same loader.
struct GeneratorFlags {
  std::optional<std::string> config_path;
  nlohmann::json overrides = nlohmann::json::object();
};

[[nodiscard]] std::optional<std::int64_t> parse_int(const std::string& text);

// resolve_generator_options loads the --config file (if any), applies the flag
// overrides and validates the result.
[[nodiscard]] uusid::core::Result<uusid::id::GeneratorOptions> resolve_generator_options(
    const GeneratorFlags& flags);

// Whole-file helpers; errors are returned as text for the CLI to print.
[[nodiscard]] uusid::core::Result<std::string, std::string> read_text_file(const std::string& path);
[[nodiscard]] uusid::core::Result<bool, std::string> write_text_file(const std::string& path,
                                                                     const std::string& text);

void print_error(const uusid::core::Error& error);

// add_generator_flags appends the shared flags. Config must have a
// `GeneratorFlags generator` member.
template <typename Config>
void add_generator_flags(std::vector<uusid::apps::Option<Config>>& options) {
  options.push_back({"--config", true, "JSON file with generator options",
                     [](Config& c, const std::string& v) {
                       c.generator.config_path = v;
                       return true;
                     }});
  options.push_back({"--separator", true, "Group separator (default '-')",
                     [](Config& c, const std::string& v) {
                       c.generator.overrides["separator"] = v;
                       return true;
                     }});
  options.push_back({"--prefix", true, "Prefix prepended as <prefix><separator><id>",
                     [](Config& c, const std::string& v) {
                       c.generator.overrides["prefix"] = v;
                       return true;
                     }});
  options.push_back({"--node-id", true, "48-bit node id as 12 hex digits",
                     [](Config& c, const std::string& v) {
                       c.generator.overrides["node_id"] = v;
                       return true;
                     }});
  options.push_back({"--random-node", false, "Draw a random node id instead of the MAC address",
                     [](Config& c, const std::string&) {
                       c.generator.overrides["node_source"] = "random";
                       return true;
                     }});
  options.push_back({"--clock-seq", true, "14-bit clock sequence",
                     [](Config& c, const std::string& v) {
                       const auto n = parse_int(v);
                       if (!n.has_value() || *n < 0) {
                         std::cerr << "Invalid --clock-seq: " << v << "\n";
                         return false;
                       }
                       c.generator.overrides["clock_seq"] = *n;
                       return true;
                     }});
  options.push_back({"--valid-after", true, "Earliest generation time (Unix ms)",
                     [](Config& c, const std::string& v) {
                       const auto n = parse_int(v);
                       if (!n.has_value()) {
                         std::cerr << "Invalid --valid-after: " << v << "\n";
                         return false;
                       }
                       c.generator.overrides["valid_after_ms"] = *n;
                       return true;
                     }});
  options.push_back({"--valid-before", true, "Latest generation time (Unix ms)",
                     [](Config& c, const std::string& v) {
                       const auto n = parse_int(v);
                       if (!n.has_value()) {
                         std::cerr << "Invalid --valid-before: " << v << "\n";
                         return false;
                       }
                       c.generator.overrides["valid_before_ms"] = *n;
                       return true;
                     }});
  options.push_back({"--secret-key", true, "Secret for encrypt/decrypt",
                     [](Config& c, const std::string& v) {
                       c.generator.overrides["secret_key"] = v;
                       return true;
                     }});
}
