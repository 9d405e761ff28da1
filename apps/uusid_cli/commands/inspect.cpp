#include "inspect.h"

#include "uusid/core/time.h"
#include "uusid/id/formats.h"
#include "uusid/id/generator.h"
#include "uusid/report/json.h"
#include "uusid/validation/validator.h"

#include "common.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ValidateCliConfig {
  GeneratorFlags generator;
  bool strict{false};
  std::optional<std::int64_t> start_ms;
  std::optional<std::int64_t> end_ms;
};

struct AnalyzeCliConfig {
  GeneratorFlags generator;
};

struct HierarchyCliConfig {
  std::size_t root_levels{uusid::id::kDefaultHierarchyLevels};
};

bool parse_time_flag(const std::string& flag, const std::string& v,
                     std::optional<std::int64_t>& out) {
  const auto n = parse_int(v);
  if (!n.has_value()) {
    std::cerr << "Invalid " << flag << ": " << v << " (Unix milliseconds)\n";
    return false;
  }
  out = n;
  return true;
}

}  // namespace

int cmd_validate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<uusid::apps::Option<ValidateCliConfig>> options = {
      {"--strict", false, "Reject version or variant mismatches",
       [](ValidateCliConfig& c, const std::string&) {
         c.strict = true;
         return true;
       }},
      {"--start", true, "Range start (Unix ms) for the time-range check",
       [](ValidateCliConfig& c, const std::string& v) {
         return parse_time_flag("--start", v, c.start_ms);
       }},
      {"--end", true, "Range end (Unix ms) for the time-range check",
       [](ValidateCliConfig& c, const std::string& v) {
         return parse_time_flag("--end", v, c.end_ms);
       }},
  };
  add_generator_flags(options);

  const auto parsed = uusid::apps::parse_options(argc, argv, options);
  if (!parsed.ok || parsed.positional.empty()) {
    uusid::apps::print_usage(std::cerr, "uusid_cli validate <id>... [options]", options);
    return 1;
  }

  const auto generator_options = resolve_generator_options(parsed.config.generator);
  if (!generator_options.has_value()) {
    print_error(generator_options.error());
    return 1;
  }

  const uusid::validation::Validator validator(
      uusid::id::validator_config(generator_options.value()));
  uusid::validation::ValidationOptions validation_options;
  validation_options.strict = parsed.config.strict;
  if (parsed.config.start_ms.has_value() || parsed.config.end_ms.has_value()) {
    validation_options.time_range = uusid::validation::TimeRange{
        parsed.config.start_ms.value_or(std::numeric_limits<std::int64_t>::min()),
        parsed.config.end_ms.value_or(std::numeric_limits<std::int64_t>::max())};
  }

  bool all_valid = true;
  nlohmann::json out = nlohmann::json::array();
  for (const auto& text : parsed.positional) {
    const auto result = validator.validate(text, validation_options);
    all_valid = all_valid && result.valid;
    nlohmann::json entry = uusid::report::to_json(result);
    entry["id"] = text;
    out.push_back(entry);
  }

  std::cout << (out.size() == 1 ? out.front() : out).dump(2) << "\n";
  return all_valid ? 0 : 2;
}

int cmd_analyze(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<uusid::apps::Option<AnalyzeCliConfig>> options;
  add_generator_flags(options);

  const auto parsed = uusid::apps::parse_options(argc, argv, options);
  if (!parsed.ok || parsed.positional.size() != 1) {
    uusid::apps::print_usage(std::cerr, "uusid_cli analyze <file> [options]", options);
    return 1;
  }

  const auto generator_options = resolve_generator_options(parsed.config.generator);
  if (!generator_options.has_value()) {
    print_error(generator_options.error());
    return 1;
  }

  const auto text = read_text_file(parsed.positional.front());
  if (!text.has_value()) {
    std::cerr << "Error: " << text.error() << "\n";
    return 1;
  }

  const uusid::validation::Validator validator(
      uusid::id::validator_config(generator_options.value()));
  const auto ids = uusid::id::parse_id_lines(text.value());
  std::cout << uusid::report::to_json(validator.analyze(ids)).dump(2) << "\n";
  return 0;
}

int cmd_hierarchy(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<uusid::apps::Option<HierarchyCliConfig>> options = {
      {"--root-levels", true, "Segments that form the root (default 3)",
       [](HierarchyCliConfig& c, const std::string& v) {
         const auto n = parse_int(v);
         if (!n.has_value() || *n < 1) {
           std::cerr << "Invalid --root-levels: " << v << "\n";
           return false;
         }
         c.root_levels = static_cast<std::size_t>(*n);
         return true;
       }},
  };

  const auto parsed = uusid::apps::parse_options(argc, argv, options);
  if (!parsed.ok || parsed.positional.size() != 1) {
    uusid::apps::print_usage(std::cerr, "uusid_cli hierarchy <id> [options]", options);
    return 1;
  }

  const auto info =
      uusid::id::parse_hierarchy(parsed.positional.front(), parsed.config.root_levels);
  std::cout << uusid::report::to_json(info).dump(2) << "\n";
  return 0;
}

int cmd_timestamp(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<uusid::apps::Option<AnalyzeCliConfig>> options;
  add_generator_flags(options);

  const auto parsed = uusid::apps::parse_options(argc, argv, options);
  if (!parsed.ok || parsed.positional.size() != 1) {
    uusid::apps::print_usage(std::cerr, "uusid_cli timestamp <id> [options]", options);
    return 1;
  }

  const auto generator_options = resolve_generator_options(parsed.config.generator);
  if (!generator_options.has_value()) {
    print_error(generator_options.error());
    return 1;
  }

  const uusid::validation::Validator validator(
      uusid::id::validator_config(generator_options.value()));
  const auto ts = validator.extract_timestamp(parsed.positional.front());
  if (!ts.has_value()) {
    print_error(ts.error());
    return 1;
  }
  std::cout << ts.value() << " " << uusid::core::format_iso8601(ts.value()) << "\n";
  return 0;
}
