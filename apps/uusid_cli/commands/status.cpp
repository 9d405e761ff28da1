#include "status.h"

#include "uusid/core/clock.h"
#include "uusid/id/generator.h"
#include "uusid/report/json.h"

#include "common.h"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct StatusCliConfig {
  GeneratorFlags generator;
  std::size_t count{100000};
};

}  // namespace

int cmd_metrics(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<uusid::apps::Option<StatusCliConfig>> options = {
      {"--count", true, "Ids to generate before sampling (default 100000)",
       [](StatusCliConfig& c, const std::string& v) {
         const auto n = parse_int(v);
         if (!n.has_value() || *n < 0) {
           std::cerr << "Invalid --count: " << v << "\n";
           return false;
         }
         c.count = static_cast<std::size_t>(*n);
         return true;
       }},
  };
  add_generator_flags(options);

  const auto parsed = uusid::apps::parse_options(argc, argv, options);
  if (!parsed.ok) {
    uusid::apps::print_usage(std::cerr, "uusid_cli metrics [options]", options);
    return 1;
  }

  const auto generator_options = resolve_generator_options(parsed.config.generator);
  if (!generator_options.has_value()) {
    print_error(generator_options.error());
    return 1;
  }

  uusid::core::SystemClock clock;
  try {
    uusid::id::Generator generator(generator_options.value(), clock);

    const auto started = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < parsed.config.count; ++i) {
      static_cast<void>(generator.next_id());
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    nlohmann::json out = uusid::report::to_json(generator.metrics());
    out["elapsed_us"] = elapsed.count();
    out["clock_regressions"] = generator.regressions();
    std::cout << out.dump(2) << "\n";
  } catch (const uusid::core::UusidException& e) {
    print_error(e.error());
    return 1;
  }
  return 0;
}

int cmd_health(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<uusid::apps::Option<StatusCliConfig>> options;
  add_generator_flags(options);

  const auto parsed = uusid::apps::parse_options(argc, argv, options);
  if (!parsed.ok) {
    uusid::apps::print_usage(std::cerr, "uusid_cli health [options]", options);
    return 1;
  }

  const auto generator_options = resolve_generator_options(parsed.config.generator);
  if (!generator_options.has_value()) {
    print_error(generator_options.error());
    return 1;
  }

  uusid::core::SystemClock clock;
  try {
    uusid::id::Generator generator(generator_options.value(), clock);
    const auto report = generator.health_check();
    std::cout << uusid::report::to_json(report).dump(2) << "\n";
    return report.healthy ? 0 : 2;
  } catch (const uusid::core::UusidException& e) {
    print_error(e.error());
    return 1;
  }
}
