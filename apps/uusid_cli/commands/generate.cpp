#include "generate.h"

#include "uusid/core/clock.h"
#include "uusid/id/content.h"
#include "uusid/id/formats.h"
#include "uusid/id/generator.h"
#include "uusid/pool/worker_pool.h"
#include "uusid/storage/identity_store.h"
#include "uusid/storage/sqlite/sqlite_db.h"
#include "uusid/storage/sqlite/sqlite_identity_store.h"

#include "common.h"

#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

struct GenerateCliConfig {
  GeneratorFlags generator;
  std::size_t count{1};
  std::string format{"standard"};
  std::size_t levels{uusid::id::kDefaultHierarchyLevels};
  bool sorted{false};
  std::optional<std::string> output_path;
  std::optional<std::size_t> workers;
  std::size_t batch_size{uusid::pool::PoolOptions{}.batch_size};
  std::optional<std::string> state_db;
  std::string name{"default"};
};

struct ContentCliConfig {
  GeneratorFlags generator;
  std::string content_namespace{uusid::id::kDefaultContentNamespace};
  std::string algorithm{uusid::id::kDefaultContentAlgorithm};
};

bool parse_count(const std::string& flag, const std::string& v, std::size_t& out) {
  const auto n = parse_int(v);
  if (!n.has_value() || *n < 1) {
    std::cerr << "Invalid " << flag << ": " << v << " (must be a positive integer)\n";
    return false;
  }
  out = static_cast<std::size_t>(*n);
  return true;
}

std::vector<uusid::apps::Option<GenerateCliConfig>> generate_options() {
  std::vector<uusid::apps::Option<GenerateCliConfig>> options = {
      {"--count", true, "Number of ids (default 1)",
       [](GenerateCliConfig& c, const std::string& v) { return parse_count("--count", v, c.count); }},
      {"--format", true, "standard|base32|url-safe|compact|hierarchical",
       [](GenerateCliConfig& c, const std::string& v) {
         if (v == "standard" || v == "base32" || v == "url-safe" || v == "compact" ||
             v == "hierarchical") {
           c.format = v;
           return true;
         }
         std::cerr << "Invalid --format: " << v
                   << " (valid: standard, base32, url-safe, compact, hierarchical)\n";
         return false;
       }},
      {"--levels", true, "Root segments of hierarchical ids (default 3)",
       [](GenerateCliConfig& c, const std::string& v) {
         return parse_count("--levels", v, c.levels);
       }},
      {"--sorted", false, "Order the batch by embedded timestamp",
       [](GenerateCliConfig& c, const std::string&) {
         c.sorted = true;
         return true;
       }},
      {"--encrypt", false, "Emit encrypted envelopes (requires --secret-key)",
       [](GenerateCliConfig& c, const std::string&) {
         c.generator.overrides["encrypt_output"] = true;
         return true;
       }},
      {"--output", true, "Write ids to a file instead of stdout",
       [](GenerateCliConfig& c, const std::string& v) {
         c.output_path = v;
         return true;
       }},
      {"--workers", true, "Generate with a pool of W independent generators",
       [](GenerateCliConfig& c, const std::string& v) {
         std::size_t n = 0;
         if (!parse_count("--workers", v, n)) {
           return false;
         }
         c.workers = n;
         return true;
       }},
      {"--batch-size", true, "Ids per pool chunk (default 1000)",
       [](GenerateCliConfig& c, const std::string& v) {
         return parse_count("--batch-size", v, c.batch_size);
       }},
      {"--state-db", true, "SQLite file that keeps the generator identity between runs",
       [](GenerateCliConfig& c, const std::string& v) {
         c.state_db = v;
         return true;
       }},
      {"--name", true, "Identity name inside --state-db (default 'default')",
       [](GenerateCliConfig& c, const std::string& v) {
         c.name = v;
         return true;
       }},
  };
  add_generator_flags(options);
  return options;
}

std::function<std::string(uusid::id::Generator&)> format_producer(const GenerateCliConfig& config) {
  if (config.format == "base32") {
    return [](uusid::id::Generator& g) { return g.base32(); };
  }
  if (config.format == "url-safe") {
    return [](uusid::id::Generator& g) { return g.url_safe(); };
  }
  if (config.format == "compact") {
    return [](uusid::id::Generator& g) { return g.compact(); };
  }
  if (config.format == "hierarchical") {
    const std::size_t levels = config.levels;
    return [levels](uusid::id::Generator& g) { return g.hierarchical(levels); };
  }
  return [](uusid::id::Generator& g) { return g.generate(); };
}

std::vector<std::string> run_single(uusid::id::Generator& generator,
                                    const GenerateCliConfig& config) {
  if (config.format == "standard") {
    return config.sorted ? generator.generate_sorted_batch(config.count)
                         : generator.generate_batch(config.count);
  }

  const auto produce = format_producer(config);
  std::vector<std::string> ids;
  ids.reserve(config.count);
  for (std::size_t i = 0; i < config.count; ++i) {
    ids.push_back(produce(generator));
  }
  return ids;
}

int emit(const std::vector<std::string>& ids, const std::optional<std::string>& output_path) {
  const std::string text = uusid::id::format_id_lines(ids);
  if (!output_path.has_value()) {
    std::cout << text;
    return 0;
  }

  const auto written = write_text_file(output_path.value(), text);
  if (!written.has_value()) {
    std::cerr << "Error: " << written.error() << "\n";
    return 1;
  }
  std::cerr << "Wrote " << ids.size() << " ids to " << output_path.value() << "\n";
  return 0;
}

int generate_with_state(const uusid::id::GeneratorOptions& options,
                        const GenerateCliConfig& config, uusid::core::IClock& clock) {
  auto db_result = uusid::storage::sqlite::SqliteDb::open(config.state_db.value());
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database: " << db_result.error() << "\n";
    return 1;
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
    return 1;
  }

  uusid::storage::sqlite::SqliteIdentityStore store(db);
  const auto restored =
      uusid::storage::restore_identity(store, config.name, clock, options.node_source);
  uusid::id::Generator generator(options, clock, restored);

  const auto ids = run_single(generator, config);
  uusid::storage::persist_identity(store, config.name, generator);
  return emit(ids, config.output_path);
}

}  // namespace

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = generate_options();
  const auto parsed = uusid::apps::parse_options(argc, argv, options);
  if (!parsed.ok) {
    uusid::apps::print_usage(std::cerr, "uusid_cli generate [options]", options);
    return 1;
  }
  const GenerateCliConfig& config = parsed.config;

  if (config.workers.has_value() && (config.format != "standard" || config.state_db.has_value())) {
    std::cerr << "Error: --workers supports only --format standard without --state-db\n";
    return 1;
  }

  const auto generator_options = resolve_generator_options(config.generator);
  if (!generator_options.has_value()) {
    print_error(generator_options.error());
    return 1;
  }

  uusid::core::SystemClock clock;
  try {
    if (config.workers.has_value()) {
      uusid::pool::WorkerPool pool({config.workers.value(), config.batch_size},
                                   generator_options.value(), clock);
      return emit(pool.generate_batch(config.count), config.output_path);
    }
    if (config.state_db.has_value()) {
      return generate_with_state(generator_options.value(), config, clock);
    }

    uusid::id::Generator generator(generator_options.value(), clock);
    return emit(run_single(generator, config), config.output_path);
  } catch (const uusid::core::UusidException& e) {
    print_error(e.error());
    return 1;
  } catch (const std::runtime_error& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

int cmd_content(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<uusid::apps::Option<ContentCliConfig>> options = {
      {"--namespace", true, "Namespace mixed into the hash (default 'default')",
       [](ContentCliConfig& c, const std::string& v) {
         c.content_namespace = v;
         return true;
       }},
      {"--algorithm", true, "Digest name (default sha256)",
       [](ContentCliConfig& c, const std::string& v) {
         c.algorithm = v;
         return true;
       }},
  };
  add_generator_flags(options);

  const auto parsed = uusid::apps::parse_options(argc, argv, options);
  if (!parsed.ok || parsed.positional.size() != 1) {
    uusid::apps::print_usage(std::cerr, "uusid_cli content <text> [options]", options);
    return 1;
  }

  const auto generator_options = resolve_generator_options(parsed.config.generator);
  if (!generator_options.has_value()) {
    print_error(generator_options.error());
    return 1;
  }

  const auto id = uusid::id::from_content(parsed.positional.front(),
                                          parsed.config.content_namespace,
                                          parsed.config.algorithm,
                                          generator_options.value().separator.front());
  if (!id.has_value()) {
    print_error(id.error());
    return 1;
  }
  std::cout << id.value() << "\n";
  return 0;
}
