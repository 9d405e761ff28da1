#include "uusid/report/json.h"

#include "uusid/core/time.h"
#include "uusid/id/identity.h"

namespace uusid::report {

namespace {

const char* node_source_name(const id::NodeSource source) {
  switch (source) {
    case id::NodeSource::kHardwareThenRandom:
      return "hardware";
    case id::NodeSource::kRandom:
      return "random";
  }
  return "hardware";
}

}  // namespace

nlohmann::json to_json(const validation::ValidationResult& result) {
  nlohmann::json j;
  j["valid"] = result.valid;
  if (!result.reason.empty()) {
    j["reason"] = result.reason;
  }
  if (result.version.has_value()) {
    j["version"] = result.version.value();
  }
  if (result.timestamp_ms.has_value()) {
    j["timestamp_ms"] = result.timestamp_ms.value();
    j["timestamp"] = core::format_iso8601(result.timestamp_ms.value());
  }
  j["entropy"] = result.entropy;
  j["collision_probability"] = result.collision_probability;
  j["warnings"] = result.warnings;
  j["window_violation"] = result.window_violation;
  return j;
}

nlohmann::json to_json(const validation::AnalysisResult& result) {
  nlohmann::json j;
  j["total_ids"] = result.total_ids;
  j["unique_ids"] = result.unique_ids;
  j["duplicates"] = result.duplicates;
  j["valid_ids"] = result.valid_ids;
  j["invalid_ids"] = result.invalid_ids;
  j["time_span_ms"] = result.time_span_ms;
  j["generation_rate"] = result.generation_rate;
  return j;
}

nlohmann::json to_json(const id::MetricsSnapshot& metrics) {
  nlohmann::json j;
  j["total_generated"] = metrics.total_generated;
  j["average_rate"] = metrics.average_rate;
  j["current_rate"] = metrics.current_rate;
  j["peak_rate"] = metrics.peak_rate;
  j["uptime_ms"] = metrics.uptime_ms;
  return j;
}

nlohmann::json to_json(const id::HealthReport& report) {
  nlohmann::json j;
  j["healthy"] = report.healthy;
  j["entropy_good"] = report.entropy_good;
  j["last_generated"] = report.last_generated;
  j["checked_at"] = core::format_iso8601(report.checked_at_ms);
  if (!report.reason.empty()) {
    j["reason"] = report.reason;
  }
  return j;
}

nlohmann::json to_json(const id::HierarchyInfo& info) {
  nlohmann::json j;
  j["depth"] = info.depth;
  j["segments"] = info.segments;
  j["parent"] = info.parent.has_value() ? nlohmann::json(info.parent.value()) : nlohmann::json();
  j["grand_parent"] =
      info.grand_parent.has_value() ? nlohmann::json(info.grand_parent.value()) : nlohmann::json();
  return j;
}

core::Result<id::GeneratorOptions> generator_options_from_json(const nlohmann::json& j) {
  using OptionsResult = core::Result<id::GeneratorOptions>;

  if (!j.is_object()) {
    return core::fail<id::GeneratorOptions>(core::ErrorKind::kConfiguration,
                                            "generator options must be a JSON object");
  }

  id::GeneratorOptions options;
  try {
    if (j.contains("node_id")) {
      const auto node = id::parse_node_id(j.at("node_id").get<std::string>());
      if (!node.has_value()) {
        return OptionsResult::err(node.error());
      }
      options.node_id = node.value();
    }
    if (j.contains("clock_seq")) {
      options.clock_seq = j.at("clock_seq").get<std::uint32_t>();
    }
    if (j.contains("separator")) {
      options.separator = j.at("separator").get<std::string>();
    }
    if (j.contains("prefix")) {
      options.prefix = j.at("prefix").get<std::string>();
    }
    if (j.contains("valid_after_ms")) {
      options.valid_after_ms = j.at("valid_after_ms").get<std::int64_t>();
    }
    if (j.contains("valid_before_ms")) {
      options.valid_before_ms = j.at("valid_before_ms").get<std::int64_t>();
    }
    if (j.contains("secret_key")) {
      options.secret_key = j.at("secret_key").get<std::string>();
    }
    if (j.contains("encrypt_output")) {
      options.encrypt_output = j.at("encrypt_output").get<bool>();
    }
    if (j.contains("node_source")) {
      const auto source = j.at("node_source").get<std::string>();
      if (source == "random") {
        options.node_source = id::NodeSource::kRandom;
      } else if (source == "hardware") {
        options.node_source = id::NodeSource::kHardwareThenRandom;
      } else {
        return core::fail<id::GeneratorOptions>(core::ErrorKind::kConfiguration,
                                                "unknown node_source '" + source + "'");
      }
    }
  } catch (const nlohmann::json::exception& e) {
    return core::fail<id::GeneratorOptions>(core::ErrorKind::kConfiguration,
                                            std::string{"invalid generator options: "} + e.what());
  }

  const auto ok = id::validate_options(options);
  if (!ok.has_value()) {
    return OptionsResult::err(ok.error());
  }
  return OptionsResult::ok(std::move(options));
}

nlohmann::json to_json(const id::GeneratorOptions& options) {
  nlohmann::json j;
  if (options.node_id.has_value()) {
    j["node_id"] = id::format_node_id(options.node_id.value());
  }
  if (options.clock_seq.has_value()) {
    j["clock_seq"] = options.clock_seq.value();
  }
  j["separator"] = options.separator;
  if (options.prefix.has_value()) {
    j["prefix"] = options.prefix.value();
  }
  if (options.valid_after_ms.has_value()) {
    j["valid_after_ms"] = options.valid_after_ms.value();
  }
  if (options.valid_before_ms.has_value()) {
    j["valid_before_ms"] = options.valid_before_ms.value();
  }
  j["encrypt_output"] = options.encrypt_output;
  j["node_source"] = node_source_name(options.node_source);
  return j;
}

core::Result<pool::PoolOptions> pool_options_from_json(const nlohmann::json& j) {
  pool::PoolOptions options;
  try {
    options.workers = j.value("workers", options.workers);
    options.batch_size = j.value("batch_size", options.batch_size);
  } catch (const nlohmann::json::exception& e) {
    return core::fail<pool::PoolOptions>(core::ErrorKind::kConfiguration,
                                         std::string{"invalid pool options: "} + e.what());
  }
  if (options.workers == 0 || options.batch_size == 0) {
    return core::fail<pool::PoolOptions>(core::ErrorKind::kConfiguration,
                                         "workers and batch_size must be positive");
  }
  return core::Result<pool::PoolOptions>::ok(options);
}

}  // namespace uusid::report
