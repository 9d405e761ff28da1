#pragma once

#include "uusid/core/result.h"
#include "uusid/id/formats.h"
#include "uusid/id/generator.h"
#include "uusid/id/metrics.h"
#include "uusid/pool/worker_pool.h"
#include "uusid/validation/validator.h"

#include <nlohmann/json.hpp>

#include <string>

namespace uusid::report {

// Result serialisers. Keys are snake_case; optional fields are omitted when empty.
[[nodiscard]] nlohmann::json to_json(const validation::ValidationResult& result);
[[nodiscard]] nlohmann::json to_json(const validation::AnalysisResult& result);
[[nodiscard]] nlohmann::json to_json(const id::MetricsSnapshot& metrics);
[[nodiscard]] nlohmann::json to_json(const id::HealthReport& report);
[[nodiscard]] nlohmann::json to_json(const id::HierarchyInfo& info);

// Options round trip. secret_key is never written by to_json.
//
// Accepted keys (all optional):
//   node_id          "aabbccddeeff" or "aa:bb:cc:dd:ee:ff"
//   clock_seq        integer, 14 bits
//   separator        one-character string
//   prefix           string
//   valid_after_ms   integer Unix milliseconds
//   valid_before_ms  integer Unix milliseconds
//   secret_key       string
//   encrypt_output   bool
//   node_source      "hardware" | "random"
//
// Returns kConfiguration for a wrongly typed value or an unknown node_source, and any error of
// validate_options() for a well-typed but invalid set.
[[nodiscard]] core::Result<id::GeneratorOptions> generator_options_from_json(
    const nlohmann::json& j);
[[nodiscard]] nlohmann::json to_json(const id::GeneratorOptions& options);

// Pool options under the keys "workers" and "batch_size".
[[nodiscard]] core::Result<pool::PoolOptions> pool_options_from_json(const nlohmann::json& j);

}  // namespace uusid::report
