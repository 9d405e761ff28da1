#pragma once

#include "uusid/core/clock.h"
#include "uusid/id/generator.h"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace uusid::pool {

struct PoolOptions {
  std::size_t workers{4};        // NOLINT(readability-identifier-naming)
  std::size_t batch_size{1000};  // NOLINT(readability-identifier-naming)
};

// WorkerPool spreads a large batch over independent generator instances.
//
// Each worker owns one Generator built from the options template with a freshly drawn
// random node id, so no two workers share an identity (the template's node_id and
// node_source are ignored). ceil(count / batch_size) chunks are dealt round-robin;
// each worker runs as one concurrent task that fills its chunks in order.
//
// The output keeps chunk order and always has exactly `count` items. A failure in any
// task fails the whole call. generate_batch() itself must not be called concurrently.
class WorkerPool {
 public:
  // Throws UusidException (kConfiguration) for zero workers or a zero batch size,
  // and whatever the Generator constructor throws for a bad template.
  WorkerPool(const PoolOptions& options, const id::GeneratorOptions& generator_template,
             core::IClock& clock);

  [[nodiscard]] std::vector<std::string> generate_batch(std::size_t count);

  [[nodiscard]] const PoolOptions& options() const { return options_; }
  [[nodiscard]] std::size_t worker_count() const { return workers_.size(); }

  // Read-only access to one worker, for inspecting identities and metrics.
  [[nodiscard]] const id::Generator& worker(std::size_t index) const { return *workers_.at(index); }

 private:
  PoolOptions options_;
  std::vector<std::unique_ptr<id::Generator>> workers_;
};

}  // namespace uusid::pool
