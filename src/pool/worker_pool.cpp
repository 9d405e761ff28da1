#include "uusid/pool/worker_pool.h"

#include <algorithm>
#include <future>
#include <iterator>

namespace uusid::pool {

namespace {

void check_options(const PoolOptions& options) {
  if (options.workers == 0) {
    throw core::UusidException(
        core::Error{core::ErrorKind::kConfiguration, "pool needs at least one worker"});
  }
  if (options.batch_size == 0) {
    throw core::UusidException(
        core::Error{core::ErrorKind::kConfiguration, "pool batch size must be positive"});
  }
}

}  // namespace

WorkerPool::WorkerPool(const PoolOptions& options, const id::GeneratorOptions& generator_template,
                       core::IClock& clock)
    : options_(options) {
  check_options(options_);

  id::GeneratorOptions worker_options = generator_template;
  worker_options.node_id.reset();
  worker_options.node_source = id::NodeSource::kRandom;

  workers_.reserve(options_.workers);
  for (std::size_t i = 0; i < options_.workers; ++i) {
    workers_.push_back(std::make_unique<id::Generator>(worker_options, clock));
  }
}

std::vector<std::string> WorkerPool::generate_batch(const std::size_t count) {
  const std::size_t batch = options_.batch_size;
  const std::size_t chunks = (count + batch - 1) / batch;
  std::vector<std::vector<std::string>> chunk_out(chunks);

  const std::size_t active = std::min(workers_.size(), chunks);
  std::vector<std::future<void>> tasks;
  tasks.reserve(active);

  for (std::size_t w = 0; w < active; ++w) {
    id::Generator& generator = *workers_[w];
    tasks.push_back(std::async(std::launch::async, [&, w]() {
      for (std::size_t c = w; c < chunks; c += workers_.size()) {
        const std::size_t n = std::min(batch, count - c * batch);
        chunk_out[c] = generator.generate_batch(n);
      }
    }));
  }

  // get() rethrows the first task failure; the remaining futures join on destruction.
  for (auto& task : tasks) {
    task.get();
  }

  std::vector<std::string> out;
  out.reserve(count);
  for (auto& chunk : chunk_out) {
    std::move(chunk.begin(), chunk.end(), std::back_inserter(out));
  }
  return out;
}

}  // namespace uusid::pool
