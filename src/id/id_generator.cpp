#include "uusid/id/id_generator.h"

#include <stdexcept>

namespace uusid::id {

SynchronizedIdGenerator::SynchronizedIdGenerator(std::unique_ptr<IIdGenerator> inner)
    : inner_(std::move(inner)) {
  if (!inner_) {
    throw std::invalid_argument("SynchronizedIdGenerator requires a generator");
  }
}

std::string SynchronizedIdGenerator::next() {
  const std::lock_guard<std::mutex> lock(mutex_);
  return inner_->next();
}

}  // namespace uusid::id
