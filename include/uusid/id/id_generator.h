#pragma once

#include <memory>
#include <mutex>
#include <string>

namespace uusid::id {

// Abstract ID generator interface for dependency injection.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Generate the next decorated id.
  // Contract: returned id is non-empty and distinct from every earlier id of this instance.
  virtual std::string next() = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// SynchronizedIdGenerator serialises next() on a wrapped generator so a single
// instance can be shared between threads.
class SynchronizedIdGenerator final : public IIdGenerator {
 public:
  explicit SynchronizedIdGenerator(std::unique_ptr<IIdGenerator> inner);
  ~SynchronizedIdGenerator() override = default;

  // Not copyable or movable (contains mutex)
  SynchronizedIdGenerator(const SynchronizedIdGenerator&) = delete;
  SynchronizedIdGenerator& operator=(const SynchronizedIdGenerator&) = delete;
  SynchronizedIdGenerator(SynchronizedIdGenerator&&) = delete;
  SynchronizedIdGenerator& operator=(SynchronizedIdGenerator&&) = delete;

  std::string next() override;

 private:
  std::mutex mutex_;
  std::unique_ptr<IIdGenerator> inner_;
};

}  // namespace uusid::id
