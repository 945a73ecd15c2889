#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace seat::util {

/*
  Source of opaque record identifiers ("H-3f2a9c01de", "P-...").

  Uniqueness against existing records is enforced by the ledgers, which retry on
  collision; generators only have to make collisions unlikely.
*/
class IdGenerator {
 public:
  virtual ~IdGenerator() = default;

  virtual std::string Next(std::string_view prefix) = 0;
};

// prefix + "-" + first 10 hex digits of a random UUID.
class RandomIdGenerator final : public IdGenerator {
 public:
  std::string Next(std::string_view prefix) override;
};

// prefix + "-" + zero padded counter. Deterministic, for tests and tooling.
class SequentialIdGenerator final : public IdGenerator {
 public:
  explicit SequentialIdGenerator(std::uint64_t start = 1) : next_(start) {
  }

  std::string Next(std::string_view prefix) override;

 private:
  std::atomic<std::uint64_t> next_;
};

} // namespace seat::util
