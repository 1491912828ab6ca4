#pragma once
/*
================================================================================
Fragment 1.7 - Core: Run Identifiers
FILE: cpp/engine/core/run_id.hpp

Purpose:
  - Label each bridge run for the audit log.
  - Injectable so tests and replays get reproducible ids.

Contract:
  - Ids never influence any physical computation.
  - RandomRunIdGenerator draws from [0, kRunIdSpace) and formats "run_NNNNNN".
================================================================================
*/

#include "engine/core/rng.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace gate {

inline constexpr std::uint64_t kRunIdSpace = 1000000;

class IRunIdGenerator {
 public:
  virtual ~IRunIdGenerator() = default;
  virtual std::string next() = 0;
};

class RandomRunIdGenerator final : public IRunIdGenerator {
 public:
  explicit RandomRunIdGenerator(std::uint64_t seed) : rng_(seed) {}

  std::string next() override;

 private:
  SplitMix64 rng_;
};

// Counts up from `first`; ids are "run_000001", "run_000002", ...
class SequentialRunIdGenerator final : public IRunIdGenerator {
 public:
  explicit SequentialRunIdGenerator(std::uint64_t first = 1) : next_(first) {}

  std::string next() override;

 private:
  std::uint64_t next_;
};

std::string format_run_id(std::uint64_t n);

// Random generator seeded from std::random_device.
std::unique_ptr<IRunIdGenerator> make_default_run_id_generator();

}  // namespace gate
