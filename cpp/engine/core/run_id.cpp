#include "engine/core/run_id.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace gate {

std::string format_run_id(std::uint64_t n) {
  std::ostringstream oss;
  oss << "run_" << std::setw(6) << std::setfill('0') << n;
  return oss.str();
}

std::string RandomRunIdGenerator::next() {
  return format_run_id(rng_.next_below(kRunIdSpace));
}

std::string SequentialRunIdGenerator::next() {
  return format_run_id(next_++);
}

std::unique_ptr<IRunIdGenerator> make_default_run_id_generator() {
  std::random_device rd;
  const std::uint64_t seed = (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
  return std::make_unique<RandomRunIdGenerator>(seed);
}

}  // namespace gate
