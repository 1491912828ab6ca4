/*
  Fragment 1.12 - Core Selftest

  Objective
  ---------
  Framework-free checks for the core layer:
    1) Settings defaults validate; out-of-range knobs are rejected.
    2) BridgeConfig is derived from settings and validated.
    3) Run id generators are reproducible and stay inside the id space.
    4) Log level names parse case-insensitively.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <functional>
#include <iostream>
#include <set>
#include <string>
#include <string_view>

#include "engine/bridge/bridge_controller.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/rng.hpp"
#include "engine/core/run_id.hpp"
#include "engine/core/settings.hpp"

namespace gate {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

void expect_validation_error(const std::function<void()>& fn, std::string_view msg) {
  try {
    fn();
    fail(msg);
  } catch (const ValidationError&) {
    pass(msg);
  }
}

void test_settings_defaults() {
  const SimSettings s = SimSettings::defaults();
  bool threw = false;
  try {
    s.validate_or_throw();
  } catch (const ValidationError& e) {
    threw = true;
    std::cerr << "  unexpected: " << e.what() << "\n";
  }
  expect_true(!threw, "Default settings validate");
  expect_true(s.resonance.nominal_frequency_hz == 7.83, "Nominal frequency default is 7.83 Hz");
  expect_true(s.bridge.min_transfer_strength == 0.5, "Transfer gate default is 0.5");
  expect_true(s.bridge.min_transfer_energy_J == 100.0, "Minimum transfer energy default is 100 J");
}

void test_settings_rejects_bad_values() {
  expect_validation_error([] { SimSettings s; s.resonance.nominal_frequency_hz = 0.0; s.validate_or_throw(); },
                          "Zero nominal frequency rejected");
  expect_validation_error([] { SimSettings s; s.resonance.energy_rate_W = -1.0; s.validate_or_throw(); },
                          "Negative energy rate rejected");
  expect_validation_error([] { SimSettings s; s.resonance.detune_default_hz = NAN; s.validate_or_throw(); },
                          "NaN detune rejected");
  expect_validation_error([] { SimSettings s; s.bridge.stability_threshold = 1.5; s.validate_or_throw(); },
                          "Stability threshold above 1 rejected");
  expect_validation_error([] { SimSettings s; s.bridge.min_transfer_energy_J = -1.0; s.validate_or_throw(); },
                          "Negative minimum transfer energy rejected");
  expect_validation_error([] { SimSettings s; s.portal.warm_floor_stability_factor = 2.0; s.validate_or_throw(); },
                          "Warm floor factor above 1 rejected");
  expect_validation_error([] { SimSettings s; s.portal.max_floor_temp_C = -200.0; s.validate_or_throw(); },
                          "Max floor temperature below superconducting temperature rejected");
  expect_validation_error([] { SimSettings s; s.portal.energy_step_J = 0.0; s.validate_or_throw(); },
                          "Zero energy step rejected");
  expect_validation_error([] { SimSettings s; s.portal.energy_step_J = 25000.0; s.validate_or_throw(); },
                          "Energy step above storage ceiling rejected");
}

void test_bridge_config() {
  SimSettings s;
  s.resonance.nominal_frequency_hz = 10.0;
  s.resonance.detune_default_hz = -0.25;
  s.resonance.energy_rate_W = 750.0;

  const BridgeConfig c = BridgeConfig::from_settings(s);
  expect_true(c.base_frequency_hz == 10.0, "BridgeConfig base frequency from settings");
  expect_true(c.detune_hz == -0.25, "BridgeConfig detune from settings");
  expect_true(c.energy_rate_W == 750.0, "BridgeConfig energy rate from settings");

  expect_validation_error([] { BridgeConfig bc; bc.base_frequency_hz = -1.0; bc.validate_or_throw(); },
                          "BridgeConfig rejects negative base frequency");
  expect_validation_error([] { BridgeConfig bc; bc.detune_hz = INFINITY; bc.validate_or_throw(); },
                          "BridgeConfig rejects infinite detune");
}

void test_sequential_run_ids() {
  SequentialRunIdGenerator g;
  expect_eq_str(g.next(), "run_000001", "Sequential id #1");
  expect_eq_str(g.next(), "run_000002", "Sequential id #2");

  SequentialRunIdGenerator g42(42);
  expect_eq_str(g42.next(), "run_000042", "Sequential id honours start value");
  expect_eq_str(format_run_id(1234567), "run_1234567", "Wide ids are not truncated");
}

void test_random_run_ids() {
  RandomRunIdGenerator a(7);
  RandomRunIdGenerator b(7);
  bool same = true;
  for (int i = 0; i < 16; ++i) same = same && (a.next() == b.next());
  expect_true(same, "Same seed reproduces the same id sequence");

  RandomRunIdGenerator g(12345);
  std::set<std::string> seen;
  bool well_formed = true;
  for (int i = 0; i < 1000; ++i) {
    const std::string id = g.next();
    well_formed = well_formed && id.size() == 10 && id.rfind("run_", 0) == 0;
    seen.insert(id);
  }
  expect_true(well_formed, "Random ids are run_ plus six digits");
  expect_true(seen.size() >= 990, "Random ids are effectively unique over 1000 draws");

  auto def = make_default_run_id_generator();
  expect_true(def != nullptr && def->next().rfind("run_", 0) == 0, "Default generator produces run ids");
}

void test_rng_bounds() {
  SplitMix64 rng(99);
  bool in_range = true;
  for (int i = 0; i < 10000; ++i) in_range = in_range && rng.next_below(10) < 10;
  expect_true(in_range, "next_below stays inside its bound");
  expect_true(rng.next_below(0) == 0, "next_below(0) yields 0");
}

void test_log_levels() {
  expect_true(parse_log_level("debug") == LogLevel::DEBUG, "Parse 'debug'");
  expect_true(parse_log_level("Warning") == LogLevel::WARN, "Parse 'Warning'");
  expect_true(parse_log_level("ERROR") == LogLevel::ERROR, "Parse 'ERROR'");
  expect_true(!parse_log_level("bogus").has_value(), "Unknown level is rejected");
  expect_true(!parse_log_level("").has_value(), "Empty level is rejected");
  expect_true(!parse_log_level("INFOX").has_value(), "Level with trailing junk is rejected");
  expect_eq_str(to_string(LogLevel::WARN), "WARN", "WARN tag");

  const LogLevel prev = get_log_level();
  set_log_level(LogLevel::ERROR);
  expect_true(get_log_level() == LogLevel::ERROR, "set_log_level round-trips");
  set_log_level(prev);
}

}  // namespace
}  // namespace gate

int main() {
  using namespace gate;

  test_settings_defaults();
  test_settings_rejects_bad_values();
  test_bridge_config();
  test_sequential_run_ids();
  test_random_run_ids();
  test_rng_bounds();
  test_log_levels();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
