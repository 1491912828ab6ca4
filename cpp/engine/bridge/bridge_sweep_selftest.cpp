/*
  Fragment 3.6 - Bridge Sweep Selftest

  Objective
  ---------
  Framework-free checks that the parameter sweep:
    1) lays out the (energy, detune) grid as configured, clipping energy at 0,
    2) picks the first strongest point and approves it against the gate,
    3) rejects a vetoed configuration,
    4) leaves the controller untouched,
    5) feeds apply_optimal, which only accepts an approved report.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "engine/bridge/bridge_controller.hpp"
#include "engine/bridge/bridge_sweep.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/run_id.hpp"

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

void expect_near(double a, double b, std::string_view msg, double tol = 1e-9) {
  if (!(std::fabs(a - b) <= tol)) {
    fail(msg);
    std::cerr << "  got " << a << ", want " << b << "\n";
  } else {
    pass(msg);
  }
}

// Demo run: 75 kg payload, cryogenic floors, 1000 J per portal.
BridgeController make_charged(std::optional<bool> contact_b = true) {
  const SimSettings s = SimSettings::defaults();
  BridgeController ctl(BridgeConfig::from_settings(s), s, std::make_unique<SequentialRunIdGenerator>());
  ctl.initialize_run(0.1, 75.0, -196.0, true, -196.0, contact_b);
  ctl.portal_a().update_energy(2.0);
  ctl.portal_b().update_energy(2.0);
  return ctl;
}

void test_grid_layout() {
  BridgeController ctl = make_charged();
  SweepConfig cfg;  // 1000 J / 0.5 Hz, 5 x 5
  const SweepReport rep = run_parameter_sweep(ctl, cfg);

  expect_true(rep.points.size() == 25, "5 x 5 grid has 25 points");
  if (rep.points.size() != 25) return;

  expect_near(rep.points.front().energy_input_J, 0.0, "Energy axis starts at E0 - range");
  expect_near(rep.points.back().energy_input_J, 2000.0, "Energy axis ends at E0 + range");
  expect_near(rep.points[5].energy_input_J, 500.0, "Energy-major ordering");
  expect_near(rep.points.front().detune_hz, 0.08 - 0.5, "Detune axis starts at detune - range", 1e-12);
  expect_near(rep.points[4].detune_hz, 0.08 + 0.5, "Detune axis ends at detune + range", 1e-12);
  expect_near(rep.points[2].frequency_a_hz, 7.83, "Portal A frequency reported", 1e-12);
  expect_near(rep.points[2].frequency_b_hz, 7.83 + 0.08, "Portal B frequency follows detune", 1e-12);
  expect_near(rep.points[0].bridge_strength, 0.0, "Zero energy input gives zero strength");

  bool bounded = true;
  for (const auto& p : rep.points) bounded = bounded && p.bridge_strength >= 0.0 && p.bridge_strength <= 1.0;
  expect_true(bounded, "Every sweep strength is in [0,1]");
}

void test_optimum_and_approval() {
  BridgeController ctl = make_charged();
  const SweepReport rep = run_parameter_sweep(ctl, SweepConfig{});

  // First energy row reaching the clamp is 1000 J (index 2), first detune column.
  expect_true(rep.optimal_index == 10, "Optimum is the first point at maximal strength");
  expect_near(rep.optimal.bridge_strength, 1.0, "Optimal strength is clamped at 1");
  expect_near(rep.optimal.energy_input_J, 1000.0, "Optimal energy input");
  expect_true(rep.approved, "Full-strength optimum is approved");
  expect_true(rep.summary.find("Sweep evaluated 25 configurations") == 0, "Summary counts configurations");
  expect_true(rep.summary.find("APPROVED") != std::string::npos, "Summary reports approval");
  expect_true(rep.criteria == "Bridge strength >= 0.5 (Optimal: 1.000)", "Criteria text");

  double sum = 0.0;
  for (const auto& p : rep.points) sum += p.bridge_strength;
  expect_near(rep.average_strength, sum / 25.0, "Average strength over all points", 1e-12);
}

void test_single_point_and_clipping() {
  BridgeController ctl = make_charged();

  SweepConfig one;
  one.energy_steps = 1;
  one.detune_steps = 1;
  const SweepReport r1 = run_parameter_sweep(ctl, one);
  expect_true(r1.points.size() == 1, "1 x 1 sweep has one point");
  if (!r1.points.empty()) {
    expect_near(r1.points[0].energy_input_J, 1000.0, "Single point uses the current energy");
    expect_near(r1.points[0].detune_hz, 0.08, "Single point uses the current detune", 1e-12);
  }

  SweepConfig wide;
  wide.energy_range_J = 2000.0;
  wide.energy_steps = 3;
  wide.detune_steps = 1;
  const SweepReport r2 = run_parameter_sweep(ctl, wide);
  expect_true(r2.points.size() == 3, "3 x 1 sweep has three points");
  if (r2.points.size() == 3) {
    expect_near(r2.points[0].energy_input_J, 0.0, "Energy axis clipped at zero");
    expect_near(r2.points[1].energy_input_J, 1500.0, "Clipped axis stays evenly spaced");
    expect_near(r2.points[2].energy_input_J, 3000.0, "Upper bound not clipped");
  }
}

void test_vetoed_sweep_rejected() {
  BridgeController ctl = make_charged(false);
  const SweepReport rep = run_parameter_sweep(ctl, SweepConfig{});
  expect_near(rep.optimal.bridge_strength, 0.0, "Unsafe portal keeps every point at zero");
  expect_true(rep.optimal_index == 0, "All-zero sweep keeps the first point as optimum");
  expect_true(!rep.approved, "Vetoed sweep is rejected");
  expect_true(rep.summary.find("REJECTED") != std::string::npos, "Summary reports rejection");
}

void test_sweep_is_read_only() {
  BridgeController ctl = make_charged();
  ctl.form_bridge();
  const double strength = ctl.bridge_strength();
  const double energy = ctl.transfer_energy_J();
  const auto log = ctl.status_log();
  const double ea = ctl.portal_a().energy_J();

  (void)run_parameter_sweep(ctl, SweepConfig{});

  expect_true(ctl.bridge_strength() == strength, "Sweep leaves bridge strength alone");
  expect_true(ctl.transfer_energy_J() == energy, "Sweep leaves transfer energy alone");
  expect_true(ctl.status_log() == log, "Sweep adds no audit entries");
  expect_true(ctl.portal_a().energy_J() == ea, "Sweep leaves portal energy alone");
}

void test_invalid_config() {
  BridgeController ctl = make_charged();
  auto rejects = [&](SweepConfig cfg) {
    try {
      (void)run_parameter_sweep(ctl, cfg);
      return false;
    } catch (const ValidationError&) {
      return true;
    }
  };

  SweepConfig c1;
  c1.energy_steps = 0;
  expect_true(rejects(c1), "Zero energy steps rejected");

  SweepConfig c2;
  c2.detune_range_hz = -0.1;
  expect_true(rejects(c2), "Negative detune range rejected");

  SweepConfig c3;
  c3.energy_range_J = NAN;
  expect_true(rejects(c3), "NaN energy range rejected");
}

void test_apply_optimal() {
  BridgeController ctl = make_charged();
  const SweepReport rep = run_parameter_sweep(ctl, SweepConfig{});
  expect_true(ctl.apply_optimal(rep), "Approved optimum is applied");
  expect_near(ctl.transfer_energy_J(), rep.optimal.energy_input_J, "Bridge re-formed at the optimal energy");
  expect_near(ctl.bridge_strength(), 1.0, "Applied optimum reaches full strength");
  expect_near(ctl.detune_hz(), 0.08, "Detune stays fixed", 1e-12);

  const auto& log = ctl.status_log();
  expect_true(log.size() >= 2, "Apply adds audit entries");
  if (log.size() >= 2) {
    expect_true(log[log.size() - 2] == "[INFO] Applying optimal energy input 1000.0 J (detune held at 0.080 Hz)",
                "Apply entry names the energy and the held detune");
    expect_true(log.back() == "[INFO] Bridge formed at maximum strength.", "Formation entry follows");
  }
}

void test_apply_optimal_uses_report_energy() {
  BridgeController ctl = make_charged();
  SweepReport rep;
  rep.approved = true;
  rep.optimal.energy_input_J = 600.0;
  rep.optimal.detune_hz = 0.3;
  rep.points.push_back(rep.optimal);

  expect_true(ctl.apply_optimal(rep), "Hand-built approved report is applied");
  expect_near(ctl.transfer_energy_J(), 600.0, "Energy input taken from the report");
  // min energy 1000 * (1 + 0.08 / 7.83), stability 0.925
  expect_near(ctl.bridge_strength(), 600.0 / (1000.0 * (1.0 + 0.08 / 7.83) * 0.925), "Strength at the report energy",
              1e-12);
  expect_near(ctl.detune_hz(), 0.08, "Report detune is not applied", 1e-12);
}

void test_apply_optimal_refuses_rejected() {
  BridgeController ctl = make_charged(false);
  const SweepReport rep = run_parameter_sweep(ctl, SweepConfig{});
  ctl.form_bridge();
  const double strength = ctl.bridge_strength();
  const double energy = ctl.transfer_energy_J();

  expect_true(!ctl.apply_optimal(rep), "Rejected sweep is not applied");
  expect_true(ctl.bridge_strength() == strength && ctl.transfer_energy_J() == energy,
              "Refusal leaves the bridge alone");
  expect_true(ctl.status_log().back() == "[WARN] Apply optimal refused: sweep not approved.", "Refusal entry");

  SweepReport empty;
  empty.approved = true;
  expect_true(!ctl.apply_optimal(empty), "Report without points is not applied");
}

}  // namespace
}  // namespace gate

int main() {
  using namespace gate;
  set_log_level(LogLevel::ERROR);

  test_grid_layout();
  test_optimum_and_approval();
  test_single_point_and_clipping();
  test_vetoed_sweep_rejected();
  test_sweep_is_read_only();
  test_invalid_config();
  test_apply_optimal();
  test_apply_optimal_uses_report_energy();
  test_apply_optimal_refuses_rejected();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
