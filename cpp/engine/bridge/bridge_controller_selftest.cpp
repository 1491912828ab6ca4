/*
  Fragment 3.5 - Bridge Controller Selftest

  Objective
  ---------
  Framework-free checks of the controller lifecycle:
    1) initialize_run forwards readings verbatim and starts a fresh log/run id.
    2) form_bridge: clamp to [0,1], detune penalty, stability penalty
       composition, safety veto dominance, idempotence.
    3) transfer_payload: strength gate, energy gate, one-shot success with
       energy accounting.
    4) full_status layout and read-only behaviour; reset completeness.
    5) Operator controls: power, energy steps, scan, lock, transport readiness.
    6) End-to-end with the reference ResonancePortal.

  The scripted FakePortal lets each test pin energy/stability/safety directly.
  Non-zero return code indicates failure.
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/bridge/bridge_controller.hpp"
#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/run_id.hpp"
#include "engine/core/text.hpp"

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

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

bool log_contains(const std::vector<std::string>& log, const std::string& needle) {
  return std::any_of(log.begin(), log.end(),
                     [&](const std::string& s) { return s.find(needle) != std::string::npos; });
}

// -----------------------------
// Scripted portal
// -----------------------------
class FakePortal final : public IPortal {
 public:
  explicit FakePortal(double freq) : freq(freq) {}

  void reset() override {
    ++resets;
    on = true;
    energy = 0.0;
    stab = 1.0;
    safe = true;
    payload = false;
  }
  void sense_payload(std::optional<double> v, std::optional<double> m) override {
    volume_in = v;
    mass_in = m;
    payload = v.has_value() && m.has_value();
  }
  void floor_sensor(std::optional<double> t, std::optional<bool> c) override {
    temp_in = t;
    contact_in = c;
  }
  void update_energy(double dt_s) override {
    if (on) energy += 500.0 * dt_s;
  }
  void credit_energy(double j) override {
    if (on) energy = std::min(20000.0, energy + j);
  }
  void debit_energy(double j) override { energy = std::max(0.0, energy - j); }
  void set_powered(bool p) override {
    on = p;
    if (!p) energy = 0.0;
  }
  void clear_payload() noexcept override { payload = false; }

  double energy_J() const noexcept override { return energy; }
  double stability() const noexcept override { return stab; }
  bool safety_status() const noexcept override { return safe; }
  double freq_hz() const noexcept override { return freq; }
  bool has_payload() const noexcept override { return payload; }
  bool powered() const noexcept override { return on; }

  std::vector<std::string> report_status() const override {
    return {"fake portal " + text::fixed(freq, 3) + " energy " + text::fixed(energy, 1)};
  }

  double freq;
  double energy = 0.0;
  double stab = 1.0;
  bool safe = true;
  bool payload = false;
  bool on = true;
  int resets = 0;

  std::optional<double> volume_in, mass_in, temp_in;
  std::optional<bool> contact_in;
};

struct Rig {
  FakePortal* a = nullptr;
  FakePortal* b = nullptr;
  std::unique_ptr<BridgeController> ctl;
};

Rig make_rig(double detune_hz = 0.0) {
  auto a = std::make_unique<FakePortal>(7.83);
  auto b = std::make_unique<FakePortal>(7.83 + detune_hz);
  Rig r;
  r.a = a.get();
  r.b = b.get();
  r.ctl = std::make_unique<BridgeController>(std::move(a), std::move(b), detune_hz, SimSettings::defaults(),
                                             std::make_unique<SequentialRunIdGenerator>());
  return r;
}

// Fresh run with both portals charged and payloads loaded.
Rig make_charged_rig(double energy_a, double energy_b, double detune_hz = 0.0) {
  Rig r = make_rig(detune_hz);
  r.ctl->initialize_run(0.1, 75.0, -196.0, true, -196.0, true);
  r.a->energy = energy_a;
  r.b->energy = energy_b;
  return r;
}

// -----------------------------
// Run initialization
// -----------------------------
void test_initialize_run() {
  Rig r = make_rig();
  r.a->energy = 55.0;
  r.ctl->initialize_run(0.2, 40.0, -190.0, true, 12.5, false);

  expect_true(r.a->resets == 1 && r.b->resets == 1, "initialize_run resets both portals");
  expect_near(r.a->energy, 0.0, "initialize_run clears leftover energy");
  expect_true(r.a->volume_in == 0.2 && r.b->volume_in == 0.2, "Payload volume forwarded to both portals");
  expect_true(r.a->mass_in == 40.0 && r.b->mass_in == 40.0, "Payload mass forwarded to both portals");
  expect_true(r.a->temp_in == -190.0 && r.a->contact_in == true, "Portal A floor reading forwarded");
  expect_true(r.b->temp_in == 12.5 && r.b->contact_in == false, "Portal B floor reading forwarded");

  expect_true(r.ctl->run_id() == std::optional<std::string>("run_000001"), "First run id assigned");
  expect_true(r.ctl->status_log().size() == 1, "Exactly one entry after initialize_run");
  if (!r.ctl->status_log().empty()) {
    expect_eq_str(r.ctl->status_log()[0], "[INFO] Run run_000001 initialized.", "Initialization entry names the run");
  }

  r.ctl->form_bridge();
  r.ctl->initialize_run();
  expect_true(r.ctl->run_id() == std::optional<std::string>("run_000002"), "Run id regenerated on re-initialization");
  expect_true(r.ctl->status_log().size() == 1, "Re-initialization clears the log");
  expect_true(!r.a->volume_in && !r.a->mass_in && !r.a->temp_in && !r.a->contact_in,
              "Absent readings are forwarded as absent");
}

void test_initialize_run_with_inputs() {
  Rig r = make_rig();
  RunInputs in;
  in.payload_volume_L = 0.5;
  in.floor_contact_b = true;
  r.ctl->initialize_run(in);
  expect_true(r.a->volume_in == 0.5 && !r.a->mass_in, "RunInputs overload forwards fields");
  expect_true(r.b->contact_in == true && !r.b->temp_in, "RunInputs overload forwards portal B fields");
}

// -----------------------------
// Bridge formation
// -----------------------------
void test_maximum_strength_example() {
  Rig r = make_charged_rig(1000.0, 1000.0);
  r.ctl->form_bridge();

  expect_near(r.ctl->bridge_strength(), 1.0, "1000 J, stability 1, detune 0 gives strength 1");
  expect_near(r.ctl->transfer_energy_J(), 1000.0, "Requested energy recorded");
  expect_eq_str(r.ctl->status_log().back(), "[INFO] Bridge formed at maximum strength.", "Maximum strength entry");
}

void test_default_energy_input_is_min() {
  Rig r = make_charged_rig(1000.0, 400.0);
  r.ctl->form_bridge();
  expect_near(r.ctl->transfer_energy_J(), 400.0, "Default energy input is the lesser portal energy");
  expect_near(r.ctl->bridge_strength(), 0.4, "Strength from the lesser energy");
  expect_eq_str(r.ctl->status_log().back(), "[INFO] Bridge strength updated: 0.40", "Strength entry has two decimals");
}

void test_detune_penalty() {
  // |detune| / f_nominal = 0.783 / 7.83 = 0.1
  Rig r = make_charged_rig(1000.0, 1000.0, 0.783);
  r.ctl->form_bridge();
  expect_near(r.ctl->bridge_strength(), 1000.0 / 1100.0, "Detune raises the minimum energy", 1e-9);

  Rig n = make_charged_rig(1000.0, 1000.0, -0.783);
  n.ctl->form_bridge();
  expect_near(n.ctl->bridge_strength(), r.ctl->bridge_strength(), "Detune sign does not matter", 1e-12);
}

void test_clamp_invariant() {
  const double detunes[] = {-50.0, -1.0, 0.0, 0.08, 3.0, 100.0};
  const double stabs_a[] = {0.0, 0.1, 0.5, 0.89, 0.9, 1.0, 1.5};
  const double stabs_b[] = {0.5, 1.0};
  const double inputs[] = {-100.0, 0.0, 10.0, 500.0, 1000.0, 5000.0, 1e12};

  bool ok = true;
  for (double d : detunes) {
    Rig r = make_charged_rig(1000.0, 800.0, d);
    for (double sa : stabs_a) {
      for (double sb : stabs_b) {
        for (double e : inputs) {
          r.a->stab = sa;
          r.b->stab = sb;
          r.ctl->form_bridge(e);
          const double s = r.ctl->bridge_strength();
          ok = ok && s >= 0.0 && s <= 1.0 && r.ctl->transfer_energy_J() >= 0.0;
        }
      }
    }
  }
  expect_true(ok, "Strength stays in [0,1] and transfer energy non-negative over the grid");

  Rig z = make_charged_rig(1000.0, 1000.0);
  z.ctl->form_bridge(NAN);
  expect_near(z.ctl->bridge_strength(), 0.0, "NaN energy input yields zero strength");
  expect_near(z.ctl->transfer_energy_J(), 0.0, "NaN energy input is not recorded");
}

void test_zero_energy_guard() {
  Rig r = make_charged_rig(0.0, 0.0);
  r.ctl->form_bridge();
  expect_near(r.ctl->bridge_strength(), 0.0, "Zero portal energy yields zero strength without dividing");
  expect_eq_str(r.ctl->status_log().back(), "[INFO] Bridge strength updated: 0.00", "Zero strength entry");
}

void test_stability_penalty_composition() {
  Rig r = make_charged_rig(1000.0, 1000.0);
  r.b->stab = 0.8;
  r.ctl->form_bridge(600.0);
  expect_near(r.ctl->bridge_strength(), 0.7 * 0.6, "Portal B instability scales strength by 0.7");
  expect_true(log_contains(r.ctl->status_log(), "[WARN] Portal stability below threshold"), "Degradation is logged");

  Rig q = make_charged_rig(1000.0, 1000.0);
  q.a->stab = 0.85;
  q.ctl->form_bridge(500.0);
  const double unpenalized = std::clamp(500.0 / (1000.0 * 0.85), 0.0, 1.0);
  expect_near(q.ctl->bridge_strength(), 0.7 * unpenalized, "Portal A instability penalty stacks on the ratio");

  Rig c = make_charged_rig(1000.0, 1000.0);
  c.a->stab = 0.5;
  c.ctl->form_bridge(1000.0);
  expect_near(c.ctl->bridge_strength(), 0.7, "Penalty applies after the clamp");
}

void test_stability_asymmetry() {
  Rig r = make_charged_rig(1000.0, 1000.0);
  r.b->stab = 0.95;
  r.ctl->form_bridge(900.0);
  expect_near(r.ctl->bridge_strength(), 0.9, "Portal B stability stays out of the ratio");

  r.b->stab = 1.0;
  r.a->stab = 0.95;
  r.ctl->form_bridge(900.0);
  expect_near(r.ctl->bridge_strength(), 900.0 / 950.0, "Portal A stability divides the ratio");
}

void test_safety_veto() {
  Rig r = make_charged_rig(1000.0, 1000.0);
  r.a->safe = false;
  r.ctl->form_bridge();
  expect_near(r.ctl->bridge_strength(), 0.0, "Unsafe portal A vetoes the bridge");
  expect_true(log_contains(r.ctl->status_log(), "[ERROR] Safety failure - bridge formation blocked."),
              "Veto is logged as an error");
  expect_eq_str(r.ctl->status_log().back(), "[INFO] Bridge strength updated: 0.00", "Final entry reports zero");

  Rig s = make_charged_rig(1e6, 1e6);
  s.b->safe = false;
  s.b->stab = 0.1;
  s.ctl->form_bridge(1e9);
  expect_near(s.ctl->bridge_strength(), 0.0, "Unsafe portal B vetoes regardless of energy or stability");
}

void test_formation_idempotent() {
  Rig r = make_charged_rig(1000.0, 900.0, 0.3);
  r.a->stab = 0.88;
  r.ctl->form_bridge(700.0);
  const double first = r.ctl->bridge_strength();
  const std::size_t n = r.ctl->status_log().size();
  r.ctl->form_bridge(700.0);
  expect_true(r.ctl->bridge_strength() == first, "Repeated formation gives identical strength");
  expect_true(r.ctl->status_log().size() == n + 2, "Each formation appends its own entries");

  r.ctl->form_bridge(0.0);
  r.ctl->form_bridge(700.0);
  expect_true(r.ctl->bridge_strength() == first, "Formation keeps no memory of prior calls");
}

// -----------------------------
// Payload transfer
// -----------------------------
void test_transfer_success_one_shot() {
  Rig r = make_charged_rig(1000.0, 1000.0);
  r.ctl->form_bridge();
  const TransferOutcome t = r.ctl->transfer_payload();

  expect_true(t.success && t.failure == TransferFailure::None && t.reason.empty(), "Transfer succeeds");
  expect_near(t.energy_transferred_J, 800.0, "80% of 1000 J transferred");
  expect_near(t.energy_consumed_J, 80.0, "10% overhead consumed");
  expect_true(t.payloads_cleared && t.bridge_reset, "Outcome flags payload and bridge reset");
  expect_near(r.a->energy, 920.0, "Portal A debited");
  expect_near(r.b->energy, 920.0, "Portal B debited");
  expect_true(!r.a->payload && !r.b->payload, "Both payloads cleared");
  expect_near(r.ctl->bridge_strength(), 0.0, "Bridge strength reset after success");
  expect_near(r.ctl->transfer_energy_J(), 800.0, "Transfer energy holds the executed amount");
  expect_eq_str(r.ctl->status_log().back(), "[INFO] Transfer success: 800.0 J transferred, payloads cleared",
                "Success entry");

  const TransferOutcome again = r.ctl->transfer_payload();
  expect_true(!again.success && again.failure == TransferFailure::InsufficientBridgeStrength,
              "Second transfer fails on strength");
  expect_near(r.a->energy, 920.0, "Failed transfer does not debit");
}

void test_transfer_uses_lesser_energy() {
  Rig r = make_charged_rig(1000.0, 50.0);
  r.ctl->form_bridge(1000.0);
  expect_near(r.ctl->bridge_strength(), 1.0, "Explicit input against portal A energy forms a full bridge");
  // available = min(1000, 50) -> 40 J delivered, below the gate
  const TransferOutcome t = r.ctl->transfer_payload();
  expect_true(!t.success && t.failure == TransferFailure::InsufficientTransferEnergy,
              "Drained portal B fails the energy gate");
}

void test_transfer_strength_gate() {
  Rig r = make_charged_rig(1000.0, 1000.0);
  r.b->stab = 0.8;
  r.ctl->form_bridge(600.0);  // 0.42
  const double before = r.ctl->bridge_strength();
  const TransferOutcome t = r.ctl->transfer_payload();

  expect_true(!t.success, "Weak bridge fails");
  expect_true(t.failure == TransferFailure::InsufficientBridgeStrength, "Failure kind is strength");
  expect_eq_str(t.reason, "Insufficient bridge strength", "Failure reason text");
  expect_true(r.ctl->bridge_strength() == before, "Strength unchanged on gated failure");
  expect_near(r.ctl->transfer_energy_J(), 600.0, "Transfer energy unchanged on gated failure");
  expect_true(r.a->payload && r.b->payload, "Payloads kept on gated failure");
  expect_near(r.a->energy, 1000.0, "No debit on gated failure");
  expect_true(log_contains(r.ctl->status_log(), "bridge strength 0.420 < 0.500 minimum"),
              "Gate entry reports strength to three decimals");
}

void test_transfer_energy_gate() {
  Rig r = make_charged_rig(100.0, 100.0);
  r.ctl->form_bridge();
  expect_near(r.ctl->bridge_strength(), 1.0, "Small equal energies still form a full bridge");

  const TransferOutcome t = r.ctl->transfer_payload();
  expect_true(!t.success && t.failure == TransferFailure::InsufficientTransferEnergy, "80 J fails the energy gate");
  expect_eq_str(t.reason, "Insufficient transfer energy", "Energy failure reason text");
  expect_near(r.ctl->transfer_energy_J(), 80.0, "Attempted amount recorded");
  expect_near(r.ctl->bridge_strength(), 1.0, "Strength kept on energy failure");
  expect_near(r.a->energy, 100.0, "No debit on energy failure");
  expect_true(r.a->payload && r.b->payload, "Payloads kept on energy failure");
  expect_true(log_contains(r.ctl->status_log(), "insufficient transfer energy 80.0 J"), "Shortfall is logged");
}

// -----------------------------
// Status + reset
// -----------------------------
void test_full_status() {
  Rig r = make_rig(0.5);
  const auto before = r.ctl->full_status();
  expect_true(before.size() == 8, "Status before any run has header, two portal reports, no log");
  if (before.size() == 8) {
    expect_eq_str(before[0], "Run ID: None", "Unset run id renders as None");
    expect_eq_str(before[1], "Portal A freq: 7.830 Hz, stability: 1.00, safety: true", "Portal A line");
    expect_eq_str(before[2], "Portal B freq: 8.330 Hz, stability: 1.00, safety: true", "Portal B line");
    expect_eq_str(before[3], "Detune: 0.500 Hz", "Detune line");
    expect_eq_str(before[4], "Bridge strength: 0.00, transfer energy: 0.00 J", "Bridge line");
    expect_eq_str(before[5], "Status log:", "Log header");
    expect_eq_str(before[6], "fake portal 7.830 energy 0.0", "Portal A report follows");
    expect_eq_str(before[7], "fake portal 8.330 energy 0.0", "Portal B report follows");
  }

  r.ctl->initialize_run();
  r.a->energy = 1000.0;
  r.b->energy = 1000.0;
  r.ctl->form_bridge();
  const auto log_before = r.ctl->status_log();
  const auto s1 = r.ctl->full_status();
  const auto s2 = r.ctl->full_status();
  expect_true(s1 == s2, "full_status is repeatable");
  expect_true(r.ctl->status_log() == log_before, "full_status does not touch the log");
  expect_true(s1.size() == 8 + log_before.size(), "Controller log appended in full");
  if (s1.size() == 8 + log_before.size()) {
    expect_eq_str(s1[0], "Run ID: run_000001", "Run id line");
    expect_true(std::equal(log_before.begin(), log_before.end(), s1.begin() + 8), "Log entries in order at the end");
  }
}

void test_reset() {
  Rig r = make_charged_rig(1000.0, 1000.0);
  r.ctl->form_bridge();
  r.ctl->reset();

  expect_near(r.ctl->bridge_strength(), 0.0, "Reset zeroes strength");
  expect_near(r.ctl->transfer_energy_J(), 0.0, "Reset zeroes transfer energy");
  expect_true(r.ctl->status_log().empty(), "Reset clears the log");
  expect_true(!r.ctl->run_id().has_value(), "Reset unsets the run id");
  expect_true(r.a->resets == 2 && r.b->resets == 2, "Reset resets both portals");
  expect_near(r.a->energy, 0.0, "Portal energy back to baseline");

  r.ctl->form_bridge();
  expect_near(r.ctl->bridge_strength(), 0.0, "Formation after reset yields zero");
  const TransferOutcome t = r.ctl->transfer_payload();
  expect_true(!t.success && t.failure == TransferFailure::InsufficientBridgeStrength,
              "Transfer after reset fails predictably");
}

void test_constructor_rejects_null() {
  bool threw = false;
  try {
    BridgeController ctl(nullptr, std::make_unique<FakePortal>(7.83), 0.0, SimSettings::defaults(),
                         std::make_unique<SequentialRunIdGenerator>());
  } catch (const Error& e) {
    threw = e.code() == ErrorCode::kInvalidArgument;
  }
  expect_true(threw, "Null portal rejected with InvalidArgument");

  threw = false;
  try {
    BridgeController ctl(std::make_unique<FakePortal>(7.83), std::make_unique<FakePortal>(7.83), 0.0,
                         SimSettings::defaults(), nullptr);
  } catch (const Error& e) {
    threw = e.code() == ErrorCode::kInvalidArgument;
  }
  expect_true(threw, "Null run id generator rejected");
}

// -----------------------------
// Operator controls
// -----------------------------
void test_power_toggle() {
  Rig r = make_charged_rig(3000.0, 3000.0);
  r.ctl->set_portal_power(PortalId::A, false);
  expect_true(!r.a->on && r.b->on, "Power toggle addresses one portal");
  expect_near(r.a->energy, 0.0, "Powering down drains stored energy");
  expect_eq_str(r.ctl->status_log().back(), "[INFO] Portal A powered down.", "Power-down entry");

  const std::size_t before = r.ctl->status_log().size();
  r.ctl->adjust_portal_energy(PortalId::A, EnergyAdjust::Increase);
  expect_near(r.a->energy, 0.0, "Powered-down portal ignores energy increases");
  expect_true(r.ctl->status_log().size() == before + 1, "Ignored adjustment is logged");
  expect_eq_str(r.ctl->status_log().back(),
                "[WARN] Portal A energy adjustment ignored: portal powered down.",
                "Ignored adjustment entry");

  r.ctl->set_portal_power(PortalId::A, true);
  r.ctl->adjust_portal_energy(PortalId::A, EnergyAdjust::Increase);
  expect_near(r.a->energy, 1000.0, "Powered portal accepts one energy step");
  expect_eq_str(r.ctl->status_log().back(), "[INFO] Portal A energy increased to 1000.0 J",
                "Increase entry reports the new level");
}

void test_energy_steps() {
  Rig r = make_charged_rig(2500.0, 19500.0);
  r.ctl->adjust_portal_energy(PortalId::A, EnergyAdjust::Decrease);
  expect_near(r.a->energy, 1500.0, "Decrease removes one step");
  r.ctl->adjust_portal_energy(PortalId::A, EnergyAdjust::Decrease);
  r.ctl->adjust_portal_energy(PortalId::A, EnergyAdjust::Decrease);
  expect_near(r.a->energy, 0.0, "Decrease floors at zero");
  expect_eq_str(r.ctl->status_log().back(), "[INFO] Portal A energy decreased to 0.0 J", "Decrease entry");

  r.ctl->adjust_portal_energy(PortalId::B, EnergyAdjust::Increase);
  expect_near(r.b->energy, 20000.0, "Increase caps at the storage ceiling");
  expect_near(r.a->energy, 0.0, "Adjusting B leaves A alone");
}

void test_scan_portal() {
  Rig r = make_charged_rig(1200.0, 900.0, 0.08);
  r.b->stab = 0.8;
  r.b->safe = false;

  const PortalScan a = r.ctl->scan_portal(PortalId::A);
  const PortalScan b = r.ctl->scan_portal(PortalId::B);
  expect_true(a.portal == PortalId::A && b.portal == PortalId::B, "Scan names its portal");
  expect_near(a.energy_J, 1200.0, "Scan reports portal A energy");
  expect_near(b.freq_hz, 7.91, "Scan reports portal B frequency", 1e-12);
  expect_near(b.stability, 0.8, "Scan reports stability");
  expect_true(a.safe && !b.safe, "Scan reports safety");
  expect_true(a.has_payload && a.powered && !a.locked, "Scan reports payload, power and lock");

  const std::size_t before = r.ctl->status_log().size();
  (void)r.ctl->scan_portal(PortalId::A);
  expect_true(r.ctl->status_log().size() == before, "Scanning does not log");
}

void test_lock_and_transport_ready() {
  Rig r = make_charged_rig(1000.0, 1000.0);
  expect_true(!r.ctl->transport_ready(), "Fresh run is not transport ready");

  expect_true(r.ctl->lock_portal(PortalId::A), "Safe loaded portal A locks");
  expect_true(r.ctl->portal_locked(PortalId::A) && !r.ctl->transport_ready(), "One lock is not enough");
  expect_eq_str(r.ctl->status_log().back(), "[INFO] Portal A locked for transport.", "Lock entry");

  expect_true(r.ctl->lock_portal(PortalId::B), "Safe loaded portal B locks");
  expect_true(r.ctl->transport_ready(), "Both locks make transport ready");
  expect_eq_str(r.ctl->status_log().back(), "[INFO] Transport ready: both portals locked.", "Readiness entry");
  expect_true(r.ctl->scan_portal(PortalId::B).locked, "Scan reflects the lock");

  r.ctl->unlock_all();
  expect_true(!r.ctl->portal_locked(PortalId::A) && !r.ctl->transport_ready(), "unlock_all clears both locks");
}

void test_lock_refusals() {
  Rig r = make_charged_rig(1000.0, 1000.0);
  r.b->safe = false;
  expect_true(!r.ctl->lock_portal(PortalId::B), "Unsafe portal does not lock");
  expect_eq_str(r.ctl->status_log().back(), "[WARN] Portal B lock refused: safety fault.", "Safety refusal entry");

  r.a->payload = false;
  expect_true(!r.ctl->lock_portal(PortalId::A), "Empty portal does not lock");
  expect_eq_str(r.ctl->status_log().back(), "[WARN] Portal A lock refused: no payload.", "Payload refusal entry");

  r.a->payload = true;
  r.ctl->set_portal_power(PortalId::A, false);
  expect_true(!r.ctl->lock_portal(PortalId::A), "Powered-down portal does not lock");

  r.ctl->set_portal_power(PortalId::A, true);
  expect_true(r.ctl->lock_portal(PortalId::A), "Re-powered portal locks");
  r.ctl->set_portal_power(PortalId::A, false);
  expect_true(!r.ctl->portal_locked(PortalId::A), "Powering down releases the lock");
}

void test_locks_cleared_by_run_events() {
  Rig r = make_charged_rig(1000.0, 1000.0);
  r.ctl->lock_portal(PortalId::A);
  r.ctl->lock_portal(PortalId::B);
  r.ctl->form_bridge();
  expect_true(r.ctl->transfer_payload().success, "Locked transfer succeeds");
  expect_true(!r.ctl->transport_ready(), "Successful transfer releases the locks");

  r.ctl->initialize_run(0.1, 75.0, -196.0, true, -196.0, true);
  r.ctl->lock_portal(PortalId::A);
  r.ctl->initialize_run(0.1, 75.0, -196.0, true, -196.0, true);
  expect_true(!r.ctl->portal_locked(PortalId::A), "initialize_run releases locks");

  r.ctl->lock_portal(PortalId::A);
  r.ctl->reset();
  expect_true(!r.ctl->portal_locked(PortalId::A), "reset releases locks");
}

void test_unknown_portal_id_rejected() {
  Rig r = make_charged_rig(1000.0, 1000.0);
  bool threw = false;
  try {
    r.ctl->lock_portal(static_cast<PortalId>(7));
  } catch (const Error& e) {
    threw = e.code() == ErrorCode::kOutOfRange;
  }
  expect_true(threw, "Unknown portal id rejected with OutOfRange");
}

// -----------------------------
// Reference portals
// -----------------------------
BridgeController make_reference() {
  const SimSettings s = SimSettings::defaults();
  return BridgeController(BridgeConfig::from_settings(s), s, std::make_unique<SequentialRunIdGenerator>());
}

void test_reference_end_to_end() {
  BridgeController ctl = make_reference();
  ctl.initialize_run(0.1, 75.0, -196.0, true, -196.0, true);
  ctl.portal_a().update_energy(2.0);
  ctl.portal_b().update_energy(2.0);

  expect_near(ctl.portal_a().freq_hz(), 7.83, "Portal A at base frequency");
  expect_near(ctl.portal_b().freq_hz(), 7.91, "Portal B at base + detune", 1e-12);

  ctl.form_bridge();
  expect_near(ctl.bridge_strength(), 1.0, "Charged cryogenic run reaches full strength");

  const TransferOutcome t = ctl.transfer_payload();
  expect_true(t.success, "Reference transfer succeeds");
  expect_near(t.energy_transferred_J, 800.0, "Reference transfer moves 800 J");
  expect_near(ctl.portal_a().energy_J(), 920.0, "Reference portal A keeps 920 J");
  expect_near(ctl.portal_b().energy_J(), 920.0, "Reference portal B keeps 920 J");
  expect_true(!ctl.portal_a().has_payload() && !ctl.portal_b().has_payload(), "Reference payloads cleared");

  const auto st = ctl.full_status();
  expect_true(st.size() >= 12, "Reference status has two three-line portal reports");
  if (st.size() >= 12) {
    expect_eq_str(st[2], "Portal B freq: 7.910 Hz, stability: 1.00, safety: true", "Portal B line after transfer");
    expect_eq_str(st[4], "Bridge strength: 0.00, transfer energy: 800.00 J", "Bridge line after transfer");
  }

  ctl.reset();
  expect_true(ctl.full_status().size() == 12, "After reset only header and portal reports remain");
  expect_near(ctl.portal_a().energy_J(), 0.0, "Reference portal energy reset");
}

void test_reference_warm_floor_degrades() {
  BridgeController ctl = make_reference();
  ctl.initialize_run(0.1, 75.0, 25.0, true, -196.0, true);
  ctl.portal_a().update_energy(2.0);
  ctl.portal_b().update_energy(2.0);
  ctl.form_bridge();

  expect_near(ctl.bridge_strength(), 0.7, "Warm floor triggers the stability penalty on a clamped bridge");
  const TransferOutcome t = ctl.transfer_payload();
  expect_true(t.success, "Degraded bridge still transfers");
  expect_near(t.energy_transferred_J, 1000.0 * 0.7 * 0.8, "Degraded transfer amount");
}

void test_reference_no_contact_vetoes() {
  BridgeController ctl = make_reference();
  ctl.initialize_run(0.1, 75.0, -196.0, true, -196.0, false);
  ctl.portal_a().update_energy(2.0);
  ctl.portal_b().update_energy(2.0);
  ctl.form_bridge();

  expect_near(ctl.bridge_strength(), 0.0, "Ungrounded payload vetoes the bridge");
  expect_true(!ctl.transfer_payload().success, "Vetoed bridge cannot transfer");
}

}  // namespace
}  // namespace gate

int main() {
  using namespace gate;
  set_log_level(LogLevel::ERROR);

  test_initialize_run();
  test_initialize_run_with_inputs();
  test_maximum_strength_example();
  test_default_energy_input_is_min();
  test_detune_penalty();
  test_clamp_invariant();
  test_zero_energy_guard();
  test_stability_penalty_composition();
  test_stability_asymmetry();
  test_safety_veto();
  test_formation_idempotent();
  test_transfer_success_one_shot();
  test_transfer_uses_lesser_energy();
  test_transfer_strength_gate();
  test_transfer_energy_gate();
  test_full_status();
  test_reset();
  test_constructor_rejects_null();
  test_power_toggle();
  test_energy_steps();
  test_scan_portal();
  test_lock_and_transport_ready();
  test_lock_refusals();
  test_locks_cleared_by_run_events();
  test_unknown_portal_id_rejected();
  test_reference_end_to_end();
  test_reference_warm_floor_degrades();
  test_reference_no_contact_vetoes();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
