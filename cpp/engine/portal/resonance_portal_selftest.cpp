/*
  Fragment 2.4 - Resonance Portal Selftest

  Objective
  ---------
  Framework-free checks for the reference portal model and the payload
  material table: charging, saturation, stability/safety derivation from
  payload and floor readings, credit capping, debit flooring, power
  switching and reset.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>

#include "engine/core/errors.hpp"
#include "engine/core/settings.hpp"
#include "engine/portal/payload_materials.hpp"
#include "engine/portal/resonance_portal.hpp"

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

void expect_validation_error(const std::function<void()>& fn, std::string_view msg) {
  try {
    fn();
    fail(msg);
  } catch (const ValidationError&) {
    pass(msg);
  }
}

ResonancePortal make_portal() {
  return ResonancePortal(7.83, 500.0, PortalSettings{});
}

void test_baseline() {
  ResonancePortal p = make_portal();
  expect_near(p.energy_J(), 0.0, "Baseline energy is zero");
  expect_near(p.stability(), 1.0, "Baseline stability is one");
  expect_true(p.safety_status(), "Baseline is safe");
  expect_true(!p.has_payload(), "Baseline has no payload");

  const auto lines = p.report_status();
  expect_true(lines.size() == 3, "Report has three lines");
  if (lines.size() == 3) {
    expect_eq_str(lines[0], "Portal 7.830 Hz: energy 0.00 J, stability 1.00, safety OK", "Report headline");
    expect_eq_str(lines[1], "  payload: none", "Report payload line");
    expect_eq_str(lines[2], "  floor: temp None C, contact None", "Report floor line");
  }
}

void test_charging() {
  ResonancePortal p = make_portal();
  p.update_energy(2.0);
  expect_near(p.energy_J(), 1000.0, "500 W for 2 s stores 1000 J");
  p.update_energy(0.0);
  expect_near(p.energy_J(), 1000.0, "Zero time step is a no-op");
  p.update_energy(1000.0);
  expect_near(p.energy_J(), PortalSettings{}.max_energy_J, "Energy saturates at max_energy_J");

  expect_validation_error([&] { p.update_energy(-1.0); }, "Negative time step rejected");
  expect_validation_error([&] { p.update_energy(NAN); }, "NaN time step rejected");
}

void test_payload_stability() {
  ResonancePortal p = make_portal();
  p.sense_payload(0.1, 75.0);
  expect_true(p.has_payload(), "Volume + mass registers a payload");
  expect_near(p.stability(), 0.925, "75 kg payload gives stability 0.925");
  expect_true(p.safety_status(), "75 kg payload is safe");

  p.sense_payload(0.1, std::nullopt);
  expect_true(!p.has_payload(), "Missing mass means no payload");
  expect_near(p.stability(), 1.0, "No payload restores stability");

  p.sense_payload(1.0, 600.0);
  expect_near(p.stability(), 0.4, "600 kg payload gives stability 0.4");
  expect_true(!p.safety_status(), "Payload over max mass is unsafe");
}

void test_floor_sensor() {
  ResonancePortal p = make_portal();
  p.sense_payload(0.1, 75.0);

  p.floor_sensor(-196.0, true);
  expect_near(p.stability(), 0.925, "Cryogenic floor keeps full coupling");
  expect_true(p.safety_status(), "Cryogenic grounded floor is safe");

  p.floor_sensor(25.0, true);
  expect_near(p.stability(), 0.925 * 0.85, "Warm floor degrades stability");
  expect_true(p.safety_status(), "Warm floor is still safe");

  p.floor_sensor(80.0, true);
  expect_true(!p.safety_status(), "Overheated floor is unsafe");

  p.floor_sensor(-300.0, true);
  expect_true(!p.safety_status(), "Reading below absolute zero is unsafe");

  p.floor_sensor(-196.0, false);
  expect_true(!p.safety_status(), "Payload without floor contact is unsafe");

  p.floor_sensor(std::nullopt, std::nullopt);
  expect_true(p.safety_status(), "Absent floor readings never trip the interlock");
  expect_near(p.stability(), 0.925, "Absent temperature applies no warm-floor factor");

  p.clear_payload();
  p.floor_sensor(-196.0, false);
  expect_true(p.safety_status(), "No contact without payload is safe");
}

void test_debit_and_clear() {
  ResonancePortal p = make_portal();
  p.sense_payload(0.1, 75.0);
  p.floor_sensor(-196.0, true);
  p.update_energy(2.0);

  p.debit_energy(80.0);
  expect_near(p.energy_J(), 920.0, "Debit subtracts energy");
  p.debit_energy(5000.0);
  expect_near(p.energy_J(), 0.0, "Debit floors at zero");
  expect_validation_error([&] { p.debit_energy(-1.0); }, "Negative debit rejected");

  p.clear_payload();
  expect_true(!p.has_payload(), "clear_payload drops the payload");
  expect_near(p.stability(), 1.0, "Stability recovers once the payload is gone");
}

void test_credit_and_power() {
  ResonancePortal p = make_portal();
  expect_true(p.powered(), "Portal starts powered");

  p.credit_energy(1500.0);
  expect_near(p.energy_J(), 1500.0, "Credit adds energy");
  p.credit_energy(30000.0);
  expect_near(p.energy_J(), 20000.0, "Credit caps at max_energy_J");
  expect_validation_error([&] { p.credit_energy(-1.0); }, "Negative credit rejected");
  expect_validation_error([&] { p.credit_energy(NAN); }, "NaN credit rejected");

  p.set_powered(false);
  expect_true(!p.powered(), "Portal powered down");
  expect_near(p.energy_J(), 0.0, "Powering down drains energy");
  p.update_energy(2.0);
  p.credit_energy(1000.0);
  expect_near(p.energy_J(), 0.0, "Powered-down portal neither charges nor accepts credit");
  const auto lines = p.report_status();
  if (!lines.empty()) {
    expect_eq_str(lines[0], "Portal 7.830 Hz: energy 0.00 J, stability 1.00, safety OK, powered down",
                  "Report headline flags power-down");
  }

  p.set_powered(true);
  p.update_energy(2.0);
  expect_near(p.energy_J(), 1000.0, "Re-powered portal charges again");

  p.set_powered(false);
  p.reset();
  expect_true(p.powered(), "Reset restores power");
}

void test_reset() {
  ResonancePortal p = make_portal();
  p.sense_payload(1.0, 600.0);
  p.floor_sensor(80.0, false);
  p.update_energy(3.0);

  p.reset();
  expect_near(p.energy_J(), 0.0, "Reset clears energy");
  expect_near(p.stability(), 1.0, "Reset restores stability");
  expect_true(p.safety_status(), "Reset restores safety");
  expect_true(!p.has_payload(), "Reset clears payload");
  expect_true(!p.floor().temp_C && !p.floor().contact, "Reset clears floor reading");
  expect_near(p.freq_hz(), 7.83, "Reset keeps frequency");
}

void test_construction() {
  expect_validation_error([] { ResonancePortal p(NAN, 500.0); }, "NaN frequency rejected");
  expect_validation_error([] { ResonancePortal p(7.83, -5.0); }, "Negative power rejected");
  expect_validation_error([] {
    PortalSettings s;
    s.max_energy_J = 0.0;
    ResonancePortal p(7.83, 500.0, s);
  }, "Invalid portal settings rejected");
}

void test_materials() {
  expect_near(payload_mass_kg("Gold", 0.1), 1.93, "0.1 L of gold is 1.93 kg", 1e-12);
  expect_near(payload_mass_kg("Water", 2.0), 2.0, "2 L of water is 2 kg", 1e-12);
  expect_true(payload_materials().size() == 10, "Ten known materials");
  expect_true(!material_density_kg_per_L("gold").has_value(), "Lookup is case-sensitive");
  expect_validation_error([] { payload_mass_kg("Unobtainium", 1.0); }, "Unknown material rejected");
  expect_validation_error([] { payload_mass_kg("Iron", -1.0); }, "Negative volume rejected");
}

}  // namespace
}  // namespace gate

int main() {
  using namespace gate;

  test_baseline();
  test_charging();
  test_payload_stability();
  test_floor_sensor();
  test_debit_and_clear();
  test_credit_and_power();
  test_reset();
  test_construction();
  test_materials();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
