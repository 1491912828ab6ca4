/*
================================================================================
Fragment 4.1 - CLI: Main Entry Point (gate_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Demonstration front end for the dual-portal bridge engine.

Usage:
  gate_cli [command] [options]

Commands:
  demo    - initialize a run, charge both portals, form the bridge, lock both
            portals, transfer, print the full status, reset, print again
  sweep   - same setup, then sweep bridge strength over energy/detune and
            optionally apply the approved optimum
  help    - show help message

Exit codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation failed
  3 - Computation failed (including a failed transfer)
================================================================================
*/

#include "engine/bridge/bridge_controller.hpp"
#include "engine/bridge/bridge_sweep.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/run_id.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/text.hpp"
#include "engine/portal/payload_materials.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace gate;

namespace {

enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  VALIDATION_FAILED = 2,
  COMPUTATION_FAILED = 3,
};

struct Args {
  std::string command = "help";

  RunInputs run;
  std::optional<std::string> material;
  double dt_s = 2.0;
  std::optional<double> energy_input_J;
  bool power_a = true;
  bool power_b = true;
  int adjust_a_steps = 0;
  int adjust_b_steps = 0;

  std::optional<double> base_freq_hz;
  std::optional<double> detune_hz;
  std::optional<double> energy_rate_W;
  std::optional<std::uint64_t> seed;
  LogLevel log_level = LogLevel::INFO;

  SweepConfig sweep;
  bool apply_optimal = false;
};

void print_help() {
  std::cout << R"(
gate_cli - Dual Portal Bridge Simulator

Usage:
  gate_cli [command] [options]

Commands:
  demo          Run one full bridge cycle and print the status report
  sweep         Run the demo setup, then sweep bridge strength
  help          Show this help message

Run options:
  --volume <L>              Payload volume (default 0.1)
  --mass <kg>               Payload mass (default 75)
  --material <name>         Derive mass from volume (Gold, Lead, Iron, ...)
  --floor-temp-a <C>        Portal A floor temperature (default -196)
  --floor-contact-a 0|1     Portal A floor contact (default 1)
  --floor-temp-b <C>        Portal B floor temperature (default -196)
  --floor-contact-b 0|1     Portal B floor contact (default 1)
  --dt <s>                  Charging time applied to both portals (default 2)
  --energy-input <J>        Bridge energy input (default: min portal energy)
  --power-a 0|1             Portal A power before charging (default 1)
  --power-b 0|1             Portal B power before charging (default 1)
  --adjust-a <n>            Portal A energy steps after charging (+/-, 1000 J each)
  --adjust-b <n>            Portal B energy steps after charging (+/-, 1000 J each)

Controller options:
  --base-freq <Hz>          Portal A frequency
  --detune <Hz>             Portal B offset
  --energy-rate <W>         Charging power
  --seed <n>                Run id seed (default: random)
  --log-level <lvl>         DEBUG|INFO|WARN|ERROR (default INFO)

Sweep options:
  --energy-range <J>        (default 1000)
  --detune-range <Hz>       (default 0.5)
  --energy-steps <n>        (default 5)
  --detune-steps <n>        (default 5)
  --apply-optimal 0|1       Re-form the bridge at an approved optimum (default 0)

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation failed
  3 - Computation failed (including a failed transfer)
)";
}

bool parse_double(const char* s, double* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

bool parse_int(const char* s, int* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const long v = std::strtol(s, &end, 10);
  if (end == s || *end != '\0') return false;
  if (v < -1000000 || v > 1000000) return false;
  *out = static_cast<int>(v);
  return true;
}

bool parse_u64(const char* s, std::uint64_t* out) {
  if (!s || !out || *s == '-') return false;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s, &end, 10);
  if (end == s || *end != '\0') return false;
  *out = static_cast<std::uint64_t>(v);
  return true;
}

bool parse_bool01(const char* s, bool* out) {
  if (!s || !out) return false;
  if (std::strcmp(s, "1") == 0) { *out = true; return true; }
  if (std::strcmp(s, "0") == 0) { *out = false; return true; }
  return false;
}

bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

bool parse_args(int argc, char** argv, Args* a, std::string* err) {
  if (argc >= 2) a->command = argv[1];

  // Demo defaults: a 75 kg payload on cryogenic, grounded floors.
  a->run.payload_volume_L = 0.1;
  a->run.payload_mass_kg = 75.0;
  a->run.floor_temp_a_C = -196.0;
  a->run.floor_contact_a = true;
  a->run.floor_temp_b_C = -196.0;
  a->run.floor_contact_b = true;

  for (int i = 2; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;
    if (!get_next(i, argc, argv, &v)) {
      *err = std::string(k) + " requires a value";
      return false;
    }

    double d = 0.0;
    int n = 0;
    bool b = false;
    auto bad = [&]() {
      *err = std::string("invalid value for ") + k + ": " + v;
      return false;
    };

    if (std::strcmp(k, "--volume") == 0) {
      if (!parse_double(v, &d)) return bad();
      a->run.payload_volume_L = d;
    } else if (std::strcmp(k, "--mass") == 0) {
      if (!parse_double(v, &d)) return bad();
      a->run.payload_mass_kg = d;
    } else if (std::strcmp(k, "--material") == 0) {
      a->material = std::string(v);
    } else if (std::strcmp(k, "--floor-temp-a") == 0) {
      if (!parse_double(v, &d)) return bad();
      a->run.floor_temp_a_C = d;
    } else if (std::strcmp(k, "--floor-contact-a") == 0) {
      if (!parse_bool01(v, &b)) return bad();
      a->run.floor_contact_a = b;
    } else if (std::strcmp(k, "--floor-temp-b") == 0) {
      if (!parse_double(v, &d)) return bad();
      a->run.floor_temp_b_C = d;
    } else if (std::strcmp(k, "--floor-contact-b") == 0) {
      if (!parse_bool01(v, &b)) return bad();
      a->run.floor_contact_b = b;
    } else if (std::strcmp(k, "--dt") == 0) {
      if (!parse_double(v, &d)) return bad();
      a->dt_s = d;
    } else if (std::strcmp(k, "--energy-input") == 0) {
      if (!parse_double(v, &d)) return bad();
      a->energy_input_J = d;
    } else if (std::strcmp(k, "--base-freq") == 0) {
      if (!parse_double(v, &d)) return bad();
      a->base_freq_hz = d;
    } else if (std::strcmp(k, "--detune") == 0) {
      if (!parse_double(v, &d)) return bad();
      a->detune_hz = d;
    } else if (std::strcmp(k, "--energy-rate") == 0) {
      if (!parse_double(v, &d)) return bad();
      a->energy_rate_W = d;
    } else if (std::strcmp(k, "--seed") == 0) {
      std::uint64_t s = 0;
      if (!parse_u64(v, &s)) return bad();
      a->seed = s;
    } else if (std::strcmp(k, "--log-level") == 0) {
      const auto lvl = parse_log_level(v);
      if (!lvl) return bad();
      a->log_level = *lvl;
    } else if (std::strcmp(k, "--power-a") == 0) {
      if (!parse_bool01(v, &a->power_a)) return bad();
    } else if (std::strcmp(k, "--power-b") == 0) {
      if (!parse_bool01(v, &a->power_b)) return bad();
    } else if (std::strcmp(k, "--adjust-a") == 0) {
      if (!parse_int(v, &n) || n < -20 || n > 20) return bad();
      a->adjust_a_steps = n;
    } else if (std::strcmp(k, "--adjust-b") == 0) {
      if (!parse_int(v, &n) || n < -20 || n > 20) return bad();
      a->adjust_b_steps = n;
    } else if (std::strcmp(k, "--apply-optimal") == 0) {
      if (!parse_bool01(v, &a->apply_optimal)) return bad();
    } else if (std::strcmp(k, "--energy-range") == 0) {
      if (!parse_double(v, &d)) return bad();
      a->sweep.energy_range_J = d;
    } else if (std::strcmp(k, "--detune-range") == 0) {
      if (!parse_double(v, &d)) return bad();
      a->sweep.detune_range_hz = d;
    } else if (std::strcmp(k, "--energy-steps") == 0) {
      if (!parse_int(v, &n)) return bad();
      a->sweep.energy_steps = n;
    } else if (std::strcmp(k, "--detune-steps") == 0) {
      if (!parse_int(v, &n)) return bad();
      a->sweep.detune_steps = n;
    } else {
      *err = std::string("unknown option: ") + k;
      return false;
    }
  }
  return true;
}

std::unique_ptr<BridgeController> build_controller(const Args& a) {
  const SimSettings settings = SimSettings::defaults();

  BridgeConfig cfg = BridgeConfig::from_settings(settings);
  if (a.base_freq_hz) cfg.base_frequency_hz = *a.base_freq_hz;
  if (a.detune_hz) cfg.detune_hz = *a.detune_hz;
  if (a.energy_rate_W) cfg.energy_rate_W = *a.energy_rate_W;

  std::unique_ptr<IRunIdGenerator> ids;
  if (a.seed) {
    ids = std::make_unique<RandomRunIdGenerator>(*a.seed);
  } else {
    ids = make_default_run_id_generator();
  }
  return std::make_unique<BridgeController>(cfg, settings, std::move(ids));
}

void apply_steps(BridgeController& ctl, PortalId id, int steps) {
  const EnergyAdjust dir = steps < 0 ? EnergyAdjust::Decrease : EnergyAdjust::Increase;
  for (int i = 0; i < std::abs(steps); ++i) ctl.adjust_portal_energy(id, dir);
}

// initialize_run, power switches, charge both portals for dt, then operator steps.
void prepare_run(BridgeController& ctl, const Args& a) {
  RunInputs in = a.run;
  if (a.material) {
    in.payload_mass_kg = payload_mass_kg(*a.material, in.payload_volume_L.value_or(0.0));
  }
  ctl.initialize_run(in);
  if (!a.power_a) ctl.set_portal_power(PortalId::A, false);
  if (!a.power_b) ctl.set_portal_power(PortalId::B, false);
  ctl.portal_a().update_energy(a.dt_s);
  ctl.portal_b().update_energy(a.dt_s);
  apply_steps(ctl, PortalId::A, a.adjust_a_steps);
  apply_steps(ctl, PortalId::B, a.adjust_b_steps);
}

void print_lines(const std::vector<std::string>& lines) {
  for (const auto& l : lines) std::cout << "  " << l << "\n";
}

int cmd_demo(const Args& a) {
  std::cout << "=== Dual Portal Bridge Demo ===\n";

  auto ctl = build_controller(a);
  prepare_run(*ctl, a);
  ctl->form_bridge(a.energy_input_J);
  ctl->lock_portal(PortalId::A);
  ctl->lock_portal(PortalId::B);
  std::cout << "Transport ready: " << text::yes_no(ctl->transport_ready()) << "\n";
  const TransferOutcome r = ctl->transfer_payload();

  std::cout << "Bridge transfer result: " << (r.success ? "Success" : "Fail") << "\n";
  if (r.success) {
    std::cout << "  Energy transferred: " << text::fixed(r.energy_transferred_J, 1) << " J\n";
    std::cout << "  Energy consumed:    " << text::fixed(r.energy_consumed_J, 1) << " J per portal\n";
  } else {
    std::cout << "  Reason: " << r.reason << "\n";
  }

  std::cout << "\nFull status report:\n";
  print_lines(ctl->full_status());

  ctl->reset();
  std::cout << "\nAfter reset:\n";
  print_lines(ctl->full_status());

  return r.success ? ExitCode::SUCCESS : ExitCode::COMPUTATION_FAILED;
}

int cmd_sweep(const Args& a) {
  std::cout << "=== Bridge Parameter Sweep ===\n";

  auto ctl = build_controller(a);
  prepare_run(*ctl, a);
  const SweepReport rep = run_parameter_sweep(*ctl, a.sweep);

  std::cout << "  energy_J   detune_Hz  freq_b_Hz  strength\n";
  for (const auto& p : rep.points) {
    std::cout << "  " << text::fixed(p.energy_input_J, 1)
              << "  " << text::fixed(p.detune_hz, 3)
              << "  " << text::fixed(p.frequency_b_hz, 3)
              << "  " << text::fixed(p.bridge_strength, 3) << "\n";
  }
  std::cout << "\nOptimal: energy " << text::fixed(rep.optimal.energy_input_J, 1)
            << " J, detune " << text::fixed(rep.optimal.detune_hz, 3) << " Hz\n";
  std::cout << "Criteria: " << rep.criteria << "\n";
  std::cout << rep.summary << "\n";

  if (a.apply_optimal) {
    if (!ctl->apply_optimal(rep)) {
      std::cerr << "Optimal parameters not applied: sweep not approved\n";
      return ExitCode::COMPUTATION_FAILED;
    }
    std::cout << "Applied optimum: bridge strength " << text::fixed(ctl->bridge_strength(), 3)
              << ", transfer energy " << text::fixed(ctl->transfer_energy_J(), 1) << " J\n";
  }
  return ExitCode::SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
  Args a;
  std::string err;
  if (!parse_args(argc, argv, &a, &err)) {
    std::cerr << "Error: " << err << "\n";
    std::cerr << "Run 'gate_cli help' for usage information.\n";
    return ExitCode::INVALID_ARGS;
  }
  set_log_level(a.log_level);

  if (a.command == "help" || a.command == "-h" || a.command == "--help") {
    print_help();
    return ExitCode::SUCCESS;
  }

  try {
    if (a.command == "demo") return cmd_demo(a);
    if (a.command == "sweep") return cmd_sweep(a);
  } catch (const ValidationError& e) {
    std::cerr << "Validation FAILED: " << e.what() << "\n";
    return ExitCode::VALIDATION_FAILED;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return ExitCode::COMPUTATION_FAILED;
  }

  std::cerr << "Unknown command: " << a.command << "\n";
  std::cerr << "Run 'gate_cli help' for usage information.\n";
  return ExitCode::INVALID_ARGS;
}
