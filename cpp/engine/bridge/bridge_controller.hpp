#pragma once
/*
================================================================================
Fragment 3.3 - Bridge: Dual-Portal Controller
FILE: cpp/engine/bridge/bridge_controller.hpp

Purpose:
  - Own two portals, form a bridge between them and gate a one-shot payload
    transfer on the bridge strength.
  - Keep a per-run audit log of every control decision.

Lifecycle:
  initialize_run -> (caller advances portal energy) -> form_bridge (any number
  of times, each a full recomputation) -> transfer_payload (succeeds at most
  once per formation) -> reset.

Operator controls (any time after construction):
  - set_portal_power / adjust_portal_energy: per-portal energy in
    PortalSettings::energy_step_J steps.
  - scan_portal / lock_portal / unlock_all: transport readiness is reported
    once both portals are locked. Locks are advisory; transfer_payload does
    not consult them.
  - apply_optimal: re-form the bridge at an approved sweep optimum's energy
    input. Detune stays fixed.

Error model:
  - Run operations never throw. Transfer failures come back in TransferOutcome;
    the stability penalty and the safety veto show up as reduced strength plus
    an audit entry.
  - Construction throws ValidationError for bad settings/config and gate::Error
    for missing collaborators.

Threading:
  - Not synchronized. One caller at a time per controller.
================================================================================
*/

#include "engine/bridge/bridge_strength.hpp"
#include "engine/bridge/transfer_outcome.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/run_id.hpp"
#include "engine/core/settings.hpp"
#include "engine/portal/portal.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gate {

struct SweepReport;

enum class PortalId { A, B };

inline const char* to_string(PortalId id) noexcept {
  return id == PortalId::A ? "A" : "B";
}

enum class EnergyAdjust { Increase, Decrease };

// Read-only snapshot of one portal as the operator sees it.
struct PortalScan {
  PortalId portal = PortalId::A;
  double freq_hz = 0.0;
  double energy_J = 0.0;
  double stability = 0.0;
  bool safe = false;
  bool has_payload = false;
  bool powered = false;
  bool locked = false;
};

// Per-controller construction parameters. Read once.
struct BridgeConfig {
  double base_frequency_hz = 7.83;  // portal A
  double detune_hz = 0.08;          // portal B = A + detune
  double energy_rate_W = 500.0;     // charging power for both portals

  void validate_or_throw() const;

  static BridgeConfig from_settings(const SimSettings& s);
};

// Sensor readings for initialize_run. Absent values are forwarded as absent.
struct RunInputs {
  std::optional<double> payload_volume_L;
  std::optional<double> payload_mass_kg;
  std::optional<double> floor_temp_a_C;
  std::optional<bool> floor_contact_a;
  std::optional<double> floor_temp_b_C;
  std::optional<bool> floor_contact_b;
};

class BridgeController final {
 public:
  // Builds two ResonancePortal instances from the config.
  BridgeController(const BridgeConfig& cfg,
                   const SimSettings& settings,
                   std::unique_ptr<IRunIdGenerator> run_ids);

  // Injects the portals; portal_b is expected to sit at base + detune.
  BridgeController(std::unique_ptr<IPortal> portal_a,
                   std::unique_ptr<IPortal> portal_b,
                   double detune_hz,
                   const SimSettings& settings,
                   std::unique_ptr<IRunIdGenerator> run_ids);

  BridgeController(const BridgeController&) = delete;
  BridgeController& operator=(const BridgeController&) = delete;
  BridgeController(BridgeController&&) noexcept = default;
  BridgeController& operator=(BridgeController&&) noexcept = default;

  void initialize_run(std::optional<double> payload_volume_L = std::nullopt,
                      std::optional<double> payload_mass_kg = std::nullopt,
                      std::optional<double> floor_temp_a_C = std::nullopt,
                      std::optional<bool> floor_contact_a = std::nullopt,
                      std::optional<double> floor_temp_b_C = std::nullopt,
                      std::optional<bool> floor_contact_b = std::nullopt);

  void initialize_run(const RunInputs& in);

  // energy_input defaults to the lesser of the two portal energies.
  void form_bridge(std::optional<double> energy_input_J = std::nullopt);

  TransferOutcome transfer_payload();

  std::vector<std::string> full_status() const;

  void reset();

  // ---- Operator controls ----
  void set_portal_power(PortalId id, bool on);
  void adjust_portal_energy(PortalId id, EnergyAdjust dir);

  PortalScan scan_portal(PortalId id) const;

  // Locks a powered, safe portal holding a payload. Returns the lock state.
  bool lock_portal(PortalId id);
  void unlock_all() noexcept;
  bool portal_locked(PortalId id) const;
  bool transport_ready() const noexcept { return locked_a_ && locked_b_; }

  // Refuses (returns false, logs a warning) unless the report is approved.
  bool apply_optimal(const SweepReport& report);

  IPortal& portal_a() noexcept { return *portal_a_; }
  IPortal& portal_b() noexcept { return *portal_b_; }
  const IPortal& portal_a() const noexcept { return *portal_a_; }
  const IPortal& portal_b() const noexcept { return *portal_b_; }

  double detune_hz() const noexcept { return detune_hz_; }
  double bridge_strength() const noexcept { return bridge_strength_; }
  double transfer_energy_J() const noexcept { return transfer_energy_J_; }
  const std::vector<std::string>& status_log() const noexcept { return status_log_; }
  const std::optional<std::string>& run_id() const noexcept { return run_id_; }
  const SimSettings& settings() const noexcept { return settings_; }

  // Snapshot of the formula inputs for the current portal state.
  BridgeInputs current_inputs(double energy_input_J) const noexcept;

 private:
  void note_(LogLevel lvl, const std::string& msg);
  IPortal& portal_(PortalId id) const;
  bool& lock_flag_(PortalId id);

  std::unique_ptr<IPortal> portal_a_;
  std::unique_ptr<IPortal> portal_b_;
  double detune_hz_;
  SimSettings settings_;
  std::unique_ptr<IRunIdGenerator> run_ids_;

  double bridge_strength_ = 0.0;
  double transfer_energy_J_ = 0.0;
  std::vector<std::string> status_log_;
  std::optional<std::string> run_id_;
  bool locked_a_ = false;
  bool locked_b_ = false;
};

}  // namespace gate
