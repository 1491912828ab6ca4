#pragma once
/*
================================================================================
Fragment 1.4 - Core: Simulation Settings
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize every simulation assumption (resonance constants, bridge gates,
    transfer efficiencies, portal model knobs) in one validated object.
  - Settings are read once when a controller or portal is built; nothing in
    the engine consults process-wide defaults.

Hardening:
  - validate_or_throw() rejects nonsensical values early.
  - Explicit units in every field name.
================================================================================
*/

#include "engine/core/errors.hpp"

#include <cmath>

namespace gate {

// ----------------------------- Resonance -------------------------------------
struct ResonanceSettings {
  // Nominal resonance frequency (Hz). Normalises detune in the bridge
  // minimum-energy term and seeds portal A's default frequency.
  double nominal_frequency_hz = 7.83;

  // Default offset of portal B from portal A (Hz).
  double detune_default_hz = 0.08;

  // Default charging power fed to both portals (W).
  double energy_rate_W = 500.0;

  void validate_or_throw() const {
    if (!std::isfinite(nominal_frequency_hz) || nominal_frequency_hz <= 0.0) {
      throw ValidationError("ResonanceSettings: nominal_frequency_hz must be > 0");
    }
    if (!std::isfinite(detune_default_hz)) {
      throw ValidationError("ResonanceSettings: detune_default_hz must be finite");
    }
    if (!std::isfinite(energy_rate_W) || energy_rate_W < 0.0) {
      throw ValidationError("ResonanceSettings: energy_rate_W must be >= 0");
    }
  }
};

// ----------------------------- Bridge gates ----------------------------------
struct BridgeSettings {
  // Either portal below this stability degrades the bridge.
  double stability_threshold = 0.9;

  // Multiplier applied to the clamped strength when degraded.
  double stability_penalty = 0.7;

  // Strength at or above this level is reported as maximum.
  double max_strength_level = 0.95;

  // Transfers require at least this bridge strength.
  double min_transfer_strength = 0.5;

  // Fraction of available energy delivered across the bridge.
  double transfer_efficiency = 0.8;

  // Delivered energy must strictly exceed this (J).
  double min_transfer_energy_J = 100.0;

  // Fraction of delivered energy debited from each portal on success.
  double transfer_overhead_frac = 0.1;

  void validate_or_throw() const {
    auto in01 = [](double x) { return std::isfinite(x) && x >= 0.0 && x <= 1.0; };
    if (!in01(stability_threshold))    throw ValidationError("BridgeSettings: stability_threshold must be [0,1]");
    if (!in01(stability_penalty))      throw ValidationError("BridgeSettings: stability_penalty must be [0,1]");
    if (!in01(max_strength_level))     throw ValidationError("BridgeSettings: max_strength_level must be [0,1]");
    if (!in01(min_transfer_strength))  throw ValidationError("BridgeSettings: min_transfer_strength must be [0,1]");
    if (!in01(transfer_efficiency))    throw ValidationError("BridgeSettings: transfer_efficiency must be [0,1]");
    if (!in01(transfer_overhead_frac)) throw ValidationError("BridgeSettings: transfer_overhead_frac must be [0,1]");
    if (!std::isfinite(min_transfer_energy_J) || min_transfer_energy_J < 0.0) {
      throw ValidationError("BridgeSettings: min_transfer_energy_J must be >= 0");
    }
  }
};

// ----------------------------- Portal model ----------------------------------
struct PortalSettings {
  // Energy storage ceiling (J).
  double max_energy_J = 20000.0;

  // Payload mass that would drive stability to zero (kg).
  double stability_mass_scale_kg = 1000.0;

  // Heavier payloads trip the safety interlock (kg).
  double max_payload_mass_kg = 500.0;

  // Floor must stay at or below this to keep full coupling (degC).
  double superconducting_temp_C = -150.0;

  // Stability multiplier while the floor is above superconducting_temp_C.
  double warm_floor_stability_factor = 0.85;

  // Floor readings above this trip the safety interlock (degC).
  double max_floor_temp_C = 60.0;

  // Operator energy adjustment granularity (J per step).
  double energy_step_J = 1000.0;

  void validate_or_throw() const {
    if (!std::isfinite(max_energy_J) || max_energy_J <= 0.0) {
      throw ValidationError("PortalSettings: max_energy_J must be > 0");
    }
    if (!std::isfinite(stability_mass_scale_kg) || stability_mass_scale_kg <= 0.0) {
      throw ValidationError("PortalSettings: stability_mass_scale_kg must be > 0");
    }
    if (!std::isfinite(max_payload_mass_kg) || max_payload_mass_kg <= 0.0) {
      throw ValidationError("PortalSettings: max_payload_mass_kg must be > 0");
    }
    if (!std::isfinite(superconducting_temp_C) || superconducting_temp_C < kAbsoluteZeroC) {
      throw ValidationError("PortalSettings: superconducting_temp_C below absolute zero");
    }
    if (!std::isfinite(warm_floor_stability_factor) ||
        warm_floor_stability_factor < 0.0 || warm_floor_stability_factor > 1.0) {
      throw ValidationError("PortalSettings: warm_floor_stability_factor must be [0,1]");
    }
    if (!std::isfinite(max_floor_temp_C) || max_floor_temp_C <= superconducting_temp_C) {
      throw ValidationError("PortalSettings: max_floor_temp_C must exceed superconducting_temp_C");
    }
    if (!std::isfinite(energy_step_J) || energy_step_J <= 0.0 || energy_step_J > max_energy_J) {
      throw ValidationError("PortalSettings: energy_step_J must be in (0, max_energy_J]");
    }
  }

  static constexpr double kAbsoluteZeroC = -273.15;
};

// ----------------------------- SimSettings -----------------------------------
struct SimSettings {
  ResonanceSettings resonance;
  BridgeSettings bridge;
  PortalSettings portal;

  void validate_or_throw() const {
    resonance.validate_or_throw();
    bridge.validate_or_throw();
    portal.validate_or_throw();
  }

  static SimSettings defaults() {
    SimSettings s;
    return s;
  }
};

}  // namespace gate
