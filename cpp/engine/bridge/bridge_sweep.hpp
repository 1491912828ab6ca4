#pragma once
/*
================================================================================
Fragment 3.4 - Bridge: Parameter Sweep
FILE: cpp/engine/bridge/bridge_sweep.hpp

Purpose:
  - Map bridge strength over a grid of (energy input, detune) around the
    controller's current operating point, using the live portal state.
  - Pick the strongest point and approve it when it clears the transfer gate.

Grid:
  - energy: [max(0, E0 - energy_range_J), E0 + energy_range_J], E0 = min(E_a, E_b)
  - detune: [detune - detune_range_hz, detune + detune_range_hz]
  - steps == 1 evaluates the centre value only.

Guarantees:
  - Read-only: no controller state and no audit entries are touched.
  - The optimum is the first point (energy-major order) with maximal strength.
================================================================================
*/

#include "engine/bridge/bridge_controller.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace gate {

struct SweepConfig {
  double energy_range_J = 1000.0;
  double detune_range_hz = 0.5;
  int energy_steps = 5;
  int detune_steps = 5;

  void validate_or_throw() const;
};

struct SweepPoint {
  double energy_input_J = 0.0;
  double detune_hz = 0.0;
  double frequency_a_hz = 0.0;
  double frequency_b_hz = 0.0;
  double bridge_strength = 0.0;
};

struct SweepReport {
  std::vector<SweepPoint> points;
  SweepPoint optimal;
  std::size_t optimal_index = 0;
  double average_strength = 0.0;
  bool approved = false;

  std::string criteria;
  std::string summary;
};

SweepReport run_parameter_sweep(const BridgeController& ctl, const SweepConfig& cfg);

}  // namespace gate
