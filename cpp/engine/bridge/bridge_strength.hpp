#pragma once
/*
================================================================================
Fragment 3.1 - Bridge: Strength Formula
FILE: cpp/engine/bridge/bridge_strength.hpp

Model (evaluated in this order, each step may override the previous):
  1) min_energy = E_a * (1 + |detune| / f_nominal)
  2) raw        = clamp(E_in / (min_energy * stability_a), 0, 1)   if min_energy > 0
                = 0                                                otherwise
  3) degraded   = raw * stability_penalty   if stability_a or stability_b
                                             < stability_threshold
  4) vetoed     = 0                          if either portal is unsafe

Notes:
  - Only portal A's stability enters the denominator. The reference formula is
    asymmetric; it is kept that way until the intent is confirmed.
  - Pure and noexcept. Non-finite intermediates collapse to 0 so the result is
    always inside [0,1].
================================================================================
*/

#include "engine/core/settings.hpp"

namespace gate {

struct BridgeInputs {
  double energy_input_J = 0.0;
  double energy_a_J = 0.0;
  double stability_a = 1.0;
  double stability_b = 1.0;
  bool safe_a = true;
  bool safe_b = true;
  double detune_hz = 0.0;
};

struct BridgeStrength {
  double min_energy_J = 0.0;
  double unpenalized = 0.0;     // clamped ratio before penalty/veto
  double strength = 0.0;        // final value, in [0,1]

  bool stability_penalty = false;
  bool safety_veto = false;
  bool at_maximum = false;      // strength >= max_strength_level
};

BridgeStrength compute_bridge_strength(const BridgeInputs& in, const SimSettings& settings) noexcept;

}  // namespace gate
