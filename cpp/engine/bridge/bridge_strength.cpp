#include "engine/bridge/bridge_strength.hpp"

#include <algorithm>
#include <cmath>

namespace gate {

BridgeStrength compute_bridge_strength(const BridgeInputs& in, const SimSettings& settings) noexcept {
  const BridgeSettings& b = settings.bridge;

  BridgeStrength r;
  r.min_energy_J = in.energy_a_J * (1.0 + std::fabs(in.detune_hz) / settings.resonance.nominal_frequency_hz);

  if (r.min_energy_J > 0.0) {
    const double ratio = in.energy_input_J / (r.min_energy_J * in.stability_a);
    // Zero stability gives +inf (clamps to 1); 0/0 or NaN inputs give NaN.
    r.unpenalized = std::isnan(ratio) ? 0.0 : std::clamp(ratio, 0.0, 1.0);
  } else {
    r.unpenalized = 0.0;
  }
  r.strength = r.unpenalized;

  if (in.stability_a < b.stability_threshold || in.stability_b < b.stability_threshold) {
    r.stability_penalty = true;
    r.strength *= b.stability_penalty;
  }

  if (!(in.safe_a && in.safe_b)) {
    r.safety_veto = true;
    r.strength = 0.0;
  }

  r.at_maximum = r.strength >= b.max_strength_level;
  return r;
}

}  // namespace gate
