#include "engine/bridge/bridge_sweep.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/text.hpp"

#include <algorithm>
#include <cmath>

namespace gate {

namespace {

constexpr int kMaxSteps = 1000;

// n evenly spaced values over [lo, hi]; n == 1 yields the midpoint.
std::vector<double> linspace(double lo, double hi, int n) {
  std::vector<double> v;
  v.reserve(static_cast<std::size_t>(n));
  if (n == 1) {
    v.push_back(0.5 * (lo + hi));
    return v;
  }
  const double step = (hi - lo) / static_cast<double>(n - 1);
  for (int i = 0; i < n; ++i) v.push_back(lo + step * static_cast<double>(i));
  return v;
}

}  // namespace

void SweepConfig::validate_or_throw() const {
  if (!std::isfinite(energy_range_J) || energy_range_J < 0.0) {
    throw ValidationError("SweepConfig: energy_range_J must be >= 0");
  }
  if (!std::isfinite(detune_range_hz) || detune_range_hz < 0.0) {
    throw ValidationError("SweepConfig: detune_range_hz must be >= 0");
  }
  if (energy_steps < 1 || energy_steps > kMaxSteps) {
    throw ValidationError("SweepConfig: energy_steps must be in [1,1000]");
  }
  if (detune_steps < 1 || detune_steps > kMaxSteps) {
    throw ValidationError("SweepConfig: detune_steps must be in [1,1000]");
  }
}

SweepReport run_parameter_sweep(const BridgeController& ctl, const SweepConfig& cfg) {
  cfg.validate_or_throw();

  const IPortal& a = ctl.portal_a();
  const double e0 = std::min(a.energy_J(), ctl.portal_b().energy_J());
  const double d0 = ctl.detune_hz();

  // Energy floor is 0; keep the window centred on e0 when it is not clipped.
  const double e_lo = std::max(0.0, e0 - cfg.energy_range_J);
  const double e_hi = e0 + cfg.energy_range_J;
  const auto energies = (cfg.energy_steps == 1) ? std::vector<double>{e0}
                                                : linspace(e_lo, e_hi, cfg.energy_steps);
  const auto detunes = linspace(d0 - cfg.detune_range_hz, d0 + cfg.detune_range_hz, cfg.detune_steps);

  SweepReport rep;
  rep.points.reserve(energies.size() * detunes.size());

  double sum = 0.0;
  for (double e : energies) {
    for (double d : detunes) {
      BridgeInputs in = ctl.current_inputs(e);
      in.detune_hz = d;

      SweepPoint p;
      p.energy_input_J = e;
      p.detune_hz = d;
      p.frequency_a_hz = a.freq_hz();
      p.frequency_b_hz = a.freq_hz() + d;
      p.bridge_strength = compute_bridge_strength(in, ctl.settings()).strength;

      if (rep.points.empty() || p.bridge_strength > rep.optimal.bridge_strength) {
        rep.optimal = p;
        rep.optimal_index = rep.points.size();
      }
      sum += p.bridge_strength;
      rep.points.push_back(p);
    }
  }

  const double gate_level = ctl.settings().bridge.min_transfer_strength;
  rep.average_strength = sum / static_cast<double>(rep.points.size());
  rep.approved = rep.optimal.bridge_strength >= gate_level;

  rep.criteria = "Bridge strength >= " + text::fixed(gate_level, 1) +
                 " (Optimal: " + text::fixed(rep.optimal.bridge_strength, 3) + ")";
  rep.summary = "Sweep evaluated " + std::to_string(rep.points.size()) +
                " configurations. Average strength: " + text::fixed(rep.average_strength, 3) + ". " +
                (rep.approved ? "APPROVED" : "REJECTED") + " based on safety criteria.";

  log(LogLevel::DEBUG, rep.summary);
  return rep;
}

}  // namespace gate
