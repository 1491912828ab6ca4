#include "engine/portal/resonance_portal.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/text.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace gate {

namespace {

void require_energy_amount(double energy_J, const char* where) {
  if (!std::isfinite(energy_J) || energy_J < 0.0) {
    throw ValidationError(std::string(where) + ": energy_J must be finite and >= 0");
  }
}

}  // namespace

ResonancePortal::ResonancePortal(double freq_hz, double power_W, PortalSettings settings)
    : freq_hz_(freq_hz), power_W_(power_W), settings_(std::move(settings)) {
  if (!std::isfinite(freq_hz_)) throw ValidationError("ResonancePortal: freq_hz must be finite");
  if (!std::isfinite(power_W_) || power_W_ < 0.0) throw ValidationError("ResonancePortal: power_W must be >= 0");
  settings_.validate_or_throw();
}

void ResonancePortal::reset() {
  powered_ = true;
  energy_J_ = 0.0;
  payload_.reset();
  floor_ = FloorReading{};
  recompute_();
}

void ResonancePortal::sense_payload(std::optional<double> volume_L, std::optional<double> mass_kg) {
  if (volume_L && mass_kg && *volume_L > 0.0 && *mass_kg > 0.0) {
    payload_ = Payload{*volume_L, *mass_kg};
  } else {
    payload_.reset();
  }
  recompute_();
}

void ResonancePortal::floor_sensor(std::optional<double> temp_C, std::optional<bool> contact) {
  floor_.temp_C = temp_C;
  floor_.contact = contact;
  recompute_();
}

void ResonancePortal::update_energy(double dt_s) {
  if (!std::isfinite(dt_s) || dt_s < 0.0) {
    throw ValidationError("ResonancePortal::update_energy: dt_s must be finite and >= 0");
  }
  if (!powered_) return;
  energy_J_ = std::min(settings_.max_energy_J, energy_J_ + power_W_ * dt_s);
}

void ResonancePortal::credit_energy(double energy_J) {
  require_energy_amount(energy_J, "ResonancePortal::credit_energy");
  if (!powered_) return;
  energy_J_ = std::min(settings_.max_energy_J, energy_J_ + energy_J);
}

void ResonancePortal::debit_energy(double energy_J) {
  require_energy_amount(energy_J, "ResonancePortal::debit_energy");
  energy_J_ = std::max(0.0, energy_J_ - energy_J);
}

void ResonancePortal::set_powered(bool on) {
  powered_ = on;
  if (!on) energy_J_ = 0.0;
}

void ResonancePortal::clear_payload() noexcept {
  payload_.reset();
  recompute_();
}

void ResonancePortal::recompute_() noexcept {
  const double mass = payload_ ? payload_->mass_kg : 0.0;

  double s = std::clamp(1.0 - mass / settings_.stability_mass_scale_kg, 0.0, 1.0);
  const bool temp_known = floor_.temp_C.has_value() && std::isfinite(*floor_.temp_C);
  if (temp_known && *floor_.temp_C > settings_.superconducting_temp_C) {
    s *= settings_.warm_floor_stability_factor;
  }
  stability_ = s;

  bool safe = true;
  if (mass > settings_.max_payload_mass_kg) safe = false;
  if (floor_.temp_C) {
    const double t = *floor_.temp_C;
    // NaN fails both comparisons, so test the in-band condition.
    if (!(t >= PortalSettings::kAbsoluteZeroC && t <= settings_.max_floor_temp_C)) safe = false;
  }
  if (payload_ && floor_.contact.has_value() && !*floor_.contact) safe = false;
  safe_ = safe;
}

std::vector<std::string> ResonancePortal::report_status() const {
  std::vector<std::string> out;
  out.reserve(3);

  std::string head = "Portal " + text::fixed(freq_hz_, 3) + " Hz: energy " + text::fixed(energy_J_, 2) +
                     " J, stability " + text::fixed(stability_, 2) + ", safety " + (safe_ ? "OK" : "FAULT");
  if (!powered_) head += ", powered down";
  out.push_back(std::move(head));

  if (payload_) {
    out.push_back("  payload: " + text::fixed(payload_->volume_L, 3) + " L, " +
                  text::fixed(payload_->mass_kg, 2) + " kg");
  } else {
    out.push_back("  payload: none");
  }

  out.push_back("  floor: temp " + text::fixed_or_none(floor_.temp_C, 1) + " C, contact " +
                text::bool_or_none(floor_.contact));
  return out;
}

} // namespace gate
