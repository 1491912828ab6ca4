/*
===============================================================================
Fragment 2.2 - Resonance Portal Model
File: cpp/engine/portal/resonance_portal.hpp
===============================================================================

Reference IPortal implementation.

Model:
  - Energy charges linearly at power_W and saturates at max_energy_J.
    A powered-down portal holds no energy and ignores charging and credits.
  - Stability = clamp(1 - payload_mass / stability_mass_scale_kg, 0, 1),
    then x warm_floor_stability_factor while the floor is above the
    superconducting temperature.
  - Unsafe when: payload heavier than max_payload_mass_kg, floor hotter than
    max_floor_temp_C or colder than absolute zero, or a payload is present
    while the floor reports no contact.
  - Missing readings never trip the interlock.
===============================================================================
*/

#pragma once

#include "engine/core/settings.hpp"
#include "engine/portal/portal.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gate {

struct Payload final {
  double volume_L = 0.0;
  double mass_kg = 0.0;
};

struct FloorReading final {
  std::optional<double> temp_C;
  std::optional<bool> contact;
};

class ResonancePortal final : public IPortal {
 public:
  ResonancePortal(double freq_hz, double power_W, PortalSettings settings = {});

  void reset() override;
  void sense_payload(std::optional<double> volume_L, std::optional<double> mass_kg) override;
  void floor_sensor(std::optional<double> temp_C, std::optional<bool> contact) override;
  void update_energy(double dt_s) override;
  void credit_energy(double energy_J) override;
  void debit_energy(double energy_J) override;
  void set_powered(bool on) override;
  void clear_payload() noexcept override;

  double energy_J() const noexcept override { return energy_J_; }
  double stability() const noexcept override { return stability_; }
  bool safety_status() const noexcept override { return safe_; }
  double freq_hz() const noexcept override { return freq_hz_; }
  bool has_payload() const noexcept override { return payload_.has_value(); }
  bool powered() const noexcept override { return powered_; }

  std::vector<std::string> report_status() const override;

  double power_W() const noexcept { return power_W_; }
  const std::optional<Payload>& payload() const noexcept { return payload_; }
  const FloorReading& floor() const noexcept { return floor_; }

 private:
  void recompute_() noexcept;

  double freq_hz_;
  double power_W_;
  PortalSettings settings_;

  bool powered_ = true;
  double energy_J_ = 0.0;
  double stability_ = 1.0;
  bool safe_ = true;

  std::optional<Payload> payload_;
  FloorReading floor_;
};

} // namespace gate
