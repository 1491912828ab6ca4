/*
===============================================================================
Fragment 2.1 - Portal Collaborator Interface
File: cpp/engine/portal/portal.hpp
===============================================================================
*/

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace gate {

// Abstract portal. The bridge controller consumes only this surface; how energy,
// stability and safety are derived from sensor readings is the implementation's
// business. Sensor inputs are optional and are forwarded unvalidated.
class IPortal {
 public:
  virtual ~IPortal() = default;

  // Return to baseline: powered, no payload, no floor reading, no stored energy.
  virtual void reset() = 0;

  virtual void sense_payload(std::optional<double> volume_L, std::optional<double> mass_kg) = 0;
  virtual void floor_sensor(std::optional<double> temp_C, std::optional<bool> contact) = 0;

  // Advance stored energy by one time step (s). No-op while powered down.
  virtual void update_energy(double dt_s) = 0;

  // Add energy (J), capped at the storage ceiling. No-op while powered down.
  virtual void credit_energy(double energy_J) = 0;

  // Remove energy (J), floored at zero.
  virtual void debit_energy(double energy_J) = 0;

  // Powering down drains stored energy.
  virtual void set_powered(bool on) = 0;

  virtual void clear_payload() noexcept = 0;

  virtual double energy_J() const noexcept = 0;
  virtual double stability() const noexcept = 0;      // [0,1]
  virtual bool safety_status() const noexcept = 0;
  virtual double freq_hz() const noexcept = 0;
  virtual bool has_payload() const noexcept = 0;
  virtual bool powered() const noexcept = 0;

  virtual std::vector<std::string> report_status() const = 0;
};

} // namespace gate
