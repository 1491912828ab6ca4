#include "engine/portal/payload_materials.hpp"

#include "engine/core/errors.hpp"

#include <cmath>

namespace gate {

const std::vector<MaterialDensity>& payload_materials() {
  static const std::vector<MaterialDensity> kTable{
    {"Gold", 19.3},
    {"Lead", 11.34},
    {"Iron", 7.87},
    {"Aluminum", 2.70},
    {"Water", 1.0},
    {"Air", 0.001225},
    {"Titanium", 4.51},
    {"Copper", 8.96},
    {"Silver", 10.49},
    {"Platinum", 21.45},
  };
  return kTable;
}

std::optional<double> material_density_kg_per_L(std::string_view name) noexcept {
  for (const auto& m : payload_materials()) {
    if (name == m.name) return m.density_kg_per_L;
  }
  return std::nullopt;
}

double payload_mass_kg(std::string_view material, double volume_L) {
  const auto rho = material_density_kg_per_L(material);
  if (!rho) throw ValidationError("payload_mass_kg: unknown material '" + std::string(material) + "'");
  if (!std::isfinite(volume_L) || volume_L < 0.0) {
    throw ValidationError("payload_mass_kg: volume_L must be finite and >= 0");
  }
  return volume_L * *rho;
}

} // namespace gate
