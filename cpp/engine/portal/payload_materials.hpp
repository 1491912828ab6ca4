/*
===============================================================================
Fragment 2.3 - Payload Materials
File: cpp/engine/portal/payload_materials.hpp
===============================================================================
*/

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gate {

struct MaterialDensity final {
  const char* name;
  double density_kg_per_L;
};

// Known payload materials in display order.
const std::vector<MaterialDensity>& payload_materials();

// Case-sensitive lookup ("Gold", "Lead", ...). nullopt when unknown.
std::optional<double> material_density_kg_per_L(std::string_view name) noexcept;

// mass = volume * density. Throws ValidationError for an unknown material or a
// negative/non-finite volume.
double payload_mass_kg(std::string_view material, double volume_L);

} // namespace gate
