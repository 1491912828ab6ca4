#pragma once
/*
================================================================================
Fragment 1.8 - Core: Report Formatting
FILE: cpp/engine/core/text.hpp

Fixed-decimal formatting shared by status reports and audit entries, so every
line renders identically regardless of stream state.
================================================================================
*/

#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace gate::text {

inline std::string fixed(double v, int decimals) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(decimals) << v;
  return oss.str();
}

inline const char* yes_no(bool v) noexcept { return v ? "true" : "false"; }

// Unset optionals render as "None".
inline std::string fixed_or_none(const std::optional<double>& v, int decimals) {
  return v ? fixed(*v, decimals) : std::string{"None"};
}

inline std::string bool_or_none(const std::optional<bool>& v) {
  return v ? std::string{yes_no(*v)} : std::string{"None"};
}

}  // namespace gate::text
