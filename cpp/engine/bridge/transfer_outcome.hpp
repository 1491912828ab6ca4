#pragma once
/*
================================================================================
Fragment 3.2 - Bridge: Transfer Outcome
FILE: cpp/engine/bridge/transfer_outcome.hpp
================================================================================
*/

#include <cstdint>
#include <string>

namespace gate {

enum class TransferFailure : std::uint8_t {
  None = 0,
  InsufficientBridgeStrength = 1,
  InsufficientTransferEnergy = 2,
};

inline const char* to_string(TransferFailure f) noexcept {
  switch (f) {
    case TransferFailure::None:                       return "None";
    case TransferFailure::InsufficientBridgeStrength: return "Insufficient bridge strength";
    case TransferFailure::InsufficientTransferEnergy: return "Insufficient transfer energy";
    default:                                          return "Unknown";
  }
}

struct TransferOutcome final {
  bool success = false;
  TransferFailure failure = TransferFailure::None;
  std::string reason;                 // empty on success

  double energy_transferred_J = 0.0;
  double energy_consumed_J = 0.0;     // debited from each portal
  bool payloads_cleared = false;
  bool bridge_reset = false;

  static TransferOutcome fail(TransferFailure f) {
    TransferOutcome o;
    o.failure = f;
    o.reason = to_string(f);
    return o;
  }
};

}  // namespace gate
