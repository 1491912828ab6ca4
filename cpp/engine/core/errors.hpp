#pragma once
/*
================================================================================
Fragment 1.9 - Core: Error Types
FILE: cpp/engine/core/errors.hpp

Purpose:
  - Uniform exception types so configuration and collaborator failures are
    searchable, catchable by category and reportable by the CLI.

Notes:
  - The bridge controller's run operations never throw. These types are raised
    at construction (bad settings) and by the portal model (bad time steps).
================================================================================
*/

#include <stdexcept>
#include <string>
#include <utility>

namespace gate {

// Base error for the engine.
class GateError : public std::runtime_error {
 public:
  explicit GateError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Thrown when settings, config or collaborator input fails validation.
class ValidationError : public GateError {
 public:
  explicit ValidationError(std::string msg) : GateError(std::move(msg)) {}
};

} // namespace gate
