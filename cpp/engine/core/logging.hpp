#pragma once
/*
===========================================================
Fragment 1.1 - Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Process-wide severity logger used by every engine module.
  - Centralizes stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation).
  - WARN/ERROR are routed to stderr, everything else to stdout.

Notes:
  - The bridge controller keeps its own per-run audit log; this logger is the
    operator-facing stream and mirrors those entries.
===========================================================
*/

#include <optional>
#include <string>
#include <string_view>

namespace gate {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

// Get global logging verbosity.
LogLevel get_log_level() noexcept;

// Stable upper-case tag ("DEBUG", "INFO", "WARN", "ERROR").
const char* to_string(LogLevel lvl) noexcept;

// Case-insensitive parse of a level name; nullopt on anything unknown.
std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

} // namespace gate
