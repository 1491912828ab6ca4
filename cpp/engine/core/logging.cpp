/*
===========================================================
Fragment 1.1 - Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
===========================================================
*/

#include "engine/core/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace gate {

static std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
static std::mutex g_log_mu;

const char* to_string(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "INFO";
  }
}

static bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    const auto ca = std::toupper(static_cast<unsigned char>(a[i]));
    const auto cb = std::toupper(static_cast<unsigned char>(b[i]));
    if (ca != cb) return false;
  }
  return true;
}

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
  if (iequals(name, "DEBUG")) return LogLevel::DEBUG;
  if (iequals(name, "INFO"))  return LogLevel::INFO;
  if (iequals(name, "WARN") || iequals(name, "WARNING")) return LogLevel::WARN;
  if (iequals(name, "ERROR")) return LogLevel::ERROR;
  return std::nullopt;
}

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

static std::string utc_timestamp() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const std::time_t tt = clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  try {
    if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;

    std::lock_guard<std::mutex> lk(g_log_mu);

    std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
    out << "[" << utc_timestamp() << "]"
        << "[" << to_string(lvl) << "] "
        << msg << "\n";
    out.flush();
  } catch (const std::exception&) {
    // Must never throw; fall back to an unformatted line.
    std::fputs("[log] failed to format message\n", stderr);
  }
}

} // namespace gate
