#pragma once
/*
================================================================================
Fragment 1.8 - Core: Wiring Errors
FILE: cpp/engine/core/error.hpp

Purpose:
  - Programming and wiring mistakes (null collaborators, portal selectors
    outside the known set) raise gate::Error tagged with the call site.
  - Operator-facing validation failures use ValidationError (errors.hpp).
================================================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace gate {

enum class ErrorCode : int {
  kInvalidArgument = 1,  // null or otherwise unusable collaborator
  kOutOfRange      = 2,  // selector outside its enumeration
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kInvalidArgument: return "InvalidArgument";
    case ErrorCode::kOutOfRange:      return "OutOfRange";
  }
  return "Unknown";
}

class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code, std::string message, const char* file, int line, const char* function)
      : std::runtime_error(describe(code, message, file, line, function)),
        code_(code),
        message_(std::move(message)),
        site_(file ? file : ""),
        line_(line) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const std::string& file() const noexcept { return site_; }
  int line() const noexcept { return line_; }

 private:
  static std::string describe(ErrorCode code,
                              const std::string& message,
                              const char* file,
                              int line,
                              const char* function) {
    std::ostringstream os;
    os << "gate::Error[" << to_string(code) << "] " << message;
    if (file && *file) os << " (" << file << ":" << line;
    if (file && *file && function && *function) os << " in " << function;
    if (file && *file) os << ")";
    return os.str();
  }

  ErrorCode code_;
  std::string message_;
  std::string site_;
  int line_;
};

[[noreturn]] inline void throw_error(ErrorCode code, std::string message,
                                     const char* file, int line, const char* function) {
  throw Error(code, std::move(message), file, line, function);
}

}  // namespace gate

#define GATE_THROW(CODE, MSG) ::gate::throw_error((CODE), (MSG), __FILE__, __LINE__, __func__)
#define GATE_ENSURE(EXPR, CODE, MSG)                 \
  do {                                               \
    if (!(EXPR)) GATE_THROW((CODE), (MSG));          \
  } while (0)
