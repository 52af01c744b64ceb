#pragma once
/*
================================================================================
Fragment 1.9 — Core: Error Type (Engine-Wide)
FILE: cpp/engine/core/error.hpp

Purpose:
  - One exception type for every fatal condition in the alert engine and its
    collaborators, carrying a stable ErrorCode plus the throw site.

Categories:
  - kConfig   : configuration contract violated (raised before any row runs)
  - kOrdering : non-monotonic or duplicate dates reaching an ordered scan
  - kParse    : malformed CSV / JSON input
  - kIo       : file open / read / write failures
  - kInvariant: internal consistency checks (summary counters etc.)

Missing observations are NOT errors anywhere in the engine.
================================================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace cropwatch {

enum class ErrorCode : int {
  kConfig    = 1,
  kOrdering  = 2,
  kParse     = 3,
  kIo        = 4,
  kInvariant = 5,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kConfig:    return "Config";
    case ErrorCode::kOrdering:  return "Ordering";
    case ErrorCode::kParse:     return "Parse";
    case ErrorCode::kIo:        return "Io";
    case ErrorCode::kInvariant: return "Invariant";
    default:                    return "Unknown";
  }
}

// Includes: code + file/line/function for auditability.
class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code,
        std::string message,
        const char* file,
        int line,
        const char* function)
      : std::runtime_error(build_what(code, message, file, line, function)),
        code_(code),
        message_(std::move(message)),
        file_(file ? file : ""),
        function_(function ? function : ""),
        line_(line) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const std::string& file() const noexcept { return file_; }
  const std::string& function() const noexcept { return function_; }
  int line() const noexcept { return line_; }

 private:
  static std::string build_what(ErrorCode code,
                                const std::string& msg,
                                const char* file,
                                int line,
                                const char* func) {
    std::ostringstream oss;
    oss << "[cropwatch::Error code=" << to_string(code) << "(" << static_cast<int>(code) << ")] "
        << msg;
    if (file && *file) {
      oss << " @ " << file << ":" << line;
      if (func && *func) oss << " (" << func << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  std::string file_;
  std::string function_;
  int line_;
};

[[noreturn]] inline void throw_error(ErrorCode code,
                                     std::string message,
                                     const char* file,
                                     int line,
                                     const char* function) {
  throw Error(code, std::move(message), file, line, function);
}

inline void ensure(bool ok,
                   ErrorCode code,
                   std::string message,
                   const char* file,
                   int line,
                   const char* function) {
  if (!ok) {
    throw_error(code, std::move(message), file, line, function);
  }
}

}  // namespace cropwatch

#define CROPWATCH_THROW(CODE, MSG) ::cropwatch::throw_error((CODE), (MSG), __FILE__, __LINE__, __func__)
#define CROPWATCH_ENSURE(EXPR, CODE, MSG) ::cropwatch::ensure((EXPR), (CODE), (MSG), __FILE__, __LINE__, __func__)
