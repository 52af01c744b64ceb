#pragma once
/*
===========================================================
Fragment 1.1 — Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Dependency-free logging used by the engine, the I/O layer and the CLI.
  - Centralizes stdout/stderr policy.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation).
  - WARN/ERROR go to stderr, DEBUG/INFO to stdout.
===========================================================
*/

#include <string>
#include <string_view>

namespace cropwatch {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

// Get global logging verbosity.
LogLevel get_log_level() noexcept;

// True when a message at `lvl` would be emitted. Lets callers skip building
// expensive per-day strings.
bool log_enabled(LogLevel lvl) noexcept;

// "debug" | "info" | "warn" | "error" (case-insensitive). Returns false and
// leaves *out untouched for anything else.
bool parse_log_level(std::string_view s, LogLevel* out) noexcept;

const char* log_level_name(LogLevel lvl) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

// Component-tagged variant: "[component] msg".
void log(LogLevel lvl, std::string_view component, const std::string& msg) noexcept;

} // namespace cropwatch
