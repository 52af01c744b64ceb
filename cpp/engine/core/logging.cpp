/*
===========================================================
Fragment 1.1 — Core: Logging (Implementation)
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

namespace cropwatch {

static std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
static std::mutex g_log_mu;

const char* log_level_name(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "INFO";
  }
}

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool log_enabled(LogLevel lvl) noexcept {
  return static_cast<int>(lvl) >= g_level.load(std::memory_order_relaxed);
}

bool parse_log_level(std::string_view s, LogLevel* out) noexcept {
  if (!out) return false;
  auto iequals = [s](std::string_view lit) noexcept {
    if (s.size() != lit.size()) return false;
    for (std::size_t i = 0; i < s.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(s[i])) != lit[i]) return false;
    }
    return true;
  };
  if (iequals("debug")) { *out = LogLevel::DEBUG; return true; }
  if (iequals("info"))  { *out = LogLevel::INFO;  return true; }
  if (iequals("warn") || iequals("warning")) { *out = LogLevel::WARN; return true; }
  if (iequals("error")) { *out = LogLevel::ERROR; return true; }
  return false;
}

static std::string utc_timestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  std::time_t tt = clock::to_time_t(now);
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

static void emit(LogLevel lvl, std::string_view component, const std::string& msg) {
  std::lock_guard<std::mutex> lk(g_log_mu);

  std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
  out << "[" << utc_timestamp() << "]"
      << "[" << log_level_name(lvl) << "] ";
  if (!component.empty()) out << "[" << component << "] ";
  out << msg << "\n";
  out.flush();
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  try {
    if (!log_enabled(lvl)) return;
    emit(lvl, {}, msg);
  } catch (const std::exception& e) {
    // Must never throw; fall back to raw stderr.
    std::fputs("[cropwatch] log write failed: ", stderr);
    std::fputs(e.what(), stderr);
    std::fputs("\n", stderr);
  }
}

void log(LogLevel lvl, std::string_view component, const std::string& msg) noexcept {
  try {
    if (!log_enabled(lvl)) return;
    emit(lvl, component, msg);
  } catch (const std::exception& e) {
    // Must never throw; fall back to raw stderr.
    std::fputs("[cropwatch] log write failed: ", stderr);
    std::fputs(e.what(), stderr);
    std::fputs("\n", stderr);
  }
}

} // namespace cropwatch
