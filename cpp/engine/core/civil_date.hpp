#pragma once
/*
================================================================================
Fragment 1.12 — Core: Civil Date (Proleptic Gregorian, Day Resolution)
FILE: cpp/engine/core/civil_date.hpp

Purpose:
  - A tiny value type for calendar dates so the daily scan can do exact
    integer day arithmetic (window radii, staleness, merge gaps) without
    pulling time zones into the engine.

Representation:
  - Serial day number relative to 1970-01-01 (may be negative).
  - Text form is ISO-8601 "YYYY-MM-DD" only.
================================================================================
*/

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cropwatch {

class CivilDate final {
 public:
  constexpr CivilDate() noexcept = default;

  static constexpr CivilDate from_days(std::int32_t serial) noexcept {
    CivilDate d;
    d.days_ = serial;
    return d;
  }

  // Throws cropwatch::Error(kParse) for invalid year/month/day combinations.
  static CivilDate from_ymd(int year, int month, int day);

  // Strict "YYYY-MM-DD". Returns nullopt on anything else (including Feb 30).
  static std::optional<CivilDate> parse(std::string_view iso) noexcept;

  constexpr std::int32_t days() const noexcept { return days_; }

  int year() const noexcept;
  int month() const noexcept;  // 1..12
  int day() const noexcept;    // 1..31

  std::string to_string() const;

  constexpr CivilDate plus_days(std::int32_t n) const noexcept { return from_days(days_ + n); }

  friend constexpr std::int32_t operator-(CivilDate a, CivilDate b) noexcept { return a.days_ - b.days_; }
  friend constexpr bool operator==(CivilDate a, CivilDate b) noexcept { return a.days_ == b.days_; }
  friend constexpr bool operator!=(CivilDate a, CivilDate b) noexcept { return a.days_ != b.days_; }
  friend constexpr bool operator<(CivilDate a, CivilDate b) noexcept { return a.days_ < b.days_; }
  friend constexpr bool operator<=(CivilDate a, CivilDate b) noexcept { return a.days_ <= b.days_; }
  friend constexpr bool operator>(CivilDate a, CivilDate b) noexcept { return a.days_ > b.days_; }
  friend constexpr bool operator>=(CivilDate a, CivilDate b) noexcept { return a.days_ >= b.days_; }

 private:
  std::int32_t days_ = 0;
};

// Inclusive [start, end] date range.
struct DateRange final {
  CivilDate start{};
  CivilDate end{};

  constexpr bool contains(CivilDate d) const noexcept { return start <= d && d <= end; }
  constexpr bool contains(const DateRange& r) const noexcept { return start <= r.start && r.end <= end; }
  constexpr std::int32_t length_days() const noexcept { return end - start + 1; }
};

bool is_leap_year(int year) noexcept;
int days_in_month(int year, int month) noexcept;

} // namespace cropwatch
