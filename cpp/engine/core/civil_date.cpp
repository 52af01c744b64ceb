/*
================================================================================
Fragment 1.12 — Core: Civil Date (Implementation)
FILE: cpp/engine/core/civil_date.cpp
================================================================================
*/

#include "engine/core/civil_date.hpp"

#include "engine/core/error.hpp"

#include <cstdio>

namespace cropwatch {

namespace {

// Days from 1970-01-01 to y-m-d (era-based, valid for the whole int32 range
// of interest).
constexpr std::int32_t days_from_civil(int y, unsigned m, unsigned d) noexcept {
  y -= (m <= 2) ? 1 : 0;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return static_cast<std::int32_t>(era * 146097 + static_cast<int>(doe) - 719468);
}

struct Ymd {
  int y;
  unsigned m;
  unsigned d;
};

constexpr Ymd civil_from_days(std::int32_t z_in) noexcept {
  const int z = z_in + 719468;
  const int era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int y = static_cast<int>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return Ymd{y + (m <= 2 ? 1 : 0), m, d};
}

static_assert(days_from_civil(1970, 1, 1) == 0, "epoch");
static_assert(days_from_civil(2000, 3, 1) == 11017, "2000-03-01");

inline bool parse_digits(std::string_view s, int* out) noexcept {
  int v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    v = v * 10 + (c - '0');
  }
  *out = v;
  return true;
}

} // namespace

bool is_leap_year(int year) noexcept {
  return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

int days_in_month(int year, int month) noexcept {
  static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) return 0;
  if (month == 2 && is_leap_year(year)) return 29;
  return kDays[month - 1];
}

CivilDate CivilDate::from_ymd(int year, int month, int day) {
  if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "invalid calendar date %04d-%02d-%02d", year, month, day);
    CROPWATCH_THROW(ErrorCode::kParse, buf);
  }
  return from_days(days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)));
}

std::optional<CivilDate> CivilDate::parse(std::string_view iso) noexcept {
  if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-') return std::nullopt;
  int y = 0;
  int m = 0;
  int d = 0;
  if (!parse_digits(iso.substr(0, 4), &y)) return std::nullopt;
  if (!parse_digits(iso.substr(5, 2), &m)) return std::nullopt;
  if (!parse_digits(iso.substr(8, 2), &d)) return std::nullopt;
  if (m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) return std::nullopt;
  return from_days(days_from_civil(y, static_cast<unsigned>(m), static_cast<unsigned>(d)));
}

int CivilDate::year() const noexcept { return civil_from_days(days_).y; }
int CivilDate::month() const noexcept { return static_cast<int>(civil_from_days(days_).m); }
int CivilDate::day() const noexcept { return static_cast<int>(civil_from_days(days_).d); }

std::string CivilDate::to_string() const {
  const Ymd ymd = civil_from_days(days_);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", ymd.y, ymd.m, ymd.d);
  return std::string(buf);
}

} // namespace cropwatch
