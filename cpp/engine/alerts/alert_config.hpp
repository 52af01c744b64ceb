#pragma once
/*
================================================================================
Fragment 2.1 — Alerts: Configuration Bundle
FILE: cpp/engine/alerts/alert_config.hpp

Purpose:
  - Every knob the alert scan reads, grouped per component, with validate()
    on each struct. AlertConfig::validate() runs before any row is processed
    and names the offending field in the kConfig error.

Threshold conventions:
  - NaN (kUnset) disables a clause. Infinite values are rejected.
  - Every trigger comparison is strict; a value equal to its threshold never
    triggers.
  - Units: temperatures degC, precipitation mm, relative humidity percent
    (0..100), indices dimensionless.
================================================================================
*/

#include "engine/alerts/alert_types.hpp"
#include "engine/core/civil_date.hpp"
#include "engine/core/logging.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace cropwatch::alerts {

// ----------------------------- Periods ---------------------------------------
struct PeriodConfig final {
  DateRange data{};    // rows evaluated (warm-up for the gating counter)
  DateRange report{};  // rows emitted; must lie inside `data`

  void validate() const;
};

// ----------------------------- Support / QC ----------------------------------
struct SupportConfig final {
  int window_half_days = 5;
  WindowMode mode = WindowMode::PastOnly;
  int max_age_days = 5;
  SupportPick pick = SupportPick::Nearest;

  void validate() const;
};

struct CanopyConfig final {
  double ndvi_min = 0.35;  // canopy reliable when NDVI >= ndvi_min ...
  double evi_min = 0.20;   // ... or EVI >= evi_min

  void validate() const;
};

// ----------------------------- Gating ----------------------------------------
struct GatingConfig final {
  GatingMode mode = GatingMode::Both;
  std::vector<int> season_months{4, 5, 6, 7, 8, 9, 10};
  int canopy_obs_min = 3;
  bool reset_at_season_start = false;
  bool apply_to_weather_only = false;

  bool in_season(int month) const noexcept;

  void validate() const;
};

// ----------------------------- Rules -----------------------------------------
struct DroughtThresholds final {
  double ndmi_strong = 0.15;
  double msi_strong = 1.2;
  double ndmi_soft = 0.25;
  double msi_soft = 0.8;
  double precip_low_7d = 20.0;
  double precip_only_max = kUnset;  // weather-only tier, used when index_independent
  bool index_independent = false;
};

struct ColdThresholds final {
  double tmean_max = 5.0;
  double tmin_max = 0.0;
  double rh_min = 75.0;
  bool index_independent = false;
};

struct HeatThresholds final {
  double tmean_min = 30.0;
  double tmax_min = kUnset;
  double rh_max = 30.0;
  double evi_max = 0.2;
  bool index_independent = false;
};

struct NutrientThresholds final {
  double ndre_max = 0.28;
  double ndre_strong = 0.20;
  double gndvi_max = 0.5;
  double evi_max = 0.2;
  double ndmi_moist_min = 0.25;
  double rh_humid = 75.0;
  bool require_humidity = false;
  int min_index_deficits = 1;
  bool index_independent = false;  // must stay false: every clause reads an index
};

struct WaterloggingThresholds final {
  double precip_high_7d = 40.0;
  double precip_high_1d = kUnset;
  double ndmi_wet = 0.60;
  double ndvi_sparse = 0.35;
  bool index_independent = false;
};

struct RuleThresholds final {
  DroughtThresholds drought;
  ColdThresholds cold;
  HeatThresholds heat;
  NutrientThresholds nutrient;
  WaterloggingThresholds waterlogging;

  bool index_independent(Category c) const noexcept;

  void validate() const;
};

// ----------------------------- Merge / input / logging -----------------------
struct MergeConfig final {
  int merge_gap_days = 2;  // non-alert days tolerated inside one event

  void validate() const;
};

enum class DuplicateDatePolicy : std::uint8_t { Reject = 0, KeepLast = 1 };

struct InputConfig final {
  DuplicateDatePolicy duplicate_dates = DuplicateDatePolicy::Reject;
};

struct LoggingConfig final {
  LogLevel level = LogLevel::INFO;
};

// ----------------------------- Bundle ----------------------------------------
struct AlertConfig final {
  PeriodConfig period;
  SupportConfig support;
  CanopyConfig canopy;
  GatingConfig gating;
  RuleThresholds rules;
  MergeConfig merge;
  InputConfig input;
  LoggingConfig logging;

  void validate() const;
};

// String forms used by the JSON loader and the summary writer.
const char* window_mode_name(WindowMode m) noexcept;
const char* support_pick_name(SupportPick p) noexcept;
const char* gating_mode_name(GatingMode m) noexcept;
const char* duplicate_policy_name(DuplicateDatePolicy p) noexcept;

std::optional<WindowMode> parse_window_mode(std::string_view s) noexcept;
std::optional<SupportPick> parse_support_pick(std::string_view s) noexcept;
std::optional<GatingMode> parse_gating_mode(std::string_view s) noexcept;
std::optional<DuplicateDatePolicy> parse_duplicate_policy(std::string_view s) noexcept;

} // namespace cropwatch::alerts
