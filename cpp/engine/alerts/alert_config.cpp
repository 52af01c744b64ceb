/*
================================================================================
Fragment 2.1 — Alerts: Configuration Bundle (Validation)
FILE: cpp/engine/alerts/alert_config.cpp
================================================================================
*/

#include "engine/alerts/alert_config.hpp"

#include "engine/core/error.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace cropwatch::alerts {

namespace {

// NaN = disabled clause (allowed); +-inf never allowed.
inline bool threshold_ok(double x) noexcept { return std::isnan(x) || std::isfinite(x); }

inline bool percent_ok(double x) noexcept {
  return std::isnan(x) || (std::isfinite(x) && x >= 0.0 && x <= 100.0);
}

void require_threshold(double x, const char* field) {
  CROPWATCH_ENSURE(threshold_ok(x), ErrorCode::kConfig, std::string(field) + " must be finite or null");
}

void require_percent(double x, const char* field) {
  CROPWATCH_ENSURE(percent_ok(x), ErrorCode::kConfig, std::string(field) + " must be null or within 0..100 (percent)");
}

std::string range_text(const DateRange& r) {
  return r.start.to_string() + ".." + r.end.to_string();
}

} // namespace

void PeriodConfig::validate() const {
  CROPWATCH_ENSURE(data.start <= data.end, ErrorCode::kConfig,
                   "period.data_start after period.data_end (" + range_text(data) + ")");
  CROPWATCH_ENSURE(report.start <= report.end, ErrorCode::kConfig,
                   "period.report_start after period.report_end (" + range_text(report) + ")");
  CROPWATCH_ENSURE(data.contains(report), ErrorCode::kConfig,
                   "period.report range " + range_text(report) + " lies outside period.data range " + range_text(data));
}

void SupportConfig::validate() const {
  CROPWATCH_ENSURE(window_half_days >= 0, ErrorCode::kConfig, "support.window_half_days must be >= 0");
  CROPWATCH_ENSURE(max_age_days >= 0, ErrorCode::kConfig, "support.max_age_days must be >= 0");
  CROPWATCH_ENSURE(mode == WindowMode::Symmetric || mode == WindowMode::PastOnly,
                   ErrorCode::kConfig, "support.window_mode unknown");
  CROPWATCH_ENSURE(pick == SupportPick::Nearest || pick == SupportPick::SameDay,
                   ErrorCode::kConfig, "support.pick unknown");
}

void CanopyConfig::validate() const {
  require_threshold(ndvi_min, "canopy.ndvi_min");
  require_threshold(evi_min, "canopy.evi_min");
  CROPWATCH_ENSURE(!std::isnan(ndvi_min) || !std::isnan(evi_min), ErrorCode::kConfig,
                   "canopy.ndvi_min and canopy.evi_min are both null (canopy could never be ready)");
}

bool GatingConfig::in_season(int month) const noexcept {
  return std::find(season_months.begin(), season_months.end(), month) != season_months.end();
}

void GatingConfig::validate() const {
  CROPWATCH_ENSURE(static_cast<int>(mode) >= 0 && static_cast<int>(mode) <= 3,
                   ErrorCode::kConfig, "gating.mode unknown");
  for (int m : season_months) {
    CROPWATCH_ENSURE(m >= 1 && m <= 12, ErrorCode::kConfig,
                     "gating.season_months entry " + std::to_string(m) + " outside 1..12");
  }
  if (mode == GatingMode::MonthWindow || mode == GatingMode::Both) {
    CROPWATCH_ENSURE(!season_months.empty(), ErrorCode::kConfig,
                     std::string("gating.season_months empty with gating.mode=") + gating_mode_name(mode));
  }
  CROPWATCH_ENSURE(canopy_obs_min >= 0, ErrorCode::kConfig, "gating.canopy_obs_min must be >= 0");
}

bool RuleThresholds::index_independent(Category c) const noexcept {
  switch (c) {
    case Category::Drought:        return drought.index_independent;
    case Category::ColdStress:     return cold.index_independent;
    case Category::HeatStress:     return heat.index_independent;
    case Category::NutrientOrPest: return nutrient.index_independent;
    case Category::Waterlogging:   return waterlogging.index_independent;
    default:                       return false;
  }
}

void RuleThresholds::validate() const {
  require_threshold(drought.ndmi_strong, "rules.drought.ndmi_strong");
  require_threshold(drought.msi_strong, "rules.drought.msi_strong");
  require_threshold(drought.ndmi_soft, "rules.drought.ndmi_soft");
  require_threshold(drought.msi_soft, "rules.drought.msi_soft");
  require_threshold(drought.precip_low_7d, "rules.drought.precip_low_7d");
  require_threshold(drought.precip_only_max, "rules.drought.precip_only_max");

  require_threshold(cold.tmean_max, "rules.cold_stress.tmean_max");
  require_threshold(cold.tmin_max, "rules.cold_stress.tmin_max");
  require_percent(cold.rh_min, "rules.cold_stress.rh_min");

  require_threshold(heat.tmean_min, "rules.heat_stress.tmean_min");
  require_threshold(heat.tmax_min, "rules.heat_stress.tmax_min");
  require_percent(heat.rh_max, "rules.heat_stress.rh_max");
  require_threshold(heat.evi_max, "rules.heat_stress.evi_max");

  require_threshold(nutrient.ndre_max, "rules.nutrient_or_pest.ndre_max");
  require_threshold(nutrient.ndre_strong, "rules.nutrient_or_pest.ndre_strong");
  require_threshold(nutrient.gndvi_max, "rules.nutrient_or_pest.gndvi_max");
  require_threshold(nutrient.evi_max, "rules.nutrient_or_pest.evi_max");
  require_threshold(nutrient.ndmi_moist_min, "rules.nutrient_or_pest.ndmi_moist_min");
  require_percent(nutrient.rh_humid, "rules.nutrient_or_pest.rh_humid");
  CROPWATCH_ENSURE(nutrient.min_index_deficits >= 1 && nutrient.min_index_deficits <= 3, ErrorCode::kConfig,
                   "rules.nutrient_or_pest.min_index_deficits must be within 1..3");
  CROPWATCH_ENSURE(!nutrient.index_independent, ErrorCode::kConfig,
                   "rules.nutrient_or_pest.index_independent cannot be true (every clause reads an index)");
  CROPWATCH_ENSURE(!(nutrient.require_humidity && std::isnan(nutrient.rh_humid)), ErrorCode::kConfig,
                   "rules.nutrient_or_pest.require_humidity set while rh_humid is null");

  require_threshold(waterlogging.precip_high_7d, "rules.waterlogging.precip_high_7d");
  require_threshold(waterlogging.precip_high_1d, "rules.waterlogging.precip_high_1d");
  require_threshold(waterlogging.ndmi_wet, "rules.waterlogging.ndmi_wet");
  require_threshold(waterlogging.ndvi_sparse, "rules.waterlogging.ndvi_sparse");
}

void MergeConfig::validate() const {
  CROPWATCH_ENSURE(merge_gap_days >= 0, ErrorCode::kConfig,
                   "merge.merge_gap_days must be >= 0 (got " + std::to_string(merge_gap_days) + ")");
}

void AlertConfig::validate() const {
  period.validate();
  support.validate();
  canopy.validate();
  gating.validate();
  rules.validate();
  merge.validate();
}

const char* window_mode_name(WindowMode m) noexcept {
  return m == WindowMode::Symmetric ? "symmetric" : "past_only";
}

const char* support_pick_name(SupportPick p) noexcept {
  return p == SupportPick::SameDay ? "same_day" : "nearest";
}

const char* gating_mode_name(GatingMode m) noexcept {
  switch (m) {
    case GatingMode::Off:         return "off";
    case GatingMode::MonthWindow: return "month_window";
    case GatingMode::CanopyObs:   return "canopy_obs";
    case GatingMode::Both:        return "both";
    default:                      return "unknown";
  }
}

const char* duplicate_policy_name(DuplicateDatePolicy p) noexcept {
  return p == DuplicateDatePolicy::KeepLast ? "keep_last" : "reject";
}

std::optional<WindowMode> parse_window_mode(std::string_view s) noexcept {
  if (s == "symmetric") return WindowMode::Symmetric;
  if (s == "past_only") return WindowMode::PastOnly;
  return std::nullopt;
}

std::optional<SupportPick> parse_support_pick(std::string_view s) noexcept {
  if (s == "nearest") return SupportPick::Nearest;
  if (s == "same_day") return SupportPick::SameDay;
  return std::nullopt;
}

std::optional<GatingMode> parse_gating_mode(std::string_view s) noexcept {
  if (s == "off") return GatingMode::Off;
  if (s == "month_window") return GatingMode::MonthWindow;
  if (s == "canopy_obs") return GatingMode::CanopyObs;
  if (s == "both") return GatingMode::Both;
  return std::nullopt;
}

std::optional<DuplicateDatePolicy> parse_duplicate_policy(std::string_view s) noexcept {
  if (s == "reject") return DuplicateDatePolicy::Reject;
  if (s == "keep_last") return DuplicateDatePolicy::KeepLast;
  return std::nullopt;
}

} // namespace cropwatch::alerts
