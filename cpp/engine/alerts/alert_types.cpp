/*
================================================================================
Fragment 2.0 — Alerts: Core Data Model (names + small helpers)
FILE: cpp/engine/alerts/alert_types.cpp
================================================================================
*/

#include "engine/alerts/alert_types.hpp"

namespace cropwatch::alerts {

const char* category_name(Category c) noexcept {
  switch (c) {
    case Category::Drought:        return "drought";
    case Category::ColdStress:     return "cold_stress";
    case Category::HeatStress:     return "heat_stress";
    case Category::NutrientOrPest: return "nutrient_or_pest";
    case Category::Waterlogging:   return "waterlogging";
    default:                       return "unknown";
  }
}

std::optional<Category> parse_category(std::string_view s) noexcept {
  for (Category c : kAllCategories) {
    if (s == category_name(c)) return c;
  }
  return std::nullopt;
}

const char* metric_variable_name(MetricVariable v) noexcept {
  switch (v) {
    case MetricVariable::Ndmi:     return "ndmi";
    case MetricVariable::Msi:      return "msi";
    case MetricVariable::Ndre:     return "ndre";
    case MetricVariable::Gndvi:    return "gndvi";
    case MetricVariable::Evi:      return "evi";
    case MetricVariable::Tmean7d:  return "tmean_7d";
    case MetricVariable::Tmin7d:   return "tmin_7d";
    case MetricVariable::Tmax7d:   return "tmax_7d";
    case MetricVariable::Precip7d: return "precip_7d";
    case MetricVariable::Precip1d: return "precip_1d";
    default:                       return "";
  }
}

PeakDirection peak_direction(Category c, MetricVariable v) noexcept {
  switch (v) {
    case MetricVariable::Msi:
    case MetricVariable::Tmax7d:
    case MetricVariable::Precip1d:
      return PeakDirection::Higher;
    case MetricVariable::Ndmi:
    case MetricVariable::Ndre:
    case MetricVariable::Gndvi:
    case MetricVariable::Evi:
    case MetricVariable::Tmin7d:
      return PeakDirection::Lower;
    case MetricVariable::Tmean7d:
      return c == Category::HeatStress ? PeakDirection::Higher : PeakDirection::Lower;
    case MetricVariable::Precip7d:
      // Weather-only drought tracks a shortfall; waterlogging an excess.
      return c == Category::Drought ? PeakDirection::Lower : PeakDirection::Higher;
    default:
      return PeakDirection::Higher;
  }
}

bool more_extreme(Category c, MetricVariable cand_var, double candidate,
                  MetricVariable cur_var, double current) noexcept {
  if (!is_set(candidate)) return false;
  if (!is_set(current)) return true;
  if (cand_var != cur_var) return cand_var < cur_var;
  return peak_direction(c, cand_var) == PeakDirection::Lower ? candidate < current : candidate > current;
}

const char* severity_level_name(SeverityLevel l) noexcept {
  switch (l) {
    case SeverityLevel::Minor:    return "minor";
    case SeverityLevel::Moderate: return "moderate";
    case SeverityLevel::Major:    return "major";
    default:                      return "unknown";
  }
}

const char* skip_reason_name(SkipReason r) noexcept {
  switch (r) {
    case SkipReason::Ok:                  return "ok";
    case SkipReason::NoRemoteSensing:     return "no_remote_sensing";
    case SkipReason::Stale:               return "stale";
    case SkipReason::LowCanopyConfidence: return "low_canopy_confidence";
    default:                              return "unknown";
  }
}

bool DailyAlert::has(Category c) const noexcept {
  for (const auto& h : hits) {
    if (h.category == c) return true;
  }
  return false;
}

std::string DailyAlert::label() const {
  std::string out;
  for (const auto& h : hits) {
    if (!out.empty()) out += '+';
    out += category_name(h.category);
  }
  return out;
}

std::string DailyAlert::combined_reason() const {
  std::string out;
  for (const auto& h : hits) {
    if (!out.empty()) out += " | ";
    out += category_name(h.category);
    out += ": ";
    out += h.reason;
  }
  return out;
}

std::string Event::event_type() const {
  if (composite) return "composite";
  if (categories.empty()) return "unknown";
  return category_name(categories.front());
}

std::string Event::categories_label() const {
  std::string out;
  for (Category c : categories) {
    if (!out.empty()) out += '+';
    out += category_name(c);
  }
  return out;
}

} // namespace cropwatch::alerts
