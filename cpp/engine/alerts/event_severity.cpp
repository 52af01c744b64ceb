/*
================================================================================
Fragment 2.14 — Alerts: Event Severity (Implementation)
FILE: cpp/engine/alerts/event_severity.cpp
================================================================================
*/

#include "engine/alerts/event_severity.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>

namespace cropwatch::alerts {

namespace {

constexpr std::size_t kVariableSlots = static_cast<std::size_t>(MetricVariable::Precip1d) + 1;

// Loosest of two "value < thr" thresholds.
double loosest_below(double a, double b) noexcept {
  if (!is_set(a)) return b;
  if (!is_set(b)) return a;
  return std::max(a, b);
}

// Loosest of two "value > thr" thresholds.
double loosest_above(double a, double b) noexcept {
  if (!is_set(a)) return b;
  if (!is_set(b)) return a;
  return std::min(a, b);
}

double safe_max(double m) noexcept { return (is_set(m) && m > 0.0) ? m : 1.0; }

double round3(double x) noexcept { return std::round(x * 1000.0) / 1000.0; }

double event_depth(const Event& e, const std::vector<double>& exceed,
                   const std::array<std::array<double, kVariableSlots>, kCategoryCount>& scale) {
  double d = 0.0;
  for (std::size_t i = 0; i < e.peaks.size(); ++i) {
    const CategoryPeak& p = e.peaks[i];
    const double m = scale[index_of(p.category)][static_cast<std::size_t>(p.variable)];
    d = std::max(d, exceed[i] / safe_max(m));
  }
  return d;
}

} // namespace

double trigger_threshold(Category c, MetricVariable v, const RuleThresholds& thr) noexcept {
  switch (c) {
    case Category::Drought:
      if (v == MetricVariable::Ndmi) return loosest_below(thr.drought.ndmi_soft, thr.drought.ndmi_strong);
      if (v == MetricVariable::Msi) return loosest_above(thr.drought.msi_soft, thr.drought.msi_strong);
      if (v == MetricVariable::Precip7d) return thr.drought.precip_only_max;
      break;
    case Category::ColdStress:
      if (v == MetricVariable::Tmean7d) return thr.cold.tmean_max;
      if (v == MetricVariable::Tmin7d) return thr.cold.tmin_max;
      break;
    case Category::HeatStress:
      if (v == MetricVariable::Tmean7d) return thr.heat.tmean_min;
      if (v == MetricVariable::Tmax7d) return thr.heat.tmax_min;
      break;
    case Category::NutrientOrPest:
      if (v == MetricVariable::Ndre) return loosest_below(thr.nutrient.ndre_max, thr.nutrient.ndre_strong);
      if (v == MetricVariable::Gndvi) return thr.nutrient.gndvi_max;
      if (v == MetricVariable::Evi) return thr.nutrient.evi_max;
      break;
    case Category::Waterlogging:
      if (v == MetricVariable::Precip7d) return thr.waterlogging.precip_high_7d;
      if (v == MetricVariable::Precip1d) return thr.waterlogging.precip_high_1d;
      break;
    default:
      break;
  }
  return kUnset;
}

double peak_exceedance(const CategoryPeak& p, const RuleThresholds& thr) noexcept {
  const double t = trigger_threshold(p.category, p.variable, thr);
  if (!is_set(p.value) || !is_set(t)) return 0.0;
  const double ex = peak_direction(p.category, p.variable) == PeakDirection::Lower ? t - p.value : p.value - t;
  return std::max(ex, 0.0);
}

SeverityLevel classify_severity(double score) noexcept {
  if (score <= kSeverityMinorMax) return SeverityLevel::Minor;
  if (score <= kSeverityModerateMax) return SeverityLevel::Moderate;
  return SeverityLevel::Major;
}

std::vector<SeverityParts> score_events(const std::vector<Event>& events, const RuleThresholds& thr) {
  std::vector<SeverityParts> out(events.size());
  if (events.empty()) return out;

  // Pass 1: per-peak exceedance and run-wide scales.
  std::vector<std::vector<double>> exceed(events.size());
  std::array<std::array<double, kVariableSlots>, kCategoryCount> depth_scale{};
  double max_duration = 0.0;
  for (std::size_t i = 0; i < events.size(); ++i) {
    const Event& e = events[i];
    for (const auto& p : e.peaks) {
      const double ex = peak_exceedance(p, thr);
      exceed[i].push_back(ex);
      double& m = depth_scale[index_of(p.category)][static_cast<std::size_t>(p.variable)];
      m = std::max(m, ex);
    }
    max_duration = std::max(max_duration, static_cast<double>(e.duration_days));
  }

  std::vector<double> area_raw(events.size(), 0.0);
  double max_area = 0.0;
  for (std::size_t i = 0; i < events.size(); ++i) {
    out[i].depth = event_depth(events[i], exceed[i], depth_scale);
    area_raw[i] = out[i].depth * static_cast<double>(events[i].member_dates.size());
    max_area = std::max(max_area, area_raw[i]);
  }

  // Pass 2: normalise and weight.
  for (std::size_t i = 0; i < events.size(); ++i) {
    const Event& e = events[i];
    SeverityParts& s = out[i];
    s.duration = static_cast<double>(e.duration_days) / safe_max(max_duration);
    s.area = area_raw[i] / safe_max(max_area);
    s.density = e.duration_days > 0
                    ? static_cast<double>(e.member_dates.size()) / static_cast<double>(e.duration_days)
                    : 0.0;

    const double raw = kSeverityWeightDepth * s.depth + kSeverityWeightDuration * s.duration +
                       kSeverityWeightArea * s.area + kSeverityWeightDensity * s.density;
    s.score = round3(std::clamp(raw, 0.0, 1.0));
    s.level = classify_severity(s.score);
  }
  return out;
}

void attach_severity(std::vector<Event>& events, const RuleThresholds& thr) {
  const std::vector<SeverityParts> parts = score_events(events, thr);
  for (std::size_t i = 0; i < events.size(); ++i) {
    events[i].severity_score = parts[i].score;
    events[i].severity_level = parts[i].level;
  }
}

} // namespace cropwatch::alerts
