#pragma once
/*
================================================================================
Fragment 2.14 — Alerts: Event Severity
FILE: cpp/engine/alerts/event_severity.hpp

Purpose:
  Rank the merged events of one run by how hard and how long they hit.
  Every component is normalised to 0..1 against the run's own scale:

    depth    peak exceedance past the loosest trigger threshold of the peak's
             variable, divided by the largest exceedance of that
             (category, variable) in the run; composite = max over peaks
    duration duration_days / longest duration in the run
    area     depth * member days, divided by the run maximum
    density  member days / duration_days

    score = clamp(0.40*depth + 0.30*duration + 0.20*area + 0.10*density, 0, 1)
            rounded to 3 decimals
    level = minor (score <= 0.4) | moderate (<= 0.7) | major

  A run-wide maximum of zero normalises against 1, so that component is 0.
  Scores are relative: the same event can rank differently in another run.
================================================================================
*/

#include "engine/alerts/alert_config.hpp"
#include "engine/alerts/alert_types.hpp"

#include <vector>

namespace cropwatch::alerts {

inline constexpr double kSeverityWeightDepth = 0.40;
inline constexpr double kSeverityWeightDuration = 0.30;
inline constexpr double kSeverityWeightArea = 0.20;
inline constexpr double kSeverityWeightDensity = 0.10;

inline constexpr double kSeverityMinorMax = 0.4;
inline constexpr double kSeverityModerateMax = 0.7;

struct SeverityParts final {
  double depth = 0.0;
  double duration = 0.0;
  double area = 0.0;
  double density = 0.0;
  double score = 0.0;
  SeverityLevel level = SeverityLevel::Minor;
};

// Loosest set threshold the peak's variable is compared against for its
// category (e.g. max(ndmi_soft, ndmi_strong) for drought NDMI). Unset when the
// variable has no threshold in that category.
double trigger_threshold(Category c, MetricVariable v, const RuleThresholds& thr) noexcept;

// Distance past trigger_threshold() in the direction of peak_direction();
// 0 for an unset value or threshold, never negative.
double peak_exceedance(const CategoryPeak& p, const RuleThresholds& thr) noexcept;

SeverityLevel classify_severity(double score) noexcept;

// One entry per event, same order.
std::vector<SeverityParts> score_events(const std::vector<Event>& events, const RuleThresholds& thr);

// Writes severity_score / severity_level into each event.
void attach_severity(std::vector<Event>& events, const RuleThresholds& thr);

} // namespace cropwatch::alerts
