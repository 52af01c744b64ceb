/*
================================================================================
Fragment 2.6 — Alerts: Alert Assembler (Implementation)
FILE: cpp/engine/alerts/alert_assembler.cpp
================================================================================
*/

#include "engine/alerts/alert_assembler.hpp"

namespace cropwatch::alerts {

bool raw_allows(Category c, const RuleOutcome& r, const QCResult& qc, const RuleThresholds& thr) noexcept {
  return r.triggered && (qc.ok() || thr.index_independent(c));
}

bool gated_allows(Category c, const RuleOutcome& r, const QCResult& qc, const GatingDecision& g,
                  const RuleThresholds& thr, const GatingConfig& gating) noexcept {
  if (!raw_allows(c, r, qc, thr)) return false;
  if (g.gating_ok) return true;
  return thr.index_independent(c) && !gating.apply_to_weather_only;
}

namespace {

template <class Allow>
std::optional<DailyAlert> assemble(const DayResult& day, Allow allow) {
  DailyAlert a{};
  a.date = day.record.date;
  for (Category c : kAllCategories) {
    const RuleOutcome& r = day.rules[index_of(c)];
    if (!allow(c, r)) continue;
    a.hits.push_back(CategoryHit{c, r.reason, r.metric, r.variable});
  }
  if (a.hits.empty()) return std::nullopt;
  return a;
}

} // namespace

std::optional<DailyAlert> assemble_raw(const DayResult& day, const RuleThresholds& thr) {
  return assemble(day, [&](Category c, const RuleOutcome& r) {
    return raw_allows(c, r, day.qc, thr);
  });
}

std::optional<DailyAlert> assemble_gated(const DayResult& day, const RuleThresholds& thr,
                                         const GatingConfig& gating) {
  return assemble(day, [&](Category c, const RuleOutcome& r) {
    return gated_allows(c, r, day.qc, day.gating, thr, gating);
  });
}

} // namespace cropwatch::alerts
