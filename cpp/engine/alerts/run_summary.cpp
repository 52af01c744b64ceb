/*
================================================================================
Fragment 2.8 — Alerts: Run Summary (Implementation)
FILE: cpp/engine/alerts/run_summary.cpp
================================================================================
*/

#include "engine/alerts/run_summary.hpp"

#include "engine/core/error.hpp"

#include <string>

namespace cropwatch::alerts {

namespace {

inline double ratio(int num, int den) noexcept {
  return den > 0 ? static_cast<double>(num) / static_cast<double>(den) : kUnset;
}

void require_order(int hi, const char* hi_name, int lo, const char* lo_name) {
  if (hi < lo) {
    CROPWATCH_THROW(ErrorCode::kInvariant, std::string("run summary: ") + hi_name + "=" + std::to_string(hi) +
                                               " < " + lo_name + "=" + std::to_string(lo));
  }
}

} // namespace

double RunSummary::qc_pass_rate() const noexcept { return ratio(qc_ok_days, days_total); }
double RunSummary::gating_pass_rate() const noexcept { return ratio(allow_alert_days, qc_ok_days); }
double RunSummary::allow_alert_rate() const noexcept { return ratio(allow_alert_days, days_total); }

double RunSummary::skip_ratio(SkipReason r) const noexcept {
  return ratio(skip_counts[static_cast<std::size_t>(r)], days_total);
}

void RunSummary::validate() const {
  require_order(data_days, "data_days", days_total, "days_total");
  require_order(days_total, "days_total", qc_ok_days, "qc_ok_days");
  require_order(qc_ok_days, "qc_ok_days", allow_alert_days, "allow_alert_days");
  require_order(gating_ok_days, "gating_ok_days", allow_alert_days, "allow_alert_days");
  require_order(days_total, "days_total", rule_hit_days, "rule_hit_days");
  require_order(rule_hit_days, "rule_hit_days", raw_alert_days, "raw_alert_days");
  require_order(raw_alert_days, "raw_alert_days", gated_alert_days, "gated_alert_days");
  for (Category c : kAllCategories) {
    const std::size_t i = index_of(c);
    require_order(raw_days[i], "raw_days", gated_days[i], "gated_days");
    require_order(triggered_days[i], "triggered_days", raw_days[i], "raw_days");
  }

  int skip_sum = 0;
  for (int n : skip_counts) skip_sum += n;
  CROPWATCH_ENSURE(skip_sum == days_total, ErrorCode::kInvariant,
                   "run summary: skip-reason counts sum to " + std::to_string(skip_sum) +
                       ", expected " + std::to_string(days_total));
  CROPWATCH_ENSURE(skip_counts[static_cast<std::size_t>(SkipReason::Ok)] == qc_ok_days, ErrorCode::kInvariant,
                   "run summary: skip_counts[ok] differs from qc_ok_days");

  int singles = 0;
  for (int n : single_events) singles += n;
  CROPWATCH_ENSURE(singles + composite_events == events_total, ErrorCode::kInvariant,
                   "run summary: event type counts do not sum to events_total");
}

RunSummary summarize_run(const DateRange& data, const DateRange& report, int data_days,
                         const std::vector<DayResult>& days,
                         const std::vector<DailyAlert>& raw,
                         const std::vector<DailyAlert>& gated,
                         const std::vector<Event>& events) {
  RunSummary s{};
  s.data = data;
  s.report = report;
  s.data_days = data_days;
  s.days_total = static_cast<int>(days.size());

  for (const auto& d : days) {
    ++s.skip_counts[static_cast<std::size_t>(d.qc.skip_reason)];
    if (d.qc.ok()) ++s.qc_ok_days;
    if (d.gating.gating_ok) ++s.gating_ok_days;
    if (d.allow_alert()) ++s.allow_alert_days;
    bool any = false;
    for (Category c : kAllCategories) {
      if (!d.rules[index_of(c)].triggered) continue;
      ++s.triggered_days[index_of(c)];
      any = true;
    }
    if (any) ++s.rule_hit_days;
  }

  s.raw_alert_days = static_cast<int>(raw.size());
  for (const auto& a : raw) {
    for (const auto& h : a.hits) ++s.raw_days[index_of(h.category)];
  }
  s.gated_alert_days = static_cast<int>(gated.size());
  for (const auto& a : gated) {
    for (const auto& h : a.hits) ++s.gated_days[index_of(h.category)];
  }

  s.events_total = static_cast<int>(events.size());
  for (const auto& e : events) {
    if (e.composite) {
      ++s.composite_events;
    } else if (!e.categories.empty()) {
      ++s.single_events[index_of(e.categories.front())];
    }
    if (is_set(e.severity_score)) ++s.severity_events[static_cast<std::size_t>(e.severity_level)];
  }
  return s;
}

} // namespace cropwatch::alerts
