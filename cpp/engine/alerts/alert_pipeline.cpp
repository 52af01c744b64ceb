/*
================================================================================
Fragment 2.9 — Alerts: Composite Alert Pipeline (Implementation)
FILE: cpp/engine/alerts/alert_pipeline.cpp
================================================================================
*/

#include "engine/alerts/alert_pipeline.hpp"

#include "engine/alerts/alert_assembler.hpp"
#include "engine/alerts/alert_rules.hpp"
#include "engine/alerts/event_merger.hpp"
#include "engine/alerts/event_severity.hpp"
#include "engine/alerts/gating.hpp"
#include "engine/alerts/qc_classifier.hpp"
#include "engine/alerts/support_window.hpp"
#include "engine/core/logging.hpp"

#include <sstream>
#include <string>

namespace cropwatch::alerts {

namespace {

constexpr const char* kComponent = "alerts";

void log_day(const DayResult& d) {
  if (!log_enabled(LogLevel::DEBUG)) return;
  std::ostringstream oss;
  oss << d.record.date.to_string()
      << " skip=" << skip_reason_name(d.qc.skip_reason)
      << " rs_age=" << d.support.rs_age
      << " in_season=" << (d.gating.in_season ? 1 : 0)
      << " canopy_obs=" << d.gating.canopy_obs_count
      << " gating_ok=" << (d.gating.gating_ok ? 1 : 0);
  for (Category c : kAllCategories) {
    const RuleOutcome& r = d.rules[index_of(c)];
    if (r.triggered) oss << " " << category_name(c) << "{" << r.reason << "}";
  }
  log(LogLevel::DEBUG, kComponent, oss.str());
}

void log_stages(const RunSummary& s) {
  std::ostringstream oss;
  oss << "stages: merged=" << s.days_total
      << " qc_ok=" << s.qc_ok_days
      << " allow_alert=" << s.allow_alert_days
      << " raw_alert_days=" << s.raw_alert_days
      << " gated_alert_days=" << s.gated_alert_days
      << " events=" << s.events_total
      << " (composite=" << s.composite_events << ")";
  log(LogLevel::INFO, kComponent, oss.str());
}

} // namespace

PipelineResult run_alert_pipeline(const std::vector<DailyRecord>& records, const AlertConfig& cfg) {
  cfg.validate();
  require_strictly_ascending(records);

  std::vector<DailyRecord> data_rows;
  data_rows.reserve(records.size());
  for (const auto& r : records) {
    if (cfg.period.data.contains(r.date)) data_rows.push_back(r);
  }
  if (data_rows.size() != records.size()) {
    log(LogLevel::DEBUG, kComponent,
        "ignored " + std::to_string(records.size() - data_rows.size()) + " row(s) outside data period");
  }
  if (data_rows.empty()) {
    log(LogLevel::WARN, kComponent, "no rows inside data period " + cfg.period.data.start.to_string() + ".." +
                                        cfg.period.data.end.to_string());
  }

  const SupportWindowResolver resolver(data_rows, cfg.support);
  GatingState gating(cfg.gating);

  PipelineResult out{};
  for (const auto& rec : data_rows) {
    DayResult day{};
    day.record = rec;
    day.support = resolver.resolve(rec.date);
    day.qc = classify_qc(day.support, cfg.support, cfg.canopy);
    day.gating = gating.step(rec.date, day.qc);
    day.rules = evaluate_rules(rule_view(rec, day.support, cfg.support.pick), cfg.rules);

    if (!cfg.period.report.contains(rec.date)) continue;

    log_day(day);
    if (auto a = assemble_raw(day, cfg.rules)) out.raw.push_back(std::move(*a));
    if (auto a = assemble_gated(day, cfg.rules, cfg.gating)) out.gated.push_back(std::move(*a));
    out.days.push_back(std::move(day));
  }

  out.events = merge_events(out.gated, cfg.merge);
  attach_severity(out.events, cfg.rules);

  out.summary = summarize_run(cfg.period.data, cfg.period.report, static_cast<int>(data_rows.size()),
                              out.days, out.raw, out.gated, out.events);
  out.summary.validate();
  log_stages(out.summary);
  return out;
}

} // namespace cropwatch::alerts
