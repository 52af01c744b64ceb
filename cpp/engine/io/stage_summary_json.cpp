/*
================================================================================
Fragment 4.6 — IO: Stage Summary (JSON Implementation)
FILE: cpp/engine/io/stage_summary_json.cpp
================================================================================
*/

#include "engine/io/stage_summary_json.hpp"

#include <ostream>
#include <sstream>

namespace cropwatch::io {

using namespace cropwatch::alerts;

namespace {

void write_ranges(JsonWriter& w, const RunSummary& s) {
  w.begin_object();
  w.field("data_start", s.data.start.to_string());
  w.field("data_end", s.data.end.to_string());
  w.field("report_start", s.report.start.to_string());
  w.field("report_end", s.report.end.to_string());
  w.end_object();
}

void stage_row(JsonWriter& w, const char* name, int days, int alerts, int events, int removed) {
  w.begin_object();
  w.field("stage", name);
  w.key("days");
  if (days >= 0) w.integer(days); else w.null_value();
  w.key("alerts");
  if (alerts >= 0) w.integer(alerts); else w.null_value();
  w.key("events");
  if (events >= 0) w.integer(events); else w.null_value();
  w.key("removed");
  if (removed >= 0) w.integer(removed); else w.null_value();
  w.end_object();
}

// -1 = not applicable (null)
void write_stages(JsonWriter& w, const RunSummary& s) {
  w.begin_array();
  stage_row(w, "01_merged", s.days_total, -1, -1, -1);
  stage_row(w, "02_rs_debug", s.days_total, -1, -1, s.days_total - s.allow_alert_days);
  stage_row(w, "03_alerts_raw", -1, s.raw_alert_days, -1, s.rule_hit_days - s.raw_alert_days);
  stage_row(w, "04_alerts_gated", -1, s.gated_alert_days, -1, s.raw_alert_days - s.gated_alert_days);
  stage_row(w, "05_events", -1, -1, s.events_total, -1);
  w.end_array();
}

void write_skip_reasons(JsonWriter& w, const RunSummary& s) {
  static constexpr SkipReason kOrder[kSkipReasonCount] = {
      SkipReason::Ok, SkipReason::NoRemoteSensing, SkipReason::Stale, SkipReason::LowCanopyConfidence};
  w.begin_object();
  w.key("counts");
  w.begin_object();
  for (SkipReason r : kOrder) w.field(skip_reason_name(r), s.skip_counts[static_cast<std::size_t>(r)]);
  w.end_object();
  w.key("ratios");
  w.begin_object();
  for (SkipReason r : kOrder) w.field(skip_reason_name(r), s.skip_ratio(r));
  w.end_object();
  w.end_object();
}

void write_categories(JsonWriter& w, const RunSummary& s) {
  w.begin_object();
  for (Category c : kAllCategories) {
    const std::size_t i = index_of(c);
    w.key(category_name(c));
    w.begin_object();
    w.field("triggered_days", s.triggered_days[i]);
    w.field("raw_days", s.raw_days[i]);
    w.field("gated_days", s.gated_days[i]);
    w.field("events", s.single_events[i]);
    w.end_object();
  }
  w.end_object();
}

void write_thresholds(JsonWriter& w, const RuleThresholds& r) {
  w.begin_object();

  w.key("drought");
  w.begin_object();
  w.field("ndmi_strong", r.drought.ndmi_strong);
  w.field("msi_strong", r.drought.msi_strong);
  w.field("ndmi_soft", r.drought.ndmi_soft);
  w.field("msi_soft", r.drought.msi_soft);
  w.field("precip_low_7d", r.drought.precip_low_7d);
  w.field("precip_only_max", r.drought.precip_only_max);
  w.field("index_independent", r.drought.index_independent);
  w.end_object();

  w.key("cold_stress");
  w.begin_object();
  w.field("tmean_max", r.cold.tmean_max);
  w.field("tmin_max", r.cold.tmin_max);
  w.field("rh_min", r.cold.rh_min);
  w.field("index_independent", r.cold.index_independent);
  w.end_object();

  w.key("heat_stress");
  w.begin_object();
  w.field("tmean_min", r.heat.tmean_min);
  w.field("tmax_min", r.heat.tmax_min);
  w.field("rh_max", r.heat.rh_max);
  w.field("evi_max", r.heat.evi_max);
  w.field("index_independent", r.heat.index_independent);
  w.end_object();

  w.key("nutrient_or_pest");
  w.begin_object();
  w.field("ndre_max", r.nutrient.ndre_max);
  w.field("ndre_strong", r.nutrient.ndre_strong);
  w.field("gndvi_max", r.nutrient.gndvi_max);
  w.field("evi_max", r.nutrient.evi_max);
  w.field("ndmi_moist_min", r.nutrient.ndmi_moist_min);
  w.field("rh_humid", r.nutrient.rh_humid);
  w.field("require_humidity", r.nutrient.require_humidity);
  w.field("min_index_deficits", r.nutrient.min_index_deficits);
  w.end_object();

  w.key("waterlogging");
  w.begin_object();
  w.field("precip_high_7d", r.waterlogging.precip_high_7d);
  w.field("precip_high_1d", r.waterlogging.precip_high_1d);
  w.field("ndmi_wet", r.waterlogging.ndmi_wet);
  w.field("ndvi_sparse", r.waterlogging.ndvi_sparse);
  w.field("index_independent", r.waterlogging.index_independent);
  w.end_object();

  w.end_object();
}

void write_config_echo(JsonWriter& w, const AlertConfig& cfg) {
  w.begin_object();

  w.key("support");
  w.begin_object();
  w.field("window_half_days", cfg.support.window_half_days);
  w.field("window_mode", window_mode_name(cfg.support.mode));
  w.field("max_age_days", cfg.support.max_age_days);
  w.field("pick", support_pick_name(cfg.support.pick));
  w.end_object();

  w.key("canopy");
  w.begin_object();
  w.field("ndvi_min", cfg.canopy.ndvi_min);
  w.field("evi_min", cfg.canopy.evi_min);
  w.end_object();

  w.key("gating");
  w.begin_object();
  w.field("mode", gating_mode_name(cfg.gating.mode));
  w.key("season_months");
  w.begin_array();
  for (int m : cfg.gating.season_months) w.integer(m);
  w.end_array();
  w.field("canopy_obs_min", cfg.gating.canopy_obs_min);
  w.field("reset_at_season_start", cfg.gating.reset_at_season_start);
  w.field("apply_to_weather_only", cfg.gating.apply_to_weather_only);
  w.end_object();

  w.key("merge");
  w.begin_object();
  w.field("merge_gap_days", cfg.merge.merge_gap_days);
  w.end_object();

  w.key("input");
  w.begin_object();
  w.field("duplicate_dates", duplicate_policy_name(cfg.input.duplicate_dates));
  w.end_object();

  w.key("thresholds");
  write_thresholds(w, cfg.rules);

  w.end_object();
}

}  // namespace

void write_stage_summary_json(std::ostream& os,
                              const RunSummary& summary,
                              const AlertConfig& cfg,
                              const JsonWriteOptions& opt) {
  JsonWriter w(os, opt);
  w.begin_object();

  w.key("ranges");
  write_ranges(w, summary);

  w.key("totals");
  w.begin_object();
  w.field("data_days", summary.data_days);
  w.field("report_days", summary.days_total);
  w.field("qc_ok_days", summary.qc_ok_days);
  w.field("gating_ok_days", summary.gating_ok_days);
  w.field("allow_alert_days", summary.allow_alert_days);
  w.end_object();

  w.key("stages");
  write_stages(w, summary);

  w.key("pass_rates");
  w.begin_object();
  w.field("qc_pass_rate", summary.qc_pass_rate());
  w.field("gating_pass_rate", summary.gating_pass_rate());
  w.field("allow_alert_rate", summary.allow_alert_rate());
  w.end_object();

  w.key("skip_reasons");
  write_skip_reasons(w, summary);

  w.key("categories");
  write_categories(w, summary);

  w.key("events");
  w.begin_object();
  w.field("total", summary.events_total);
  w.field("composite", summary.composite_events);
  w.key("severity");
  w.begin_object();
  for (std::size_t i = 0; i < kSeverityLevelCount; ++i) {
    w.field(severity_level_name(static_cast<SeverityLevel>(i)), summary.severity_events[i]);
  }
  w.end_object();
  w.end_object();

  w.key("config");
  write_config_echo(w, cfg);

  w.end_object();
  if (opt.pretty) os << "\n";
}

std::string stage_summary_to_json(const RunSummary& summary, const AlertConfig& cfg, const JsonWriteOptions& opt) {
  std::ostringstream ss;
  write_stage_summary_json(ss, summary, cfg, opt);
  return ss.str();
}

}  // namespace cropwatch::io
