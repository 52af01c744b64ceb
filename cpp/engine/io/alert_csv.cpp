/*
================================================================================
Fragment 4.5 — IO: Alert Artifacts (CSV Implementation)
FILE: cpp/engine/io/alert_csv.cpp
================================================================================
*/

#include "engine/io/alert_csv.hpp"

#include <cstdio>
#include <ostream>

namespace cropwatch::io {

using namespace cropwatch::alerts;

namespace {

std::string num(double v) {
  if (!is_set(v)) return {};
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.6g", v);
  return std::string(buf);
}

const char* flag(bool b) { return b ? "true" : "false"; }

std::string join(const std::vector<std::string>& items, const char* sep) {
  std::string out;
  for (const auto& s : items) {
    if (!out.empty()) out += sep;
    out += s;
  }
  return out;
}

std::string rule_hits(const RuleOutcomeSet& rules) {
  std::string out;
  for (Category c : kAllCategories) {
    if (!rules[index_of(c)].triggered) continue;
    if (!out.empty()) out += '+';
    out += category_name(c);
  }
  return out;
}

std::string peaks_cell(const Event& e) {
  std::vector<std::string> parts;
  for (const auto& p : e.peaks) {
    std::string s = category_name(p.category);
    s += ':';
    if (is_set(p.value)) {
      s += metric_variable_name(p.variable);
      s += '=';
      s += num(p.value);
      s += '@';
      s += p.date.to_string();
    }
    parts.push_back(s);
  }
  return join(parts, ";");
}

}  // namespace

std::string csv_escape(const std::string& s) {
  bool need_quotes = false;
  for (char c : s) {
    if (c == ',' || c == '"' || c == '\n' || c == '\r') {
      need_quotes = true;
      break;
    }
  }
  if (!need_quotes) return s;

  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

void write_rs_debug_csv(std::ostream& os, const std::vector<DayResult>& days) {
  os << "date,rs_support,rs_age,support_date,skip_reason,canopy_ready,in_season,canopy_obs_count,"
        "gating_ok,allow_alert,support_ndvi,support_evi,support_ndmi,rule_hits\n";
  for (const auto& d : days) {
    const SupportStatus& st = d.support;
    os << d.record.date.to_string() << ","
       << flag(st.rs_support) << ","
       << (st.rs_support ? std::to_string(st.rs_age) : std::string()) << ","
       << (st.rs_support ? st.support_date.to_string() : std::string()) << ","
       << skip_reason_name(d.qc.skip_reason) << ","
       << flag(d.qc.canopy_ready) << ","
       << flag(d.gating.in_season) << ","
       << d.gating.canopy_obs_count << ","
       << flag(d.gating.gating_ok) << ","
       << flag(d.allow_alert()) << ","
       << num(st.support.ndvi) << ","
       << num(st.support.evi) << ","
       << num(st.support.ndmi) << ","
       << rule_hits(d.rules) << "\n";
  }
}

void write_alerts_csv(std::ostream& os, const std::vector<DailyAlert>& rows) {
  os << "date,label,category_count,reason\n";
  for (const auto& a : rows) {
    os << a.date.to_string() << ","
       << csv_escape(a.label()) << ","
       << a.hits.size() << ","
       << csv_escape(a.combined_reason()) << "\n";
  }
}

void write_events_csv(std::ostream& os, const std::vector<Event>& events) {
  os << "event_type,start_date,end_date,duration_days,peak_metric,peak_variable,peak_date,categories,peaks,"
        "severity_score,severity_level,reason_union,member_dates\n";
  for (const auto& e : events) {
    std::vector<std::string> dates;
    dates.reserve(e.member_dates.size());
    for (const auto& d : e.member_dates) dates.push_back(d.to_string());

    os << csv_escape(e.event_type()) << ","
       << e.start_date.to_string() << ","
       << e.end_date.to_string() << ","
       << e.duration_days << ","
       << num(e.peak_metric) << ","
       << (is_set(e.peak_metric) ? metric_variable_name(e.peak_variable) : "") << ","
       << (is_set(e.peak_metric) ? e.peak_date.to_string() : std::string()) << ","
       << csv_escape(e.categories_label()) << ","
       << csv_escape(peaks_cell(e)) << ","
       << num(e.severity_score) << ","
       << (is_set(e.severity_score) ? severity_level_name(e.severity_level) : "") << ","
       << csv_escape(join(e.reason_union, " | ")) << ","
       << csv_escape(join(dates, ";")) << "\n";
  }
}

}  // namespace cropwatch::io
