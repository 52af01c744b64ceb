#pragma once
/*
================================================================================
Fragment 2.8 — Alerts: Run Summary (Stage Counters)
FILE: cpp/engine/alerts/run_summary.hpp

Purpose:
  Per-run counters for the stage table and pass rates:
    01 merged     report-window days fed to the scan
    02 rs_debug   per-day QC / gating rows
    03 raw        days with >=1 raw alert
    04 gated      days with >=1 gated alert
    05 events     merged events

Invariants (validate() -> ErrorCode::kInvariant):
  days_total >= qc_ok_days >= allow_alert_days
  gating_ok_days >= allow_alert_days
  rule_hit_days >= raw_alert_days >= gated_alert_days
  per category: triggered >= raw >= gated
  skip-reason counts sum to days_total
================================================================================
*/

#include "engine/alerts/alert_types.hpp"
#include "engine/core/civil_date.hpp"

#include <array>
#include <vector>

namespace cropwatch::alerts {

struct RunSummary final {
  DateRange data{};
  DateRange report{};

  int data_days = 0;        // rows scanned (data window)
  int days_total = 0;       // rows emitted (report window)
  int qc_ok_days = 0;
  int gating_ok_days = 0;
  int allow_alert_days = 0; // qc ok AND gating ok

  std::array<int, kSkipReasonCount> skip_counts{};

  int rule_hit_days = 0;                             // >=1 rule fired, before QC
  std::array<int, kCategoryCount> triggered_days{};  // rule fired, before QC
  std::array<int, kCategoryCount> raw_days{};
  std::array<int, kCategoryCount> gated_days{};

  int raw_alert_days = 0;
  int gated_alert_days = 0;

  int events_total = 0;
  int composite_events = 0;
  std::array<int, kCategoryCount> single_events{};  // non-composite events per category
  std::array<int, kSeverityLevelCount> severity_events{};  // scored events per level

  // NaN when the denominator is zero.
  double qc_pass_rate() const noexcept;      // qc_ok / total
  double gating_pass_rate() const noexcept;  // allow_alert / qc_ok
  double allow_alert_rate() const noexcept;  // allow_alert / total
  double skip_ratio(SkipReason r) const noexcept;

  void validate() const;
};

RunSummary summarize_run(const DateRange& data, const DateRange& report, int data_days,
                         const std::vector<DayResult>& days,
                         const std::vector<DailyAlert>& raw,
                         const std::vector<DailyAlert>& gated,
                         const std::vector<Event>& events);

} // namespace cropwatch::alerts
