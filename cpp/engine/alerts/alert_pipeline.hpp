#pragma once
/*
================================================================================
Fragment 2.9 — Alerts: Composite Alert Pipeline
FILE: cpp/engine/alerts/alert_pipeline.hpp

Purpose:
  One deterministic pass over a daily series:
    support -> QC -> gating (fold) -> rules -> raw/gated views -> events

  - Config is validated before the first row (kConfig).
  - Dates must be strictly ascending (kOrdering).
  - Rows outside period.data are ignored. Rows inside period.data drive the
    support window and the gating counter; only rows inside period.report
    are emitted.
  - No I/O. Stage counts are logged at INFO, per-day decisions at DEBUG.
================================================================================
*/

#include "engine/alerts/alert_config.hpp"
#include "engine/alerts/alert_types.hpp"
#include "engine/alerts/run_summary.hpp"

#include <vector>

namespace cropwatch::alerts {

struct PipelineResult final {
  std::vector<DayResult> days;      // report window, ascending
  std::vector<DailyAlert> raw;      // QC-filtered
  std::vector<DailyAlert> gated;    // QC + gating filtered
  std::vector<Event> events;        // merged from `gated`
  RunSummary summary;
};

PipelineResult run_alert_pipeline(const std::vector<DailyRecord>& records, const AlertConfig& cfg);

} // namespace cropwatch::alerts
