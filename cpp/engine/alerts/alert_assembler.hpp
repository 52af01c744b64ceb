#pragma once
/*
================================================================================
Fragment 2.6 — Alerts: Alert Assembler (Raw + Gated Views)
FILE: cpp/engine/alerts/alert_assembler.hpp

  raw   : triggered AND (skip_reason == ok OR category index_independent)
  gated : raw AND (gating_ok OR (index_independent AND NOT apply_to_weather_only))

A DailyAlert is produced only when at least one category survives; hits are
listed in category declaration order so the label is deterministic.
================================================================================
*/

#include "engine/alerts/alert_config.hpp"
#include "engine/alerts/alert_types.hpp"

#include <optional>

namespace cropwatch::alerts {

bool raw_allows(Category c, const RuleOutcome& r, const QCResult& qc, const RuleThresholds& thr) noexcept;

bool gated_allows(Category c, const RuleOutcome& r, const QCResult& qc, const GatingDecision& g,
                  const RuleThresholds& thr, const GatingConfig& gating) noexcept;

std::optional<DailyAlert> assemble_raw(const DayResult& day, const RuleThresholds& thr);

std::optional<DailyAlert> assemble_gated(const DayResult& day, const RuleThresholds& thr,
                                         const GatingConfig& gating);

} // namespace cropwatch::alerts
