#pragma once
/*
================================================================================
Fragment 2.2 — Alerts: Support Window Resolver
FILE: cpp/engine/alerts/support_window.hpp

Purpose:
  For each date, decide which remote-sensing observation (if any) supports it.

Rules:
  - Candidate = a date in the window whose record carries at least one index.
  - Window: [d-w, d+w] (symmetric) or [d-w, d] (past_only).
  - Nearest candidate wins; equal distance -> earlier date.
  - rs_age = |d - chosen|.
  - No candidate is not an error: rs_support=false, rs_age=-1.

Ordering:
  - The resolver is built from an ascending, duplicate-free record series.
    Anything else raises ErrorCode::kOrdering naming the dates.
================================================================================
*/

#include "engine/alerts/alert_config.hpp"
#include "engine/alerts/alert_types.hpp"

#include <vector>

namespace cropwatch::alerts {

struct Observation {
  CivilDate date{};
  IndexValues values{};
};

class SupportWindowResolver final {
 public:
  SupportWindowResolver(const std::vector<DailyRecord>& records, const SupportConfig& cfg);

  SupportStatus resolve(CivilDate d) const;

  const std::vector<Observation>& observations() const noexcept { return obs_; }

 private:
  SupportConfig cfg_;
  std::vector<Observation> obs_;  // ascending by date
};

// The record the rule evaluator sees for a date: weather untouched, indices
// taken from the support observation (nearest) or left as the day's own
// values (same_day). Unsupported dates keep their own (usually unset) indices.
DailyRecord rule_view(const DailyRecord& rec, const SupportStatus& st, SupportPick pick);

// Throws kOrdering when dates are not strictly ascending.
void require_strictly_ascending(const std::vector<DailyRecord>& records);

} // namespace cropwatch::alerts
