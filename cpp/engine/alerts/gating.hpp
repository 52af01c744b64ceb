#pragma once
/*
================================================================================
Fragment 2.4 — Alerts: Gating Filter
FILE: cpp/engine/alerts/gating.hpp

Purpose:
  Season / canopy eligibility per date. Never looks at rule outcomes.

Modes:
  off          -> always eligible
  month_window -> month in season_months
  canopy_obs   -> cumulative canopy-ready count (current date included)
                  >= canopy_obs_min
  both         -> month_window AND canopy_obs

State:
  GatingState is the explicit fold over the ascending date series. The
  counter starts at zero on the first data date. With reset_at_season_start
  it drops back to zero on the first in-season date that follows an
  out-of-season date.
================================================================================
*/

#include "engine/alerts/alert_config.hpp"
#include "engine/alerts/alert_types.hpp"

namespace cropwatch::alerts {

class GatingState final {
 public:
  explicit GatingState(const GatingConfig& cfg);

  // Dates must arrive strictly ascending (kOrdering otherwise).
  GatingDecision step(CivilDate d, const QCResult& qc);

  int canopy_obs_count() const noexcept { return count_; }

 private:
  GatingConfig cfg_;
  int count_ = 0;
  bool started_ = false;
  bool prev_in_season_ = false;
  CivilDate prev_date_{};
};

} // namespace cropwatch::alerts
