/*
================================================================================
Fragment 2.4 — Alerts: Gating Filter (Implementation)
FILE: cpp/engine/alerts/gating.cpp
================================================================================
*/

#include "engine/alerts/gating.hpp"

#include "engine/core/error.hpp"

namespace cropwatch::alerts {

GatingState::GatingState(const GatingConfig& cfg) : cfg_(cfg) {
  cfg_.validate();
}

GatingDecision GatingState::step(CivilDate d, const QCResult& qc) {
  if (started_ && !(prev_date_ < d)) {
    CROPWATCH_THROW(ErrorCode::kOrdering,
                    "gating received " + d.to_string() + " after " + prev_date_.to_string());
  }

  const bool in_season = cfg_.in_season(d.month());

  if (cfg_.reset_at_season_start && started_ && in_season && !prev_in_season_) {
    count_ = 0;
  }
  if (qc.canopy_ready) ++count_;

  const bool month_ok = in_season;
  const bool canopy_ok = count_ >= cfg_.canopy_obs_min;

  GatingDecision g{};
  g.in_season = in_season;
  g.canopy_obs_count = count_;
  switch (cfg_.mode) {
    case GatingMode::Off:         g.gating_ok = true; break;
    case GatingMode::MonthWindow: g.gating_ok = month_ok; break;
    case GatingMode::CanopyObs:   g.gating_ok = canopy_ok; break;
    case GatingMode::Both:        g.gating_ok = month_ok && canopy_ok; break;
    default:                      g.gating_ok = false; break;
  }

  started_ = true;
  prev_in_season_ = in_season;
  prev_date_ = d;
  return g;
}

} // namespace cropwatch::alerts
