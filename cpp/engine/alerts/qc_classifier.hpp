#pragma once
/*
================================================================================
Fragment 2.3 — Alerts: QC Classifier
FILE: cpp/engine/alerts/qc_classifier.hpp

Priority (first match wins):
  1) no observation in window         -> no_remote_sensing
  2) rs_age > max_age_days            -> stale
  3) NDVI < ndvi_min AND EVI < evi_min
     (unset value or threshold fails) -> low_canopy_confidence
  4) otherwise                        -> ok, canopy_ready = true
================================================================================
*/

#include "engine/alerts/alert_config.hpp"
#include "engine/alerts/alert_types.hpp"

namespace cropwatch::alerts {

// Canopy reliable when NDVI >= ndvi_min OR EVI >= evi_min.
bool canopy_reliable(const IndexValues& v, const CanopyConfig& canopy) noexcept;

QCResult classify_qc(const SupportStatus& st, const SupportConfig& support, const CanopyConfig& canopy) noexcept;

} // namespace cropwatch::alerts
