/*
================================================================================
Fragment 2.3 — Alerts: QC Classifier (Implementation)
FILE: cpp/engine/alerts/qc_classifier.cpp
================================================================================
*/

#include "engine/alerts/qc_classifier.hpp"

namespace cropwatch::alerts {

bool canopy_reliable(const IndexValues& v, const CanopyConfig& canopy) noexcept {
  const bool ndvi_pass = is_set(v.ndvi) && is_set(canopy.ndvi_min) && v.ndvi >= canopy.ndvi_min;
  const bool evi_pass = is_set(v.evi) && is_set(canopy.evi_min) && v.evi >= canopy.evi_min;
  return ndvi_pass || evi_pass;
}

QCResult classify_qc(const SupportStatus& st, const SupportConfig& support, const CanopyConfig& canopy) noexcept {
  QCResult q{};
  if (!st.rs_support) {
    q.skip_reason = SkipReason::NoRemoteSensing;
    return q;
  }
  if (st.rs_age > support.max_age_days) {
    q.skip_reason = SkipReason::Stale;
    return q;
  }
  if (!canopy_reliable(st.support, canopy)) {
    q.skip_reason = SkipReason::LowCanopyConfidence;
    return q;
  }
  q.skip_reason = SkipReason::Ok;
  q.canopy_ready = true;
  return q;
}

} // namespace cropwatch::alerts
