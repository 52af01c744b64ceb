/*
================================================================================
Fragment 2.2 — Alerts: Support Window Resolver (Implementation)
FILE: cpp/engine/alerts/support_window.cpp
================================================================================
*/

#include "engine/alerts/support_window.hpp"

#include "engine/core/error.hpp"

#include <algorithm>
#include <string>

namespace cropwatch::alerts {

void require_strictly_ascending(const std::vector<DailyRecord>& records) {
  for (std::size_t i = 1; i < records.size(); ++i) {
    const CivilDate prev = records[i - 1].date;
    const CivilDate cur = records[i].date;
    if (cur == prev) {
      CROPWATCH_THROW(ErrorCode::kOrdering, "duplicate date " + cur.to_string() + " in daily series");
    }
    if (cur < prev) {
      CROPWATCH_THROW(ErrorCode::kOrdering,
                      "non-monotonic dates in daily series: " + cur.to_string() + " follows " + prev.to_string());
    }
  }
}

SupportWindowResolver::SupportWindowResolver(const std::vector<DailyRecord>& records, const SupportConfig& cfg)
    : cfg_(cfg) {
  cfg_.validate();
  require_strictly_ascending(records);
  for (const auto& r : records) {
    if (r.has_index_observation()) obs_.push_back(Observation{r.date, r.indices});
  }
}

SupportStatus SupportWindowResolver::resolve(CivilDate d) const {
  SupportStatus st{};
  if (obs_.empty()) return st;

  // First observation strictly after d; the one before it is the latest <= d.
  auto after = std::upper_bound(obs_.begin(), obs_.end(), d,
                                [](CivilDate lhs, const Observation& o) { return lhs < o.date; });

  const Observation* best = nullptr;
  int best_dist = 0;

  if (after != obs_.begin()) {
    const Observation& past = *(after - 1);
    const int dist = d - past.date;
    if (dist <= cfg_.window_half_days) {
      best = &past;
      best_dist = dist;
    }
  }

  if (cfg_.mode == WindowMode::Symmetric && after != obs_.end()) {
    const int dist = after->date - d;
    // Strict: an equal-distance future observation loses to the earlier one.
    if (dist <= cfg_.window_half_days && (best == nullptr || dist < best_dist)) {
      best = &*after;
      best_dist = dist;
    }
  }

  if (best == nullptr) return st;

  st.rs_support = true;
  st.rs_age = best_dist;
  st.support_date = best->date;
  st.support = best->values;
  return st;
}

DailyRecord rule_view(const DailyRecord& rec, const SupportStatus& st, SupportPick pick) {
  DailyRecord out = rec;
  if (pick == SupportPick::Nearest && st.rs_support) out.indices = st.support;
  return out;
}

} // namespace cropwatch::alerts
