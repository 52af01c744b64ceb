#pragma once
/*
================================================================================
Fragment 2.7 — Alerts: Event Merger
FILE: cpp/engine/alerts/event_merger.hpp

Purpose:
  Gated daily alerts -> reportable events, in two passes.

Pass 1 (per-category runs), one state machine per category:
  idle --hit--> open
  open --hit d', d' - end - 1 <= gap--> extend (end = d', union reason, peak)
  open --hit d', otherwise--> close (emit), open new at d'
  end of stream: close every open run.
  `gap` counts non-alert days between two hits: gap 0 joins only consecutive
  days.
  Peaks compare values only within one MetricVariable; a hit on an
  earlier-declared variable replaces the peak outright.

Pass 2 (composites):
  Sort events by (start, end, category). Sweep groups; an event joins the
  current group when next.start - group_end - 1 <= gap (overlap included).
  Group with >=2 distinct categories -> one composite event:
    - span union, sorted distinct member dates
    - reason_union entries prefixed "<category>: "
    - per-category peaks kept; composite peak_metric unset
  Group of one category -> one event of that category.
  Group of one event -> that event unchanged.

Idempotence:
  merge_events(merge_events(x)) == merge_events(x).

Failures (ErrorCode::kOrdering):
  - alert dates not strictly ascending (duplicates included)
  - an event whose end precedes its start
================================================================================
*/

#include "engine/alerts/alert_config.hpp"
#include "engine/alerts/alert_types.hpp"

#include <array>
#include <optional>
#include <vector>

namespace cropwatch::alerts {

// Explicit fold state for pass 1.
class CategoryRunMerger final {
 public:
  explicit CategoryRunMerger(int merge_gap_days);

  void push(const DailyAlert& a);

  // Closes all open runs; result sorted by (start, category).
  std::vector<Event> finish();

 private:
  void extend(Event& e, const CategoryHit& h, CivilDate d);
  void close(Category c);

  int gap_;
  bool started_ = false;
  CivilDate last_date_{};
  std::array<std::optional<Event>, kCategoryCount> open_{};
  std::vector<Event> closed_;
};

std::vector<Event> merge_category_runs(const std::vector<DailyAlert>& gated, int merge_gap_days);

std::vector<Event> merge_composites(std::vector<Event> events, int merge_gap_days);

// Pass 1 + pass 2.
std::vector<Event> merge_events(const std::vector<DailyAlert>& gated, const MergeConfig& cfg);

// Pass 2 on an already merged stream (identity on merge_events output).
std::vector<Event> merge_events(const std::vector<Event>& events, const MergeConfig& cfg);

// Throws kOrdering when end < start or duration/member dates are inconsistent.
void validate_event(const Event& e);

} // namespace cropwatch::alerts
