/*
================================================================================
Fragment 2.7 — Alerts: Event Merger (Implementation)
FILE: cpp/engine/alerts/event_merger.cpp
================================================================================
*/

#include "engine/alerts/event_merger.hpp"

#include "engine/core/error.hpp"

#include <algorithm>
#include <string>

namespace cropwatch::alerts {

namespace {

void push_distinct(std::vector<std::string>& v, const std::string& s) {
  if (std::find(v.begin(), v.end(), s) == v.end()) v.push_back(s);
}

Event open_event(Category c, const CategoryHit& h, CivilDate d) {
  Event e{};
  e.composite = false;
  e.categories = {c};
  e.start_date = d;
  e.end_date = d;
  e.duration_days = 1;
  e.peak_metric = h.metric;
  e.peak_date = d;
  e.peak_variable = h.variable;
  e.peaks = {CategoryPeak{c, h.metric, d, h.variable}};
  if (!h.reason.empty()) e.reason_union.push_back(h.reason);
  e.member_dates = {d};
  return e;
}

bool event_less(const Event& a, const Event& b) {
  if (a.start_date != b.start_date) return a.start_date < b.start_date;
  if (a.end_date != b.end_date) return a.end_date < b.end_date;
  const std::size_t ca = a.categories.empty() ? kCategoryCount : index_of(a.categories.front());
  const std::size_t cb = b.categories.empty() ? kCategoryCount : index_of(b.categories.front());
  return ca < cb;
}

// Fold a group of >=2 events into one.
Event fold_group(const std::vector<Event>& group) {
  std::array<bool, kCategoryCount> present{};
  for (const auto& e : group) {
    for (Category c : e.categories) present[index_of(c)] = true;
  }

  Event out{};
  for (Category c : kAllCategories) {
    if (present[index_of(c)]) out.categories.push_back(c);
  }
  out.composite = out.categories.size() >= 2;

  out.start_date = group.front().start_date;
  out.end_date = group.front().end_date;
  for (const auto& e : group) {
    out.start_date = std::min(out.start_date, e.start_date);
    out.end_date = std::max(out.end_date, e.end_date);
  }
  out.duration_days = (out.end_date - out.start_date) + 1;

  // Per-category peaks: preferred variable, then most extreme, earlier date on ties.
  for (Category c : out.categories) {
    CategoryPeak best{c, kUnset, CivilDate{}, MetricVariable::None};
    for (const auto& e : group) {
      for (const auto& p : e.peaks) {
        if (p.category != c) continue;
        if (more_extreme(c, p.variable, p.value, best.variable, best.value) ||
            (is_set(p.value) && p.variable == best.variable && p.value == best.value && p.date < best.date)) {
          best = p;
        }
      }
    }
    out.peaks.push_back(best);
  }

  if (out.composite) {
    out.peak_metric = kUnset;
    out.peak_date = CivilDate{};
    out.peak_variable = MetricVariable::None;
  } else {
    out.peak_metric = out.peaks.front().value;
    out.peak_date = out.peaks.front().date;
    out.peak_variable = out.peaks.front().variable;
  }

  for (const auto& e : group) {
    for (const auto& r : e.reason_union) {
      if (out.composite && !e.composite) {
        push_distinct(out.reason_union, std::string(category_name(e.categories.front())) + ": " + r);
      } else {
        push_distinct(out.reason_union, r);
      }
    }
  }

  for (const auto& e : group) {
    out.member_dates.insert(out.member_dates.end(), e.member_dates.begin(), e.member_dates.end());
  }
  std::sort(out.member_dates.begin(), out.member_dates.end());
  out.member_dates.erase(std::unique(out.member_dates.begin(), out.member_dates.end()), out.member_dates.end());

  return out;
}

} // namespace

void validate_event(const Event& e) {
  if (e.end_date < e.start_date) {
    CROPWATCH_THROW(ErrorCode::kOrdering,
                    "event end " + e.end_date.to_string() + " precedes start " + e.start_date.to_string());
  }
  CROPWATCH_ENSURE(e.duration_days == (e.end_date - e.start_date) + 1, ErrorCode::kOrdering,
                   "event " + e.start_date.to_string() + ".." + e.end_date.to_string() + " has inconsistent duration");
  for (std::size_t i = 0; i < e.member_dates.size(); ++i) {
    const CivilDate d = e.member_dates[i];
    if (d < e.start_date || d > e.end_date) {
      CROPWATCH_THROW(ErrorCode::kOrdering,
                      "member date " + d.to_string() + " outside event " + e.start_date.to_string() + ".." +
                          e.end_date.to_string());
    }
    if (i > 0 && !(e.member_dates[i - 1] < d)) {
      CROPWATCH_THROW(ErrorCode::kOrdering, "event member dates not strictly ascending at " + d.to_string());
    }
  }
}

// ----------------------------- Pass 1 ----------------------------------------

CategoryRunMerger::CategoryRunMerger(int merge_gap_days) : gap_(merge_gap_days) {
  CROPWATCH_ENSURE(gap_ >= 0, ErrorCode::kConfig, "merge.merge_gap_days must be >= 0");
}

void CategoryRunMerger::extend(Event& e, const CategoryHit& h, CivilDate d) {
  e.end_date = d;
  e.duration_days = (e.end_date - e.start_date) + 1;
  e.member_dates.push_back(d);
  if (!h.reason.empty()) push_distinct(e.reason_union, h.reason);
  CategoryPeak& p = e.peaks.front();
  if (more_extreme(h.category, h.variable, h.metric, p.variable, p.value)) {
    p.value = h.metric;
    p.date = d;
    p.variable = h.variable;
    e.peak_metric = h.metric;
    e.peak_date = d;
    e.peak_variable = h.variable;
  }
}

void CategoryRunMerger::close(Category c) {
  auto& slot = open_[index_of(c)];
  if (!slot) return;
  closed_.push_back(std::move(*slot));
  slot.reset();
}

void CategoryRunMerger::push(const DailyAlert& a) {
  if (started_ && !(last_date_ < a.date)) {
    if (a.date == last_date_) {
      CROPWATCH_THROW(ErrorCode::kOrdering, "duplicate alert date " + a.date.to_string());
    }
    CROPWATCH_THROW(ErrorCode::kOrdering,
                    "non-monotonic alert dates: " + a.date.to_string() + " follows " + last_date_.to_string());
  }
  started_ = true;
  last_date_ = a.date;

  for (const auto& h : a.hits) {
    auto& slot = open_[index_of(h.category)];
    if (slot && (a.date - slot->end_date - 1) <= gap_) {
      extend(*slot, h, a.date);
      continue;
    }
    close(h.category);
    slot = open_event(h.category, h, a.date);
  }
}

std::vector<Event> CategoryRunMerger::finish() {
  for (Category c : kAllCategories) close(c);
  std::vector<Event> out = std::move(closed_);
  closed_.clear();
  std::stable_sort(out.begin(), out.end(), event_less);
  return out;
}

std::vector<Event> merge_category_runs(const std::vector<DailyAlert>& gated, int merge_gap_days) {
  CategoryRunMerger m(merge_gap_days);
  for (const auto& a : gated) m.push(a);
  return m.finish();
}

// ----------------------------- Pass 2 ----------------------------------------

std::vector<Event> merge_composites(std::vector<Event> events, int merge_gap_days) {
  CROPWATCH_ENSURE(merge_gap_days >= 0, ErrorCode::kConfig, "merge.merge_gap_days must be >= 0");
  for (const auto& e : events) validate_event(e);

  std::stable_sort(events.begin(), events.end(), event_less);

  std::vector<Event> out;
  std::vector<Event> group;
  CivilDate group_end{};

  auto flush = [&]() {
    if (group.empty()) return;
    if (group.size() == 1) {
      out.push_back(std::move(group.front()));
    } else {
      out.push_back(fold_group(group));
    }
    group.clear();
  };

  for (auto& e : events) {
    if (!group.empty() && (e.start_date - group_end - 1) <= merge_gap_days) {
      group_end = std::max(group_end, e.end_date);
      group.push_back(std::move(e));
      continue;
    }
    flush();
    group_end = e.end_date;
    group.push_back(std::move(e));
  }
  flush();

  return out;
}

std::vector<Event> merge_events(const std::vector<DailyAlert>& gated, const MergeConfig& cfg) {
  cfg.validate();
  return merge_composites(merge_category_runs(gated, cfg.merge_gap_days), cfg.merge_gap_days);
}

std::vector<Event> merge_events(const std::vector<Event>& events, const MergeConfig& cfg) {
  cfg.validate();
  return merge_composites(events, cfg.merge_gap_days);
}

} // namespace cropwatch::alerts
