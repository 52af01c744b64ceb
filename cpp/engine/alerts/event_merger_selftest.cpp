/*
  Fragment 2.12 — Event Merger Selftest

  Objective
  ---------
  Validate both merge passes:
    1) Same-category runs join across at most merge_gap_days missing days.
    2) Overlapping runs of different categories fold into one composite.
    3) Merging an already merged list is a no-op.
    4) A wider gap never yields more events, nor fewer covered days.
    5) Dropping one category's alerts leaves no composite behind.
    6) Duplicate / out-of-order input raises ErrorCode::kOrdering.

  Expected use
  ------------
      ./event_merger_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/alerts/event_merger.hpp"
#include "engine/core/error.hpp"

namespace cropwatch::alerts {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

void expect_eq_int(int a, int b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

template <class Fn>
void expect_error(Fn&& fn, ErrorCode code, std::string_view msg) {
  try {
    fn();
    fail(msg);
    std::cerr << "  no exception thrown\n";
  } catch (const Error& e) {
    if (e.code() != code) {
      fail(msg);
      std::cerr << "  wrong code: " << e.what() << "\n";
    } else {
      pass(msg);
    }
  }
}

CivilDate june(int day) { return CivilDate::from_ymd(2024, 6, day); }

struct Hit {
  Category category;
  double metric;
  const char* reason;
};

MetricVariable primary_variable(Category c) {
  switch (c) {
    case Category::Drought:        return MetricVariable::Ndmi;
    case Category::ColdStress:     return MetricVariable::Tmean7d;
    case Category::HeatStress:     return MetricVariable::Tmean7d;
    case Category::NutrientOrPest: return MetricVariable::Ndre;
    default:                       return MetricVariable::Precip7d;
  }
}

DailyAlert alert(int day, std::initializer_list<Hit> hits) {
  DailyAlert a{};
  a.date = june(day);
  for (const auto& h : hits) {
    a.hits.push_back(CategoryHit{h.category, h.reason, h.metric, primary_variable(h.category)});
  }
  return a;
}

std::vector<Event> merge(const std::vector<DailyAlert>& alerts, int gap) {
  MergeConfig cfg{};
  cfg.merge_gap_days = gap;
  return merge_events(alerts, cfg);
}

bool same_events(const std::vector<Event>& a, const std::vector<Event>& b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    const Event& x = a[i];
    const Event& y = b[i];
    if (x.composite != y.composite || x.categories != y.categories) return false;
    if (x.start_date != y.start_date || x.end_date != y.end_date || x.duration_days != y.duration_days) return false;
    if (x.reason_union != y.reason_union || x.member_dates != y.member_dates) return false;
    if (x.peaks.size() != y.peaks.size()) return false;
    const bool both_unset = std::isnan(x.peak_metric) && std::isnan(y.peak_metric);
    if (!both_unset && x.peak_metric != y.peak_metric) return false;
  }
  return true;
}

void test_consecutive_run() {
  const std::vector<DailyAlert> alerts = {
      alert(1, {{Category::Drought, 0.20, "NDMI=0.200<0.25"}}),
      alert(2, {{Category::Drought, 0.10, "NDMI=0.100<strong 0.15"}}),
      alert(3, {{Category::Drought, 0.15, "NDMI=0.150<0.25"}}),
  };
  const auto ev = merge(alerts, 0);
  expect_eq_int(static_cast<int>(ev.size()), 1, "gap 0: three consecutive days form one event");
  if (ev.size() != 1) return;

  const Event& e = ev.front();
  expect_eq_int(e.duration_days, 3, "gap 0: duration counts every day");
  expect_true(e.start_date == june(1) && e.end_date == june(3), "gap 0: span 06-01..06-03");
  expect_eq_str(e.event_type(), "drought", "single-category event type is the category name");
  expect_true(e.peak_metric == 0.10 && e.peak_date == june(2), "drought peak is the lowest NDMI");
  expect_eq_int(static_cast<int>(e.reason_union.size()), 3, "distinct reasons kept in order");
  expect_eq_int(static_cast<int>(e.member_dates.size()), 3, "member dates listed");
}

void test_gap_tolerance() {
  const std::vector<DailyAlert> alerts = {
      alert(1, {{Category::HeatStress, 31.0, "tmean_7d=31.0C>30C"}}),
      alert(2, {{Category::HeatStress, 33.0, "tmean_7d=33.0C>30C"}}),
      alert(4, {{Category::HeatStress, 32.0, "tmean_7d=32.0C>30C"}}),
  };
  expect_eq_int(static_cast<int>(merge(alerts, 0).size()), 2, "gap 0: one missing day splits the run");

  const auto joined = merge(alerts, 1);
  expect_eq_int(static_cast<int>(joined.size()), 1, "gap 1: one missing day is bridged");
  if (joined.size() == 1) {
    expect_eq_int(joined.front().duration_days, 4, "bridged event spans the missing day");
    expect_eq_int(static_cast<int>(joined.front().member_dates.size()), 3, "bridged day is not a member");
    expect_true(joined.front().peak_metric == 33.0, "heat peak is the highest tmean");
  }
}

void test_composite_fold() {
  const std::vector<DailyAlert> alerts = {
      alert(10, {{Category::Drought, 0.18, "NDMI=0.180<0.25; precip_7d=2.0mm<20mm"}}),
      alert(11, {{Category::Drought, 0.17, "NDMI=0.170<0.25; precip_7d=1.0mm<20mm"},
                 {Category::ColdStress, 3.1, "tmean_7d=3.1C<5C; RH=88%>75%"}}),
      alert(12, {{Category::Drought, 0.19, "NDMI=0.190<0.25; precip_7d=1.0mm<20mm"},
                 {Category::ColdStress, 2.5, "tmean_7d=2.5C<5C; RH=90%>75%"}}),
      alert(13, {{Category::ColdStress, 4.0, "tmean_7d=4.0C<5C; RH=80%>75%"}}),
  };
  const auto ev = merge(alerts, 0);
  expect_eq_int(static_cast<int>(ev.size()), 1, "overlapping categories fold into one event");

  std::vector<DailyAlert> drought_only;
  for (const auto& a : alerts) {
    DailyAlert kept{};
    kept.date = a.date;
    for (const auto& h : a.hits) {
      if (h.category != Category::ColdStress) kept.hits.push_back(h);
    }
    if (!kept.hits.empty()) drought_only.push_back(kept);
  }
  const auto single = merge(drought_only, 0);
  expect_eq_int(static_cast<int>(single.size()), 1, "without cold hits one event remains");
  if (single.size() == 1) {
    expect_true(!single.front().composite, "removing a member category removes the composite");
    expect_eq_str(single.front().event_type(), "drought", "remaining event is drought");
    expect_true(single.front().start_date == june(10) && single.front().end_date == june(12),
                "drought-only span 06-10..06-12");
    expect_true(single.front().peak_metric == 0.17 && single.front().peak_date == june(11),
                "drought-only peak");
    expect_true(single.front().reason_union.front().rfind("NDMI=", 0) == 0, "no category prefix without a composite");
  }
  if (ev.size() != 1) return;

  const Event& e = ev.front();
  expect_true(e.composite, "folded event is composite");
  expect_eq_str(e.event_type(), "composite", "composite event type");
  expect_eq_str(e.categories_label(), "drought+cold_stress", "both categories named in declaration order");
  expect_true(e.start_date == june(10) && e.end_date == june(13), "composite span 06-10..06-13");
  expect_eq_int(e.duration_days, 4, "composite duration");
  expect_true(std::isnan(e.peak_metric), "composite has no single peak metric");
  expect_eq_int(static_cast<int>(e.peaks.size()), 2, "per-category peaks kept");
  if (e.peaks.size() == 2) {
    expect_true(e.peaks[0].value == 0.17 && e.peaks[0].date == june(11), "drought peak inside composite");
    expect_true(e.peaks[1].value == 2.5 && e.peaks[1].date == june(12), "cold peak inside composite");
  }
  expect_true(!e.reason_union.empty() && e.reason_union.front().rfind("drought: ", 0) == 0,
              "composite reasons carry the category prefix");
  expect_eq_int(static_cast<int>(e.member_dates.size()), 4, "member dates are the union");
}

void test_separate_categories_stay_apart() {
  const std::vector<DailyAlert> alerts = {
      alert(1, {{Category::Waterlogging, 55.0, "precip_7d=55.0mm>40mm"}}),
      alert(9, {{Category::NutrientOrPest, 0.18, "NDRE=0.180<strong 0.2"}}),
  };
  const auto ev = merge(alerts, 2);
  expect_eq_int(static_cast<int>(ev.size()), 2, "distant events of different categories stay separate");
  if (ev.size() == 2) {
    expect_true(!ev[0].composite && !ev[1].composite, "both remain single-category");
    expect_true(ev[0].start_date < ev[1].start_date, "events ordered by start date");
  }
}

void test_idempotence_and_monotonicity() {
  std::vector<DailyAlert> alerts;
  const int days[] = {1, 2, 4, 7, 8, 12, 13, 14, 20};
  for (int d : days) {
    alerts.push_back(alert(d, {{Category::Drought, 0.2, "NDMI=0.200<0.25"}}));
  }
  alerts.push_back(alert(21, {{Category::ColdStress, 3.0, "tmean_7d=3.0C<5C"}}));

  int prev = 1 << 30;
  int prev_members = 0;
  int prev_span = 0;
  bool monotone = true;
  bool coverage_monotone = true;
  bool idempotent = true;
  for (int gap = 0; gap <= 6; ++gap) {
    MergeConfig cfg{};
    cfg.merge_gap_days = gap;
    const auto once = merge_events(alerts, cfg);
    const auto twice = merge_events(once, cfg);
    if (!same_events(once, twice)) idempotent = false;
    if (static_cast<int>(once.size()) > prev) monotone = false;
    prev = static_cast<int>(once.size());

    int members = 0;
    int span = 0;
    for (const auto& e : once) {
      validate_event(e);
      members += static_cast<int>(e.member_dates.size());
      span += e.duration_days;
    }
    if (members < prev_members || span < prev_span) coverage_monotone = false;
    prev_members = members;
    prev_span = span;
  }
  expect_true(idempotent, "re-merging merged events changes nothing");
  expect_true(monotone, "wider gap never produces more events");
  expect_true(coverage_monotone, "wider gap never covers fewer member or spanned days");
  expect_eq_int(prev_members, 10, "every alert date stays covered");
}

void test_ordering_errors() {
  CategoryRunMerger m(0);
  m.push(alert(5, {{Category::Drought, 0.2, "x"}}));
  expect_error([&] { m.push(alert(5, {{Category::ColdStress, 3.0, "y"}})); }, ErrorCode::kOrdering,
               "duplicate alert date rejected");
  expect_error([&] { m.push(alert(4, {{Category::Drought, 0.2, "x"}})); }, ErrorCode::kOrdering,
               "non-monotonic alert date rejected");

  expect_error([] { CategoryRunMerger bad(-1); }, ErrorCode::kConfig, "negative merge gap rejected");

  Event broken{};
  broken.categories = {Category::Drought};
  broken.start_date = june(5);
  broken.end_date = june(3);
  broken.duration_days = 1;
  expect_error([&] { validate_event(broken); }, ErrorCode::kOrdering, "event ending before it starts rejected");
  expect_error([&] { merge_composites({broken}, 0); }, ErrorCode::kOrdering, "composite pass validates its input");
}

}  // namespace
}  // namespace cropwatch::alerts

int main() {
  using namespace cropwatch::alerts;

  test_consecutive_run();
  test_gap_tolerance();
  test_composite_fold();
  test_separate_categories_stay_apart();
  test_idempotence_and_monotonicity();
  test_ordering_errors();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
