/*
  Fragment 2.15 — Event Severity Selftest

  Objective
  ---------
  Check the severity score against hand-computed runs:
    1) Exceedance is measured past the loosest trigger threshold, per variable.
    2) Depth is normalised within (category, variable), so a tmin_7d event
       does not compete with a tmean_7d one.
    3) Level cut points are inclusive: 0.4 is minor, 0.7 is moderate.
    4) attach_severity writes score and level into every event.

  Expected use
  ------------
      ./event_severity_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/alerts/event_severity.hpp"

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

void expect_near(double a, double b, std::string_view msg) {
  if (!(std::fabs(a - b) < 1e-9)) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

CivilDate june(int day) { return CivilDate::from_ymd(2024, 6, day); }

// Single-category event with the given member days and one peak.
Event make_event(Category c, MetricVariable v, double peak, std::vector<int> days) {
  Event e{};
  e.categories = {c};
  e.start_date = june(days.front());
  e.end_date = june(days.back());
  e.duration_days = (e.end_date - e.start_date) + 1;
  for (int d : days) e.member_dates.push_back(june(d));
  e.peak_metric = peak;
  e.peak_date = e.start_date;
  e.peak_variable = v;
  e.peaks = {CategoryPeak{c, peak, e.start_date, v}};
  return e;
}

void test_exceedance() {
  const RuleThresholds thr{};

  expect_near(trigger_threshold(Category::Drought, MetricVariable::Ndmi, thr), 0.25,
              "drought NDMI measured from the soft threshold");
  expect_near(trigger_threshold(Category::Drought, MetricVariable::Msi, thr), 0.8,
              "drought MSI measured from the soft threshold");

  RuleThresholds strong_only = thr;
  strong_only.drought.ndmi_soft = kUnset;
  expect_near(trigger_threshold(Category::Drought, MetricVariable::Ndmi, strong_only), 0.15,
              "null soft threshold falls back to the strong one");

  expect_near(peak_exceedance(CategoryPeak{Category::Drought, 0.10, june(1), MetricVariable::Ndmi}, thr), 0.15,
              "NDMI 0.10 is 0.15 below 0.25");
  expect_near(peak_exceedance(CategoryPeak{Category::Drought, 1.9, june(1), MetricVariable::Msi}, thr), 1.1,
              "MSI 1.9 is 1.1 above 0.8");
  expect_near(peak_exceedance(CategoryPeak{Category::ColdStress, -3.0, june(1), MetricVariable::Tmin7d}, thr), 3.0,
              "tmin_7d -3 is 3 below 0");
  expect_near(peak_exceedance(CategoryPeak{Category::Waterlogging, 80.0, june(1), MetricVariable::Precip1d}, thr), 0.0,
              "unset precip_high_1d gives no exceedance");
  expect_near(peak_exceedance(CategoryPeak{Category::HeatStress, kUnset, june(1), MetricVariable::Tmean7d}, thr), 0.0,
              "unset peak gives no exceedance");
}

void test_levels() {
  expect_true(classify_severity(0.0) == SeverityLevel::Minor, "0 is minor");
  expect_true(classify_severity(0.4) == SeverityLevel::Minor, "0.4 is minor");
  expect_true(classify_severity(0.401) == SeverityLevel::Moderate, "0.401 is moderate");
  expect_true(classify_severity(0.7) == SeverityLevel::Moderate, "0.7 is moderate");
  expect_true(classify_severity(0.701) == SeverityLevel::Major, "0.701 is major");
  expect_true(std::string(severity_level_name(SeverityLevel::Moderate)) == "moderate", "level name");
}

void test_run_scores() {
  const RuleThresholds thr{};

  // a: NDMI 0.10 (exceedance 0.15), 4-day span with 3 members
  // b: NDMI 0.20 (exceedance 0.05), 2 days
  // c: tmin_7d -3 (its own scale), 1 day
  std::vector<Event> events = {
      make_event(Category::Drought, MetricVariable::Ndmi, 0.10, {1, 2, 4}),
      make_event(Category::Drought, MetricVariable::Ndmi, 0.20, {10, 11}),
      make_event(Category::ColdStress, MetricVariable::Tmin7d, -3.0, {20}),
  };

  const std::vector<SeverityParts> parts = score_events(events, thr);
  expect_true(parts.size() == 3, "one score per event");
  if (parts.size() != 3) return;

  expect_near(parts[0].depth, 1.0, "deepest NDMI event has depth 1");
  expect_near(parts[1].depth, 0.05 / 0.15, "shallower NDMI event scaled against the deepest");
  expect_near(parts[2].depth, 1.0, "tmin_7d event normalised on its own");
  expect_near(parts[0].density, 0.75, "three members over four days");

  // 0.4*1 + 0.3*1 + 0.2*1 + 0.1*0.75
  expect_near(parts[0].score, 0.975, "event a score");
  expect_true(parts[0].level == SeverityLevel::Major, "event a is major");
  // 0.4/3 + 0.3*0.5 + 0.2*(2/3)/3 + 0.1
  expect_near(parts[1].score, 0.428, "event b score rounded to 3 decimals");
  expect_true(parts[1].level == SeverityLevel::Moderate, "event b is moderate");
  // 0.4 + 0.3*0.25 + 0.2/3 + 0.1
  expect_near(parts[2].score, 0.642, "event c score");

  attach_severity(events, thr);
  expect_near(events[1].severity_score, 0.428, "attach writes the score");
  expect_true(events[1].severity_level == SeverityLevel::Moderate, "attach writes the level");

  std::vector<Event> none;
  attach_severity(none, thr);
  expect_true(none.empty(), "empty run scores nothing");
}

void test_composite_depth() {
  const RuleThresholds thr{};

  Event composite = make_event(Category::Drought, MetricVariable::Ndmi, 0.20, {1, 2});
  composite.composite = true;
  composite.categories = {Category::Drought, Category::ColdStress};
  composite.peak_metric = kUnset;
  composite.peak_variable = MetricVariable::None;
  composite.peaks.push_back(CategoryPeak{Category::ColdStress, 2.0, june(2), MetricVariable::Tmean7d});

  Event deeper = make_event(Category::Drought, MetricVariable::Ndmi, 0.05, {10, 11});

  const std::vector<SeverityParts> parts = score_events({composite, deeper}, thr);
  expect_true(parts.size() == 2, "two scores");
  if (parts.size() == 2) {
    expect_near(parts[0].depth, 1.0, "composite depth is its deepest member peak");
    expect_near(parts[1].depth, 1.0, "standalone drought is the deepest NDMI event");
  }
}

}  // namespace
}  // namespace cropwatch::alerts

int main() {
  using namespace cropwatch::alerts;

  test_exceedance();
  test_levels();
  test_run_scores();
  test_composite_depth();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
