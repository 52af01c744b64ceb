/*
  Fragment 2.10 — Support / QC / Gating Selftest

  Objective
  ---------
  Framework-free selftest for the per-day stages ahead of the rules:
    1) Support window lookup (past_only vs symmetric, tie -> earlier date).
    2) QC priority: no_remote_sensing > stale > low_canopy_confidence > ok.
    3) Gating modes and the cumulative canopy counter.
    4) Ordering violations raise ErrorCode::kOrdering.

  Expected use
  ------------
      ./support_qc_selftest
  Non-zero return code indicates failure.
*/

#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "engine/alerts/gating.hpp"
#include "engine/alerts/qc_classifier.hpp"
#include "engine/alerts/support_window.hpp"
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

void expect_skip(SkipReason got, SkipReason exp, std::string_view msg) {
  if (got != exp) {
    fail(msg);
    std::cerr << "  got: " << skip_reason_name(got) << ", expected: " << skip_reason_name(exp) << "\n";
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

CivilDate may(int day) { return CivilDate::from_ymd(2024, 5, day); }

// 2024-05-01 .. 2024-05-20, satellite passes on the 1st and the 7th.
std::vector<DailyRecord> make_series() {
  std::vector<DailyRecord> out;
  for (int d = 1; d <= 20; ++d) {
    DailyRecord r{};
    r.date = may(d);
    r.tmean_7d = 15.0;
    if (d == 1) {
      r.indices.ndvi = 0.55;
      r.indices.ndmi = 0.30;
    }
    if (d == 7) {
      r.indices.ndvi = 0.60;
      r.indices.ndmi = 0.32;
    }
    out.push_back(r);
  }
  return out;
}

void test_past_only_window() {
  SupportConfig cfg{};
  cfg.mode = WindowMode::PastOnly;
  cfg.window_half_days = 5;
  const SupportWindowResolver res(make_series(), cfg);

  expect_eq_int(static_cast<int>(res.observations().size()), 2, "two index observations collected");

  const SupportStatus s6 = res.resolve(may(6));
  expect_true(s6.rs_support && s6.support_date == may(1), "past_only: 05-06 supported by 05-01");
  expect_eq_int(s6.rs_age, 5, "past_only: age 5 at the window edge");

  const SupportStatus s7 = res.resolve(may(7));
  expect_true(s7.rs_support && s7.rs_age == 0 && s7.support.ndvi == 0.60, "past_only: same-day pass has age 0");

  const SupportStatus s13 = res.resolve(may(13));
  expect_true(!s13.rs_support, "past_only: 6 days after the last pass is unsupported");
  expect_eq_int(s13.rs_age, -1, "unsupported day carries rs_age -1");

  const SupportStatus early = res.resolve(CivilDate::from_ymd(2024, 4, 30));
  expect_true(!early.rs_support, "past_only: future pass never supports an earlier day");
}

void test_symmetric_window() {
  SupportConfig cfg{};
  cfg.mode = WindowMode::Symmetric;
  cfg.window_half_days = 3;
  const SupportWindowResolver res(make_series(), cfg);

  const SupportStatus tie = res.resolve(may(4));
  expect_true(tie.rs_support && tie.support_date == may(1), "symmetric: equal distance picks the earlier pass");
  expect_eq_int(tie.rs_age, 3, "symmetric: tie age");

  const SupportStatus fwd = res.resolve(may(5));
  expect_true(fwd.rs_support && fwd.support_date == may(7), "symmetric: closer future pass wins");
  expect_eq_int(fwd.rs_age, 2, "symmetric: age counts forward distance");

  const SupportStatus before = res.resolve(CivilDate::from_ymd(2024, 4, 29));
  expect_true(before.rs_support && before.support_date == may(1), "symmetric: pass ahead of the series start");
}

void test_rule_view() {
  SupportConfig cfg{};
  const auto series = make_series();
  const SupportWindowResolver res(series, cfg);
  const DailyRecord& rec = series[2];  // 05-03, no own pass
  const SupportStatus st = res.resolve(rec.date);

  const DailyRecord nearest = rule_view(rec, st, SupportPick::Nearest);
  expect_true(nearest.indices.ndmi == 0.30, "nearest pick borrows the support pass indices");
  expect_true(nearest.tmean_7d == 15.0, "weather fields stay the record's own");

  const DailyRecord same = rule_view(rec, st, SupportPick::SameDay);
  expect_true(!is_set(same.indices.ndmi), "same_day pick keeps the day's (missing) indices");
}

void test_ordering_errors() {
  auto dup = make_series();
  dup[5].date = dup[4].date;
  expect_error([&] { require_strictly_ascending(dup); }, ErrorCode::kOrdering, "duplicate date rejected");

  auto back = make_series();
  std::swap(back[2], back[3]);
  expect_error([&] { SupportWindowResolver r(back, SupportConfig{}); }, ErrorCode::kOrdering,
               "resolver rejects non-monotonic series");

  SupportConfig bad{};
  bad.window_half_days = -1;
  expect_error([&] { SupportWindowResolver r(make_series(), bad); }, ErrorCode::kConfig,
               "negative window rejected");
}

void test_qc_priority() {
  SupportConfig sup{};
  sup.max_age_days = 5;
  CanopyConfig canopy{};

  SupportStatus none{};
  expect_skip(classify_qc(none, sup, canopy).skip_reason, SkipReason::NoRemoteSensing, "no support -> no_remote_sensing");

  SupportStatus stale{};
  stale.rs_support = true;
  stale.rs_age = 6;
  stale.support.ndvi = 0.10;  // would also fail canopy; staleness reported first
  expect_skip(classify_qc(stale, sup, canopy).skip_reason, SkipReason::Stale, "age above max -> stale");

  SupportStatus sparse{};
  sparse.rs_support = true;
  sparse.rs_age = 2;
  sparse.support.ndvi = 0.30;
  sparse.support.evi = 0.10;
  const QCResult low = classify_qc(sparse, sup, canopy);
  expect_skip(low.skip_reason, SkipReason::LowCanopyConfidence, "sparse canopy -> low_canopy_confidence");
  expect_true(!low.canopy_ready, "low canopy is not canopy_ready");

  SupportStatus edge{};
  edge.rs_support = true;
  edge.rs_age = 5;
  edge.support.ndvi = 0.35;
  const QCResult ok = classify_qc(edge, sup, canopy);
  expect_skip(ok.skip_reason, SkipReason::Ok, "NDVI at threshold and age at max -> ok");
  expect_true(ok.canopy_ready, "ok day is canopy_ready");

  IndexValues evi_only{};
  evi_only.evi = 0.20;
  expect_true(canopy_reliable(evi_only, canopy), "EVI alone at threshold is reliable");

  CanopyConfig ndvi_only{};
  ndvi_only.evi_min = kUnset;
  expect_true(!canopy_reliable(evi_only, ndvi_only), "disabled EVI alternative is ignored");
}

QCResult ready() {
  QCResult q{};
  q.skip_reason = SkipReason::Ok;
  q.canopy_ready = true;
  return q;
}

QCResult not_ready() { return QCResult{}; }

void test_gating_modes() {
  GatingConfig cfg{};
  cfg.mode = GatingMode::Both;
  cfg.canopy_obs_min = 3;

  GatingState both(cfg);
  const GatingDecision g1 = both.step(may(1), ready());
  const GatingDecision g2 = both.step(may(2), not_ready());
  const GatingDecision g3 = both.step(may(3), ready());
  const GatingDecision g4 = both.step(may(4), ready());
  expect_true(!g1.gating_ok && g1.canopy_obs_count == 1, "both: one canopy day is not enough");
  expect_eq_int(g2.canopy_obs_count, 1, "non-ready day does not count");
  expect_true(!g3.gating_ok, "both: two canopy days is not enough");
  expect_true(g4.gating_ok && g4.in_season && g4.canopy_obs_count == 3, "both: third canopy day in season opens");

  cfg.mode = GatingMode::CanopyObs;
  cfg.canopy_obs_min = 1;
  GatingState canopy(cfg);
  expect_true(canopy.step(CivilDate::from_ymd(2024, 2, 1), ready()).gating_ok, "canopy_obs ignores the month");

  cfg.mode = GatingMode::MonthWindow;
  GatingState month(cfg);
  expect_true(!month.step(CivilDate::from_ymd(2024, 3, 31), ready()).gating_ok, "month_window: March closed");
  expect_true(month.step(CivilDate::from_ymd(2024, 4, 1), not_ready()).gating_ok, "month_window: April open");

  cfg.mode = GatingMode::Off;
  GatingState off(cfg);
  expect_true(off.step(CivilDate::from_ymd(2024, 1, 1), not_ready()).gating_ok, "off: always open");
}

void test_gating_reset_and_order() {
  GatingConfig cfg{};
  cfg.mode = GatingMode::CanopyObs;
  cfg.canopy_obs_min = 2;
  cfg.reset_at_season_start = true;

  GatingState g(cfg);
  g.step(CivilDate::from_ymd(2024, 3, 30), ready());
  const GatingDecision pre = g.step(CivilDate::from_ymd(2024, 3, 31), ready());
  expect_true(pre.gating_ok, "pre-season counter reaches the minimum");
  const GatingDecision first = g.step(CivilDate::from_ymd(2024, 4, 1), ready());
  expect_eq_int(first.canopy_obs_count, 1, "counter resets at the first in-season date");
  expect_true(!first.gating_ok, "reset counter closes the gate again");

  cfg.reset_at_season_start = false;
  GatingState keep(cfg);
  keep.step(CivilDate::from_ymd(2024, 3, 31), ready());
  expect_eq_int(keep.step(CivilDate::from_ymd(2024, 4, 1), ready()).canopy_obs_count, 2,
                "without reset the counter is cumulative");

  expect_error([&] { keep.step(CivilDate::from_ymd(2024, 4, 1), ready()); }, ErrorCode::kOrdering,
               "gating rejects a repeated date");

  GatingConfig bad{};
  bad.season_months = {0, 13};
  expect_error([&] { GatingState s(bad); }, ErrorCode::kConfig, "out-of-range season month rejected");
}

}  // namespace
}  // namespace cropwatch::alerts

int main() {
  using namespace cropwatch::alerts;

  test_past_only_window();
  test_symmetric_window();
  test_rule_view();
  test_ordering_errors();
  test_qc_priority();
  test_gating_modes();
  test_gating_reset_and_order();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
