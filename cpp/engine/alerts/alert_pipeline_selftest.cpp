/*
  Fragment 2.13 — Alert Pipeline Selftest

  Objective
  ---------
  Drive the whole chain over a synthetic season (2024-04-01 .. 2024-06-30,
  satellite pass every 5 days until mid-June) and check:
    1) Every gated alert is also a raw alert.
    2) Raw alerts appear only on QC-ok days unless the category is
       index-independent.
    3) A cold spell with no remote-sensing support is suppressed.
    4) Stage counters and merged events match the constructed spells.
    5) Events carry their peak variable and a severity score.

  Expected use
  ------------
      ./alert_pipeline_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "engine/alerts/alert_pipeline.hpp"
#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"

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

CivilDate ymd(int m, int d) { return CivilDate::from_ymd(2024, m, d); }

bool within(CivilDate d, CivilDate a, CivilDate b) { return a <= d && d <= b; }

std::vector<DailyRecord> make_season() {
  const CivilDate first = ymd(4, 1);
  const CivilDate last = ymd(6, 30);
  const CivilDate last_pass = ymd(6, 15);

  std::vector<DailyRecord> out;
  for (CivilDate d = first; d <= last; d = d.plus_days(1)) {
    DailyRecord r{};
    r.date = d;
    r.tmean_7d = 15.0;
    r.tmin_7d = 8.0;
    r.tmax_7d = 22.0;
    r.precip_7d = 30.0;
    r.precip_1d = 2.0;
    r.rh_mean = 60.0;

    if (d <= last_pass && (d - first) % 5 == 0) {
      r.indices.ndvi = 0.60;
      r.indices.evi = 0.40;
      r.indices.ndmi = 0.35;
    }

    // Dry spell: one low-moisture pass, then four days borrowing it.
    if (d == ymd(5, 11)) r.indices.ndmi = 0.175;
    if (within(d, ymd(5, 11), ymd(5, 15))) r.precip_7d = 1.8;

    // Supported cold spell.
    if (within(d, ymd(6, 10), ymd(6, 12))) {
      r.tmean_7d = 3.1;
      r.rh_mean = 88.0;
    }
    // Cold spell after the passes stop.
    if (within(d, ymd(6, 22), ymd(6, 24))) {
      r.tmean_7d = 3.1;
      r.rh_mean = 88.0;
    }
    out.push_back(r);
  }
  return out;
}

AlertConfig make_config() {
  AlertConfig cfg{};
  cfg.period.data = DateRange{ymd(4, 1), ymd(6, 30)};
  cfg.period.report = DateRange{ymd(5, 1), ymd(6, 30)};
  cfg.merge.merge_gap_days = 2;
  return cfg;
}

const DayResult* find_day(const PipelineResult& res, CivilDate d) {
  for (const auto& day : res.days) {
    if (day.record.date == d) return &day;
  }
  return nullptr;
}

const DailyAlert* find_alert(const std::vector<DailyAlert>& rows, CivilDate d) {
  for (const auto& a : rows) {
    if (a.date == d) return &a;
  }
  return nullptr;
}

void check_stage_invariants(const PipelineResult& res, const AlertConfig& cfg, std::string_view tag) {
  bool gated_subset = true;
  for (const auto& g : res.gated) {
    const DailyAlert* r = find_alert(res.raw, g.date);
    if (!r) {
      gated_subset = false;
      continue;
    }
    for (const auto& h : g.hits) {
      if (!r->has(h.category)) gated_subset = false;
    }
  }
  expect_true(gated_subset, std::string(tag) + ": every gated hit is a raw hit");

  bool raw_qc = true;
  for (const auto& a : res.raw) {
    const DayResult* day = find_day(res, a.date);
    if (!day) {
      raw_qc = false;
      continue;
    }
    for (const auto& h : a.hits) {
      if (!day->rules[index_of(h.category)].triggered) raw_qc = false;
      if (!day->qc.ok() && !cfg.rules.index_independent(h.category)) raw_qc = false;
    }
  }
  expect_true(raw_qc, std::string(tag) + ": raw hits need a fired rule and QC ok (or index independence)");

  bool ascending = true;
  for (std::size_t i = 1; i < res.days.size(); ++i) {
    if (!(res.days[i - 1].record.date < res.days[i].record.date)) ascending = false;
  }
  expect_true(ascending, std::string(tag) + ": day results ascend");
}

void test_default_run() {
  const AlertConfig cfg = make_config();
  const PipelineResult res = run_alert_pipeline(make_season(), cfg);

  expect_eq_int(static_cast<int>(res.days.size()), 61, "report window has 61 days");
  expect_eq_int(res.summary.data_days, 91, "data window scanned 91 days");
  check_stage_invariants(res, cfg, "default");

  expect_eq_int(static_cast<int>(res.raw.size()), 8, "raw: five drought days + three cold days");
  expect_eq_int(static_cast<int>(res.gated.size()), 8, "gated: gating open all report window");

  const DayResult* orphan = find_day(res, ymd(6, 22));
  expect_true(orphan != nullptr && orphan->rules[index_of(Category::ColdStress)].triggered,
              "unsupported cold day still fires its rule");
  expect_true(orphan != nullptr && orphan->qc.skip_reason == SkipReason::NoRemoteSensing,
              "unsupported cold day is no_remote_sensing");
  expect_true(find_alert(res.raw, ymd(6, 22)) == nullptr, "no_remote_sensing suppresses the raw alert");

  const DayResult* edge = find_day(res, ymd(6, 20));
  expect_true(edge != nullptr && edge->qc.ok() && edge->support.rs_age == 5, "age 5 support still passes QC");

  expect_eq_int(res.summary.skip_counts[static_cast<std::size_t>(SkipReason::NoRemoteSensing)], 10,
                "ten trailing days without support");
  expect_eq_int(res.summary.qc_ok_days, 51, "qc ok days");

  expect_eq_int(static_cast<int>(res.events.size()), 2, "two merged events");
  if (res.events.size() == 2) {
    const Event& dry = res.events[0];
    expect_eq_str(dry.event_type(), "drought", "first event is drought");
    expect_true(dry.start_date == ymd(5, 11) && dry.end_date == ymd(5, 15), "drought spans 05-11..05-15");
    expect_true(!dry.reason_union.empty() && dry.reason_union.front() == "NDMI=0.175<0.25; precip_7d=1.8mm<20mm",
                "drought reason from the borrowed pass");
    expect_true(dry.peak_variable == MetricVariable::Ndmi && dry.peak_metric == 0.175, "drought peak is NDMI");
    expect_true(std::fabs(dry.severity_score - 1.0) < 1e-9 && dry.severity_level == SeverityLevel::Major,
                "longest, deepest event scores 1.0");

    const Event& cold = res.events[1];
    expect_eq_str(cold.event_type(), "cold_stress", "second event is cold stress");
    expect_eq_int(cold.duration_days, 3, "cold spell lasts three days");
    expect_true(!cold.reason_union.empty() && cold.reason_union.front() == "tmean_7d=3.1C<5C; RH=88%>75%",
                "cold reason");
    expect_true(cold.peak_variable == MetricVariable::Tmean7d, "cold peak is tmean_7d");
    // depth 1, duration 3/5, area 3/5, density 1
    expect_true(std::fabs(cold.severity_score - 0.8) < 1e-9 && cold.severity_level == SeverityLevel::Major,
                "shorter cold event scores 0.8");
  }
  expect_eq_int(res.summary.severity_events[static_cast<std::size_t>(SeverityLevel::Major)], 2,
                "summary counts major events");
  expect_eq_int(res.summary.events_total, static_cast<int>(res.events.size()), "summary counts events");
}

void test_index_independent_cold() {
  AlertConfig cfg = make_config();
  cfg.rules.cold.index_independent = true;
  const PipelineResult res = run_alert_pipeline(make_season(), cfg);
  check_stage_invariants(res, cfg, "weather-only cold");

  expect_true(find_alert(res.raw, ymd(6, 23)) != nullptr, "index-independent cold survives missing support");
  expect_eq_int(static_cast<int>(res.events.size()), 3, "unsupported cold spell becomes its own event");
}

void test_gating_suppression() {
  AlertConfig cfg = make_config();
  cfg.gating.canopy_obs_min = 1000;
  const PipelineResult res = run_alert_pipeline(make_season(), cfg);
  check_stage_invariants(res, cfg, "closed gate");

  expect_eq_int(static_cast<int>(res.raw.size()), 8, "raw alerts ignore gating");
  expect_eq_int(static_cast<int>(res.gated.size()), 0, "closed gate removes every gated alert");
  expect_eq_int(static_cast<int>(res.events.size()), 0, "no events without gated alerts");
  expect_eq_int(res.summary.allow_alert_days, 0, "no day allowed to alert");
}

void test_input_errors() {
  auto rows = make_season();
  std::swap(rows[10], rows[11]);
  expect_error([&] { run_alert_pipeline(rows, make_config()); }, ErrorCode::kOrdering,
               "pipeline rejects out-of-order rows");

  AlertConfig bad = make_config();
  bad.period.report = DateRange{ymd(3, 1), ymd(6, 30)};
  expect_error([&] { run_alert_pipeline(make_season(), bad); }, ErrorCode::kConfig,
               "report window outside data window rejected");

  AlertConfig narrow = make_config();
  narrow.period.data = DateRange{ymd(7, 1), ymd(7, 31)};
  narrow.period.report = narrow.period.data;
  const PipelineResult empty = run_alert_pipeline(make_season(), narrow);
  expect_true(empty.days.empty() && empty.events.empty(), "no rows in the data window -> empty result");
}

}  // namespace
}  // namespace cropwatch::alerts

int main() {
  using namespace cropwatch::alerts;

  cropwatch::set_log_level(cropwatch::LogLevel::WARN);

  test_default_run();
  test_index_independent_cold();
  test_gating_suppression();
  test_input_errors();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
