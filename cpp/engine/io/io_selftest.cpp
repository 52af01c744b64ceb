/*
  Fragment 4.7 — IO Selftest (config JSON / daily CSV / artifacts)

  Objective
  ---------
  Framework-free checks for the file boundary:
    1) Config loader: defaults, null -> unset thresholds, error codes.
    2) Daily CSV: column aliases, missing tokens, sorting, duplicate policy.
    3) Writers never emit NaN/Inf; unset values become null / empty cells.

  Expected use
  ------------
      ./io_selftest
  Non-zero return code indicates failure.
*/

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/alerts/alert_types.hpp"
#include "engine/alerts/run_summary.hpp"
#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/io/alert_csv.hpp"
#include "engine/io/config_json.hpp"
#include "engine/io/daily_csv.hpp"
#include "engine/io/json_value.hpp"
#include "engine/io/json_writer.hpp"
#include "engine/io/stage_summary_json.hpp"

namespace cropwatch::io {
namespace {

using namespace cropwatch::alerts;

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

bool contains(const std::string& hay, std::string_view needle) {
  return hay.find(std::string(needle)) != std::string::npos;
}

// ----------------------------- Config ----------------------------------------

void test_config_defaults() {
  const AlertConfig cfg = load_alert_config_json(
      R"({"period": {"data_start": "2024-04-01", "data_end": "2024-09-30"}})");
  expect_true(cfg.period.report.start == cfg.period.data.start && cfg.period.report.end == cfg.period.data.end,
              "report window defaults to the data window");
  expect_true(cfg.support.window_half_days == 5 && cfg.support.mode == WindowMode::PastOnly,
              "support defaults");
  expect_true(cfg.merge.merge_gap_days == 2, "merge gap default");
  expect_true(cfg.rules.drought.ndmi_soft == 0.25, "drought threshold default");
}

void test_config_overrides() {
  const AlertConfig cfg = load_alert_config_json(R"({
    "period":  {"data_start": "2024-04-01", "data_end": "2024-09-30",
                "report_start": "2024-05-01", "report_end": "2024-08-31"},
    "support": {"window_half_days": 3, "window_mode": "symmetric", "pick": "same_day"},
    "gating":  {"mode": "month_window", "season_months": [5, 6, 7]},
    "rules":   {"drought": {"precip_low_7d": null, "index_independent": true, "precip_only_max": 4.5},
                "cold_stress": {"rh_min": null}},
    "merge":   {"merge_gap_days": 0},
    "input":   {"duplicate_dates": "keep_last"},
    "logging": {"level": "debug"},
    "unknown_section": {"ignored": true}
  })");
  expect_true(cfg.period.report.start == CivilDate::from_ymd(2024, 5, 1), "report_start parsed");
  expect_true(cfg.support.mode == WindowMode::Symmetric && cfg.support.pick == SupportPick::SameDay,
              "support enums parsed");
  expect_true(cfg.gating.mode == GatingMode::MonthWindow && cfg.gating.season_months.size() == 3,
              "gating section parsed");
  expect_true(!is_set(cfg.rules.drought.precip_low_7d), "null threshold loads as unset");
  expect_true(!is_set(cfg.rules.cold.rh_min), "null cold RH threshold loads as unset");
  expect_true(cfg.rules.drought.index_independent && cfg.rules.drought.precip_only_max == 4.5,
              "weather-only drought tier configured");
  expect_true(cfg.merge.merge_gap_days == 0, "merge gap 0 accepted");
  expect_true(cfg.input.duplicate_dates == DuplicateDatePolicy::KeepLast, "duplicate policy parsed");
  expect_true(cfg.logging.level == LogLevel::DEBUG, "logging level parsed");
}

void test_config_errors() {
  expect_error([] { load_alert_config_json("{\"period\": "); }, ErrorCode::kParse, "truncated JSON -> parse error");
  expect_error([] { load_alert_config_json("{}"); }, ErrorCode::kConfig, "missing period -> config error");
  expect_error([] { load_alert_config_json(R"({"period": {"data_start": "2024-04-01"}})"); }, ErrorCode::kConfig,
               "missing data_end -> config error");
  expect_error([] {
    load_alert_config_json(R"({"period": {"data_start": "2024-04-01", "data_end": "2024-02-30"}})");
  }, ErrorCode::kConfig, "invalid calendar date -> config error");
  expect_error([] {
    load_alert_config_json(
        R"({"period": {"data_start": "2024-04-01", "data_end": "2024-09-30"}, "rules": {"drought": {"ndmi_soft": "low"}}})");
  }, ErrorCode::kConfig, "string threshold -> config error");
  expect_error([] {
    load_alert_config_json(
        R"({"period": {"data_start": "2024-04-01", "data_end": "2024-09-30"}, "support": {"window_mode": "sideways"}})");
  }, ErrorCode::kConfig, "unknown window mode -> config error");
  expect_error([] {
    load_alert_config_json(
        R"({"period": {"data_start": "2024-04-01", "data_end": "2024-09-30"}, "merge": {"merge_gap_days": -1}})");
  }, ErrorCode::kConfig, "negative merge gap -> config error");
  expect_error([] {
    load_alert_config_json(
        R"({"period": {"data_start": "2024-04-01", "data_end": "2024-09-30", "report_start": "2024-03-01"}})");
  }, ErrorCode::kConfig, "report window outside data window -> config error");
  expect_error([] {
    load_alert_config_json(
        R"({"period": {"data_start": "2024-04-01", "data_end": "2024-09-30"}, "canopy": {"ndvi_min": null, "evi_min": null}})");
  }, ErrorCode::kConfig, "both canopy thresholds null -> config error");
  expect_error([] { load_alert_config_file("/nonexistent/cropwatch/config.json"); }, ErrorCode::kIo,
               "missing config file -> io error");
}

// ----------------------------- Daily CSV -------------------------------------

void test_csv_aliases_and_sorting() {
  std::istringstream in(
      "\xEF\xBB\xBF" "Date,TMEAN_7D,precipitation_sum,relative_humidity_2m_mean,ndmi_mean,NDMI_obs,evi\r\n"
      "2024-05-03,12.5,0.0,70,0.31,,NaN\r\n"
      "2024-05-01T00:00:00,11.0,1.5,65,0.30,0.28,0.41\r\n"
      "\r\n"
      "2024-05-02,,null,na,,,\r\n");
  const auto rows = read_daily_records_csv(in, InputConfig{});
  expect_true(rows.size() == 3, "three rows read, blank line skipped");
  if (rows.size() != 3) return;

  expect_true(rows[0].date == CivilDate::from_ymd(2024, 5, 1), "rows sorted by date");
  expect_true(rows[0].indices.ndmi == 0.28, "<index>_obs preferred over <index>_mean");
  expect_true(rows[0].precip_1d == 1.5 && rows[0].rh_mean == 65.0, "weather column aliases resolved");
  expect_true(rows[0].indices.evi == 0.41, "bare index column accepted");
  expect_true(!is_set(rows[1].tmean_7d) && !is_set(rows[1].precip_1d) && !is_set(rows[1].rh_mean),
              "empty / null / na cells are unset");
  expect_true(!rows[1].has_index_observation(), "row without indices has no observation");
  expect_true(!is_set(rows[2].indices.ndmi), "empty _obs cell is unset even when _mean has a value");
  expect_true(!is_set(rows[2].indices.evi), "NaN token is unset");
  expect_true(!is_set(rows[2].tmin_7d), "absent column is unset");
}

void test_csv_errors_and_duplicates() {
  {
    std::istringstream in("date,tmean_7d\n2024-05-01,warm\n");
    expect_error([&] { read_daily_records_csv(in, InputConfig{}); }, ErrorCode::kParse, "non-numeric cell rejected");
  }
  {
    std::istringstream in("day,tmean_7d\n2024-05-01,1\n");
    expect_error([&] { read_daily_records_csv(in, InputConfig{}); }, ErrorCode::kParse, "missing date column rejected");
  }
  {
    std::istringstream in("date,tmean_7d\n05/01/2024,1\n");
    expect_error([&] { read_daily_records_csv(in, InputConfig{}); }, ErrorCode::kParse, "non-ISO date rejected");
  }
  {
    std::istringstream in("date,tmean_7d\n2024-05-01,1\n2024-05-01,2\n");
    expect_error([&] { read_daily_records_csv(in, InputConfig{}); }, ErrorCode::kParse,
                 "duplicate date rejected by default");
  }
  {
    std::istringstream in("date,tmean_7d\n2024-05-01,1\n2024-05-02,5\n2024-05-01,2\n");
    InputConfig keep{};
    keep.duplicate_dates = DuplicateDatePolicy::KeepLast;
    const auto rows = read_daily_records_csv(in, keep);
    expect_true(rows.size() == 2 && rows[0].tmean_7d == 2.0, "keep_last keeps the later row");
  }
}

// ----------------------------- Writers ---------------------------------------

void test_json_writer() {
  std::ostringstream os;
  JsonWriteOptions opt{};
  opt.pretty = false;
  JsonWriter w(os, opt);
  w.begin_object();
  w.field("n", 3);
  w.field("x", kUnset);
  w.field("s", "a\"b");
  w.key("list");
  w.begin_array();
  w.number(0.5);
  w.boolean(true);
  w.end_array();
  w.end_object();
  expect_eq_str(os.str(), R"({"n":3,"x":null,"s":"a\"b","list":[0.5,true]})", "compact writer output");

  JsonValue v;
  JsonParseError err;
  expect_true(parse_json(os.str(), &v, &err), "writer output parses back");
  const JsonValue* x = v.find("x");
  expect_true(x != nullptr && x->is_null(), "unset number round-trips as null");
}

void test_alert_csv() {
  Event e{};
  e.composite = true;
  e.categories = {Category::Drought, Category::ColdStress};
  e.start_date = CivilDate::from_ymd(2024, 6, 10);
  e.end_date = CivilDate::from_ymd(2024, 6, 11);
  e.duration_days = 2;
  e.peaks = {CategoryPeak{Category::Drought, 0.12, e.start_date, MetricVariable::Ndmi},
             CategoryPeak{Category::ColdStress, kUnset, {}, MetricVariable::None}};
  e.reason_union = {"drought: NDMI=0.120<strong 0.15", "cold_stress: tmean_7d=3.1C<5C; RH=88%>75%"};
  e.member_dates = {e.start_date, e.end_date};
  e.severity_score = 0.875;
  e.severity_level = SeverityLevel::Major;

  Event dry{};
  dry.categories = {Category::Drought};
  dry.start_date = CivilDate::from_ymd(2024, 6, 1);
  dry.end_date = CivilDate::from_ymd(2024, 6, 3);
  dry.duration_days = 3;
  dry.peak_metric = 1.9;
  dry.peak_date = CivilDate::from_ymd(2024, 6, 2);
  dry.peak_variable = MetricVariable::Msi;
  dry.peaks = {CategoryPeak{Category::Drought, 1.9, dry.peak_date, MetricVariable::Msi}};
  dry.member_dates = {dry.start_date, dry.peak_date, dry.end_date};

  std::ostringstream os;
  write_events_csv(os, {dry, e});
  const std::string out = os.str();
  expect_true(out.rfind("event_type,start_date,end_date,duration_days,peak_metric,peak_variable,peak_date,", 0) == 0,
              "events CSV header");
  expect_true(contains(out, "drought,2024-06-01,2024-06-03,3,1.9,msi,2024-06-02,drought,drought:msi=1.9@2024-06-02,,,"),
              "single event names its peak variable; unscored severity left empty");
  expect_true(contains(out, "composite,2024-06-10,2024-06-11,2,,,,drought+cold_stress,"),
              "composite row leaves peak columns empty");
  expect_true(contains(out, "drought:ndmi=0.12@2024-06-10;cold_stress:,0.875,major,"),
              "per-category peaks cell followed by severity");
  expect_true(contains(out, "2024-06-10;2024-06-11"), "member dates joined");
  expect_true(!contains(out, "nan"), "no NaN literal in events CSV");

  expect_eq_str(csv_escape("a,b"), "\"a,b\"", "comma forces quoting");
  expect_eq_str(csv_escape("say \"hi\""), "\"say \"\"hi\"\"\"", "quotes doubled");

  DailyAlert a{};
  a.date = CivilDate::from_ymd(2024, 6, 10);
  a.hits = {CategoryHit{Category::Drought, "NDMI=0.120<strong 0.15", 0.12},
            CategoryHit{Category::ColdStress, "tmean_7d=3.1C<5C; RH=88%>75%", 3.1}};
  std::ostringstream as;
  write_alerts_csv(as, {a});
  expect_eq_str(as.str(),
                "date,label,category_count,reason\n"
                "2024-06-10,drought+cold_stress,2,drought: NDMI=0.120<strong 0.15 | "
                "cold_stress: tmean_7d=3.1C<5C; RH=88%>75%\n",
                "alerts CSV row");
}

void test_stage_summary_empty_run() {
  RunSummary s{};
  s.data = DateRange{CivilDate::from_ymd(2024, 4, 1), CivilDate::from_ymd(2024, 4, 30)};
  s.report = s.data;

  AlertConfig cfg{};
  cfg.period.data = s.data;
  cfg.period.report = s.report;

  JsonWriteOptions opt{};
  opt.pretty = false;
  const std::string json = stage_summary_to_json(s, cfg, opt);
  expect_true(contains(json, "\"qc_pass_rate\":null"), "zero-denominator rate is null");
  expect_true(contains(json, "\"precip_only_max\":null"), "unset threshold echoed as null");
  expect_true(contains(json, "\"severity\":{\"minor\":0,\"moderate\":0,\"major\":0}"), "severity counts echoed");
  expect_true(!contains(json, "nan") && !contains(json, "inf"), "no non-finite literals");

  JsonValue v;
  expect_true(parse_json(json, &v, nullptr) && v.is_object(), "stage summary is valid JSON");
  const JsonValue* stages = v.find("stages");
  expect_true(stages != nullptr && stages->type == JsonType::kArr && stages->arr.size() == 5,
              "five stage rows");
}

}  // namespace
}  // namespace cropwatch::io

int main() {
  using namespace cropwatch::io;

  cropwatch::set_log_level(cropwatch::LogLevel::ERROR);

  test_config_defaults();
  test_config_overrides();
  test_config_errors();
  test_csv_aliases_and_sorting();
  test_csv_errors_and_duplicates();
  test_json_writer();
  test_alert_csv();
  test_stage_summary_empty_run();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
