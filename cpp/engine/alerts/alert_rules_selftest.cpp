/*
  Fragment 2.11 — Rule Evaluator Selftest

  Objective
  ---------
  Pin down the five category rules with the default thresholds:
    1) Reason strings are deterministic ("NDMI=0.175<0.25; precip_7d=1.8mm<20mm").
    2) Comparisons are strict (value == threshold never fires).
    3) Missing inputs never fire a clause; null thresholds disable it.
    4) index_independent categories evaluate without any index.
    5) The metric comes from the clause that qualified, and merged event
       peaks compare values of that variable only.

  Expected use
  ------------
      ./alert_rules_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/alerts/alert_rules.hpp"
#include "engine/alerts/event_merger.hpp"

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

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

void expect_fired(const RuleOutcome& o, const std::string& reason, std::string_view msg) {
  if (!o.triggered) {
    fail(msg);
    std::cerr << "  rule did not fire\n";
    return;
  }
  expect_eq_str(o.reason, reason, msg);
}

void expect_quiet(const RuleOutcome& o, std::string_view msg) {
  if (o.triggered) {
    fail(msg);
    std::cerr << "  unexpected reason: " << o.reason << "\n";
  } else {
    pass(msg);
  }
}

DailyRecord day() {
  DailyRecord r{};
  r.date = CivilDate::from_ymd(2024, 6, 1);
  return r;
}

void test_drought() {
  const RuleThresholds thr{};

  DailyRecord r = day();
  r.indices.ndmi = 0.175;
  r.precip_7d = 1.8;
  const RuleOutcome soft = evaluate_drought(r, thr);
  expect_fired(soft, "NDMI=0.175<0.25; precip_7d=1.8mm<20mm", "drought soft tier with dry week");
  expect_true(soft.metric == 0.175, "drought metric is NDMI");

  r.precip_7d = 25.0;
  expect_quiet(evaluate_drought(r, thr), "soft tier needs the low-precipitation corroboration");

  r.precip_7d = kUnset;
  expect_quiet(evaluate_drought(r, thr), "missing precipitation fails the required clause");

  RuleThresholds no_precip = thr;
  no_precip.drought.precip_low_7d = kUnset;
  expect_fired(evaluate_drought(r, no_precip), "NDMI=0.175<0.25", "null precip_low_7d drops the requirement");

  DailyRecord strong = day();
  strong.indices.ndmi = 0.12;
  expect_fired(evaluate_drought(strong, thr), "NDMI=0.120<strong 0.15", "strong tier fires without precipitation");

  DailyRecord msi = day();
  msi.indices.msi = 1.5;
  expect_fired(evaluate_drought(msi, thr), "MSI=1.500>strong 1.2", "MSI strong tier");

  DailyRecord edge = day();
  edge.indices.ndmi = 0.25;
  edge.precip_7d = 1.8;
  expect_quiet(evaluate_drought(edge, thr), "NDMI equal to the soft threshold does not fire");

  expect_quiet(evaluate_drought(day(), thr), "no inputs -> no drought");
}

void test_drought_weather_only() {
  RuleThresholds thr{};
  thr.drought.index_independent = true;
  thr.drought.precip_only_max = 5.0;

  DailyRecord r = day();
  r.precip_7d = 3.0;
  r.indices.ndmi = 0.10;  // ignored in weather-only mode
  const RuleOutcome o = evaluate_drought(r, thr);
  expect_fired(o, "precip_7d=3.0mm<5mm (weather-only)", "weather-only drought tier");
  expect_true(o.metric == 3.0, "weather-only drought tracks precip_7d");

  r.precip_7d = 5.0;
  expect_quiet(evaluate_drought(r, thr), "weather-only tier is strict");

  thr.drought.precip_only_max = kUnset;
  r.precip_7d = 0.0;
  expect_quiet(evaluate_drought(r, thr), "weather-only tier disabled by null threshold");
}

void test_cold() {
  const RuleThresholds thr{};

  DailyRecord r = day();
  r.tmean_7d = 3.1;
  r.rh_mean = 88.0;
  const RuleOutcome o = evaluate_cold_stress(r, thr);
  expect_fired(o, "tmean_7d=3.1C<5C; RH=88%>75%", "cold stress with humid air");
  expect_true(o.metric == 3.1, "cold metric is tmean_7d");

  r.tmin_7d = -1.5;
  expect_fired(evaluate_cold_stress(r, thr), "tmean_7d=3.1C<5C; tmin_7d=-1.5C<0C; RH=88%>75%",
               "both temperature clauses listed in order");

  DailyRecord edge = day();
  edge.tmean_7d = 5.0;
  edge.rh_mean = 88.0;
  expect_quiet(evaluate_cold_stress(edge, thr), "tmean equal to threshold does not fire");

  DailyRecord rh_edge = day();
  rh_edge.tmean_7d = 3.1;
  rh_edge.rh_mean = 75.0;
  expect_quiet(evaluate_cold_stress(rh_edge, thr), "RH equal to threshold does not fire");

  DailyRecord dry = day();
  dry.tmean_7d = 3.1;
  expect_quiet(evaluate_cold_stress(dry, thr), "missing RH fails the humidity requirement");
}

void test_heat() {
  const RuleThresholds thr{};

  DailyRecord r = day();
  r.tmean_7d = 32.5;
  r.indices.evi = 0.15;
  expect_fired(evaluate_heat_stress(r, thr), "tmean_7d=32.5C>30C; EVI=0.150<0.2", "heat without RH reading");

  r.rh_mean = 22.0;
  expect_fired(evaluate_heat_stress(r, thr), "tmean_7d=32.5C>30C; RH=22%<30%; EVI=0.150<0.2", "heat with dry air");

  r.rh_mean = 40.0;
  expect_quiet(evaluate_heat_stress(r, thr), "humid air blocks heat stress");

  DailyRecord lush = day();
  lush.tmean_7d = 32.5;
  lush.indices.evi = 0.45;
  expect_quiet(evaluate_heat_stress(lush, thr), "healthy canopy blocks heat stress");

  RuleThresholds weather = thr;
  weather.heat.index_independent = true;
  expect_fired(evaluate_heat_stress(lush, weather), "tmean_7d=32.5C>30C", "index-independent heat skips EVI");
}

void test_nutrient() {
  RuleThresholds thr{};

  DailyRecord r = day();
  r.indices.ndmi = 0.40;
  r.indices.ndre = 0.18;
  r.indices.gndvi = 0.60;
  r.indices.evi = 0.30;
  r.rh_mean = 60.0;
  const RuleOutcome o = evaluate_nutrient_or_pest(r, thr);
  expect_fired(o, "NDRE=0.180<strong 0.2", "strong NDRE deficit");
  expect_true(o.metric == 0.18, "nutrient metric is NDRE");

  r.indices.ndre = 0.25;
  r.indices.gndvi = 0.45;
  r.rh_mean = 80.0;
  expect_fired(evaluate_nutrient_or_pest(r, thr), "NDRE=0.250<0.28; GNDVI=0.450<0.5; RH=80%>75%",
               "moderate deficits with humid context");

  DailyRecord dry = r;
  dry.indices.ndmi = 0.20;
  expect_quiet(evaluate_nutrient_or_pest(dry, thr), "moisture deficit blocks nutrient/pest");

  thr.nutrient.require_humidity = true;
  r.rh_mean = 60.0;
  expect_quiet(evaluate_nutrient_or_pest(r, thr), "required humidity missing");

  thr.nutrient.require_humidity = false;
  thr.nutrient.min_index_deficits = 3;
  expect_quiet(evaluate_nutrient_or_pest(r, thr), "two deficits below a minimum of three");
}

void test_waterlogging() {
  const RuleThresholds thr{};

  DailyRecord r = day();
  r.precip_7d = 55.0;
  r.indices.ndmi = 0.65;
  r.indices.ndvi = 0.30;
  const RuleOutcome o = evaluate_waterlogging(r, thr);
  expect_fired(o, "precip_7d=55.0mm>40mm; NDMI=0.650>0.6; NDVI=0.300<0.35", "wet soil with sparse canopy");
  expect_true(o.metric == 55.0, "waterlogging metric is precip_7d");

  DailyRecord no_ndvi = r;
  no_ndvi.indices.ndvi = kUnset;
  expect_quiet(evaluate_waterlogging(no_ndvi, thr), "missing NDVI fails the sparse-canopy clause");

  RuleThresholds burst = thr;
  burst.waterlogging.precip_high_1d = 30.0;
  burst.waterlogging.index_independent = true;
  DailyRecord storm = day();
  storm.precip_1d = 42.0;
  expect_fired(evaluate_waterlogging(storm, burst), "precip_1d=42.0mm>30mm", "single-day burst alternative");

  DailyRecord edge = r;
  edge.precip_7d = 40.0;
  expect_quiet(evaluate_waterlogging(edge, thr), "precip equal to threshold does not fire");
}

void expect_metric(const RuleOutcome& o, double value, MetricVariable v, std::string_view msg) {
  if (!o.triggered || o.metric != value || o.variable != v) {
    fail(msg);
    std::cerr << "  metric: " << o.metric << " " << metric_variable_name(o.variable) << "\n";
  } else {
    pass(msg);
  }
}

void test_qualifying_metric() {
  const RuleThresholds thr{};

  DailyRecord msi_only = day();
  msi_only.indices.msi = 1.5;
  expect_metric(evaluate_drought(msi_only, thr), 1.5, MetricVariable::Msi, "MSI-only strong drought tracks MSI");

  DailyRecord msi_soft = day();
  msi_soft.indices.ndmi = 0.40;
  msi_soft.indices.msi = 1.0;
  msi_soft.precip_7d = 1.8;
  const RuleOutcome soft = evaluate_drought(msi_soft, thr);
  expect_fired(soft, "MSI=1.000>0.8; precip_7d=1.8mm<20mm", "MSI soft tier with healthy NDMI");
  expect_metric(soft, 1.0, MetricVariable::Msi, "MSI soft tier tracks MSI, not the healthy NDMI");

  DailyRecord both = day();
  both.indices.ndmi = 0.12;
  both.indices.msi = 1.5;
  expect_metric(evaluate_drought(both, thr), 0.12, MetricVariable::Ndmi, "NDMI preferred when both indices qualify");

  DailyRecord tmin_only = day();
  tmin_only.tmean_7d = 6.0;
  tmin_only.tmin_7d = -3.0;
  tmin_only.rh_mean = 88.0;
  const RuleOutcome cold = evaluate_cold_stress(tmin_only, thr);
  expect_fired(cold, "tmin_7d=-3.0C<0C; RH=88%>75%", "tmin-only cold stress");
  expect_metric(cold, -3.0, MetricVariable::Tmin7d, "tmin-only cold tracks tmin_7d");
  expect_eq_str(metric_variable_name(cold.variable), "tmin_7d", "tmin_7d variable name");

  RuleThresholds hot = thr;
  hot.heat.tmax_min = 35.0;
  DailyRecord tmax_only = day();
  tmax_only.tmean_7d = 28.0;
  tmax_only.tmax_7d = 36.0;
  tmax_only.indices.evi = 0.15;
  expect_metric(evaluate_heat_stress(tmax_only, hot), 36.0, MetricVariable::Tmax7d, "tmax-only heat tracks tmax_7d");

  DailyRecord gndvi_only = day();
  gndvi_only.indices.ndmi = 0.40;
  gndvi_only.indices.ndre = 0.35;
  gndvi_only.indices.gndvi = 0.45;
  gndvi_only.indices.evi = 0.30;
  gndvi_only.rh_mean = 60.0;
  const RuleOutcome vigour = evaluate_nutrient_or_pest(gndvi_only, thr);
  expect_fired(vigour, "GNDVI=0.450<0.5", "GNDVI-only nutrient deficit");
  expect_metric(vigour, 0.45, MetricVariable::Gndvi, "GNDVI-only nutrient tracks GNDVI");

  RuleThresholds burst = thr;
  burst.waterlogging.precip_high_1d = 50.0;
  burst.waterlogging.index_independent = true;
  DailyRecord storm = day();
  storm.precip_7d = 10.0;
  storm.precip_1d = 80.0;
  const RuleOutcome wet = evaluate_waterlogging(storm, burst);
  expect_fired(wet, "precip_1d=80.0mm>50mm", "precip_1d-only waterlogging");
  expect_metric(wet, 80.0, MetricVariable::Precip1d, "precip_1d-only waterlogging tracks precip_1d");
}

DailyAlert drought_alert(const DailyRecord& r, const RuleThresholds& thr) {
  const RuleOutcome o = evaluate_drought(r, thr);
  DailyAlert a{};
  a.date = r.date;
  if (o.triggered) a.hits.push_back(CategoryHit{Category::Drought, o.reason, o.metric, o.variable});
  return a;
}

void test_event_peak_follows_variable() {
  const RuleThresholds thr{};
  const double msi[] = {1.3, 1.9, 1.4};
  const double ndmi[] = {0.40, 0.35, 0.30};

  std::vector<DailyAlert> alerts;
  for (int i = 0; i < 3; ++i) {
    DailyRecord r = day();
    r.date = CivilDate::from_ymd(2024, 6, 1 + i);
    r.indices.msi = msi[i];
    r.indices.ndmi = ndmi[i];
    alerts.push_back(drought_alert(r, thr));
  }
  const std::vector<Event> ev = merge_events(alerts, MergeConfig{});
  expect_true(ev.size() == 1, "three MSI drought days form one event");
  if (ev.size() == 1) {
    const Event& e = ev.front();
    expect_true(e.peak_metric == 1.9 && e.peak_date == CivilDate::from_ymd(2024, 6, 2),
                "MSI event peaks at the highest MSI");
    expect_true(e.peak_variable == MetricVariable::Msi && e.peaks.front().variable == MetricVariable::Msi,
                "event peak names MSI");
  }

  // Mixed days: the NDMI day wins over larger MSI values.
  alerts.clear();
  DailyRecord a = day();
  a.indices.msi = 1.9;
  DailyRecord b = day();
  b.date = CivilDate::from_ymd(2024, 6, 2);
  b.indices.ndmi = 0.12;
  b.indices.msi = 1.0;
  DailyRecord c = day();
  c.date = CivilDate::from_ymd(2024, 6, 3);
  c.indices.msi = 1.5;
  alerts = {drought_alert(a, thr), drought_alert(b, thr), drought_alert(c, thr)};
  const std::vector<Event> mixed = merge_events(alerts, MergeConfig{});
  expect_true(mixed.size() == 1 && mixed.front().peak_variable == MetricVariable::Ndmi &&
                  mixed.front().peak_metric == 0.12 && mixed.front().peak_date == b.date,
              "mixed-variable event keeps the preferred variable's peak");
}

void test_rule_table() {
  const auto& table = rule_table();
  bool ordered = true;
  for (std::size_t i = 0; i < table.size(); ++i) {
    if (index_of(table[i].category) != i) ordered = false;
  }
  expect_true(ordered, "rule table is in category declaration order");

  DailyRecord r = day();
  r.indices.ndmi = 0.175;
  r.precip_7d = 1.8;
  r.tmean_7d = 3.1;
  r.rh_mean = 88.0;
  const RuleOutcomeSet all = evaluate_rules(r, RuleThresholds{});
  expect_true(all[index_of(Category::Drought)].triggered, "evaluate_rules: drought");
  expect_true(all[index_of(Category::ColdStress)].triggered, "evaluate_rules: cold stress");
  expect_true(!all[index_of(Category::HeatStress)].triggered, "evaluate_rules: no heat");
  expect_true(!all[index_of(Category::NutrientOrPest)].triggered, "evaluate_rules: moisture deficit blocks nutrient");
  expect_true(!all[index_of(Category::Waterlogging)].triggered, "evaluate_rules: no waterlogging");

  const RuleOutcome single = evaluate_rule(Category::ColdStress, r, RuleThresholds{});
  expect_eq_str(single.reason, all[index_of(Category::ColdStress)].reason, "evaluate_rule matches the table entry");
  expect_true(std::isnan(all[index_of(Category::HeatStress)].metric), "quiet rule leaves the metric unset");
}

}  // namespace
}  // namespace cropwatch::alerts

int main() {
  using namespace cropwatch::alerts;

  test_drought();
  test_drought_weather_only();
  test_cold();
  test_heat();
  test_nutrient();
  test_waterlogging();
  test_qualifying_metric();
  test_event_peak_follows_variable();
  test_rule_table();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
