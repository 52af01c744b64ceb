/*
================================================================================
Fragment 2.5 — Alerts: Rule Evaluator (Implementation)
FILE: cpp/engine/alerts/alert_rules.cpp

Clause conventions:
  - Optional alternatives (A OR B): an unset threshold removes that
    alternative.
  - Required conjuncts (... AND C): an unset threshold removes the
    requirement; a set threshold with a missing value fails it.
  - A category configured index_independent reads no index at all
    (drought falls back to its precipitation-only tier and tracks
    precip_7d as its metric).
  - The metric is the value of the first alternative that qualified, in
    clause order; corroborating requirements never supply it.
================================================================================
*/

#include "engine/alerts/alert_rules.hpp"

#include <cstdio>
#include <string>
#include <vector>

namespace cropwatch::alerts {

namespace {

inline bool lt(double v, double thr) noexcept { return is_set(v) && is_set(thr) && v < thr; }
inline bool gt(double v, double thr) noexcept { return is_set(v) && is_set(thr) && v > thr; }

std::string fmt_value(double v, int decimals) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
  return std::string(buf);
}

std::string fmt_threshold(double t) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%g", t);
  return std::string(buf);
}

// "<name>=<value><unit><op>[<tier> ]<thr><unit>"
std::string clause(const char* name, double v, int decimals, char op, double thr,
                   const char* unit = "", const char* tier = nullptr) {
  std::string s = name;
  s += '=';
  s += fmt_value(v, decimals);
  s += unit;
  s += op;
  if (tier) {
    s += tier;
    s += ' ';
  }
  s += fmt_threshold(thr);
  s += unit;
  return s;
}

class Clauses {
 public:
  void add(std::string c) { items_.push_back(std::move(c)); }
  void append(const Clauses& other) { items_.insert(items_.end(), other.items_.begin(), other.items_.end()); }
  bool empty() const noexcept { return items_.empty(); }
  std::size_t size() const noexcept { return items_.size(); }

  std::string join() const {
    std::string out;
    for (const auto& c : items_) {
      if (!out.empty()) out += "; ";
      out += c;
    }
    return out;
  }

 private:
  std::vector<std::string> items_;
};

RuleOutcome fired(const Clauses& why, double metric, MetricVariable variable) {
  RuleOutcome o{};
  o.triggered = true;
  o.reason = why.join();
  o.metric = metric;
  o.variable = variable;
  return o;
}

constexpr int kIndexDecimals = 3;
constexpr int kTempDecimals = 1;
constexpr int kPrecipDecimals = 1;
constexpr int kRhDecimals = 0;

} // namespace

RuleOutcome evaluate_drought(const DailyRecord& rec, const RuleThresholds& thr) {
  const DroughtThresholds& t = thr.drought;
  const IndexValues& ix = rec.indices;

  if (t.index_independent) {
    if (lt(rec.precip_7d, t.precip_only_max)) {
      Clauses why;
      why.add(clause("precip_7d", rec.precip_7d, kPrecipDecimals, '<', t.precip_only_max, "mm") + " (weather-only)");
      return fired(why, rec.precip_7d, MetricVariable::Precip7d);
    }
    return RuleOutcome{};
  }

  // Strong tier: a moisture-index extreme triggers alone.
  Clauses strong;
  if (lt(ix.ndmi, t.ndmi_strong)) strong.add(clause("NDMI", ix.ndmi, kIndexDecimals, '<', t.ndmi_strong, "", "strong"));
  if (gt(ix.msi, t.msi_strong)) strong.add(clause("MSI", ix.msi, kIndexDecimals, '>', t.msi_strong, "", "strong"));
  if (!strong.empty()) {
    if (lt(ix.ndmi, t.ndmi_strong)) return fired(strong, ix.ndmi, MetricVariable::Ndmi);
    return fired(strong, ix.msi, MetricVariable::Msi);
  }

  // Soft tier: moderate moisture deficit corroborated by low precipitation.
  Clauses soft;
  if (lt(ix.ndmi, t.ndmi_soft)) soft.add(clause("NDMI", ix.ndmi, kIndexDecimals, '<', t.ndmi_soft));
  if (gt(ix.msi, t.msi_soft)) soft.add(clause("MSI", ix.msi, kIndexDecimals, '>', t.msi_soft));
  if (soft.empty()) return RuleOutcome{};
  const bool ndmi_soft = lt(ix.ndmi, t.ndmi_soft);

  if (is_set(t.precip_low_7d)) {
    if (!lt(rec.precip_7d, t.precip_low_7d)) return RuleOutcome{};
    soft.add(clause("precip_7d", rec.precip_7d, kPrecipDecimals, '<', t.precip_low_7d, "mm"));
  }
  return ndmi_soft ? fired(soft, ix.ndmi, MetricVariable::Ndmi) : fired(soft, ix.msi, MetricVariable::Msi);
}

RuleOutcome evaluate_cold_stress(const DailyRecord& rec, const RuleThresholds& thr) {
  const ColdThresholds& t = thr.cold;

  Clauses why;
  if (lt(rec.tmean_7d, t.tmean_max)) why.add(clause("tmean_7d", rec.tmean_7d, kTempDecimals, '<', t.tmean_max, "C"));
  if (lt(rec.tmin_7d, t.tmin_max)) why.add(clause("tmin_7d", rec.tmin_7d, kTempDecimals, '<', t.tmin_max, "C"));
  if (why.empty()) return RuleOutcome{};
  const bool by_tmean = lt(rec.tmean_7d, t.tmean_max);

  if (is_set(t.rh_min)) {
    if (!gt(rec.rh_mean, t.rh_min)) return RuleOutcome{};
    why.add(clause("RH", rec.rh_mean, kRhDecimals, '>', t.rh_min, "%"));
  }
  return by_tmean ? fired(why, rec.tmean_7d, MetricVariable::Tmean7d)
                  : fired(why, rec.tmin_7d, MetricVariable::Tmin7d);
}

RuleOutcome evaluate_heat_stress(const DailyRecord& rec, const RuleThresholds& thr) {
  const HeatThresholds& t = thr.heat;

  Clauses why;
  if (gt(rec.tmean_7d, t.tmean_min)) why.add(clause("tmean_7d", rec.tmean_7d, kTempDecimals, '>', t.tmean_min, "C"));
  if (gt(rec.tmax_7d, t.tmax_min)) why.add(clause("tmax_7d", rec.tmax_7d, kTempDecimals, '>', t.tmax_min, "C"));
  if (why.empty()) return RuleOutcome{};
  const bool by_tmean = gt(rec.tmean_7d, t.tmean_min);

  // Dry air corroborates; missing humidity does not block.
  if (is_set(rec.rh_mean) && is_set(t.rh_max)) {
    if (!(rec.rh_mean < t.rh_max)) return RuleOutcome{};
    why.add(clause("RH", rec.rh_mean, kRhDecimals, '<', t.rh_max, "%"));
  }

  if (!t.index_independent && is_set(t.evi_max)) {
    if (!lt(rec.indices.evi, t.evi_max)) return RuleOutcome{};
    why.add(clause("EVI", rec.indices.evi, kIndexDecimals, '<', t.evi_max));
  }
  return by_tmean ? fired(why, rec.tmean_7d, MetricVariable::Tmean7d)
                  : fired(why, rec.tmax_7d, MetricVariable::Tmax7d);
}

RuleOutcome evaluate_nutrient_or_pest(const DailyRecord& rec, const RuleThresholds& thr) {
  const NutrientThresholds& t = thr.nutrient;
  const IndexValues& ix = rec.indices;

  // A moisture deficit explains low vigour better than nutrients or pests.
  if (lt(ix.ndmi, t.ndmi_moist_min)) return RuleOutcome{};

  Clauses deficits;
  double metric = kUnset;
  MetricVariable variable = MetricVariable::None;
  if (lt(ix.ndre, t.ndre_strong)) {
    deficits.add(clause("NDRE", ix.ndre, kIndexDecimals, '<', t.ndre_strong, "", "strong"));
  } else if (lt(ix.ndre, t.ndre_max)) {
    deficits.add(clause("NDRE", ix.ndre, kIndexDecimals, '<', t.ndre_max));
  }
  if (!deficits.empty()) {
    metric = ix.ndre;
    variable = MetricVariable::Ndre;
  }
  if (lt(ix.gndvi, t.gndvi_max)) {
    deficits.add(clause("GNDVI", ix.gndvi, kIndexDecimals, '<', t.gndvi_max));
    if (variable == MetricVariable::None) {
      metric = ix.gndvi;
      variable = MetricVariable::Gndvi;
    }
  }
  if (lt(ix.evi, t.evi_max)) {
    deficits.add(clause("EVI", ix.evi, kIndexDecimals, '<', t.evi_max));
    if (variable == MetricVariable::None) {
      metric = ix.evi;
      variable = MetricVariable::Evi;
    }
  }

  if (static_cast<int>(deficits.size()) < t.min_index_deficits) return RuleOutcome{};

  const bool humid = gt(rec.rh_mean, t.rh_humid);
  if (t.require_humidity && !humid) return RuleOutcome{};
  if (humid) deficits.add(clause("RH", rec.rh_mean, kRhDecimals, '>', t.rh_humid, "%"));

  return fired(deficits, metric, variable);
}

RuleOutcome evaluate_waterlogging(const DailyRecord& rec, const RuleThresholds& thr) {
  const WaterloggingThresholds& t = thr.waterlogging;

  Clauses why;
  if (gt(rec.precip_7d, t.precip_high_7d)) why.add(clause("precip_7d", rec.precip_7d, kPrecipDecimals, '>', t.precip_high_7d, "mm"));
  if (gt(rec.precip_1d, t.precip_high_1d)) why.add(clause("precip_1d", rec.precip_1d, kPrecipDecimals, '>', t.precip_high_1d, "mm"));
  if (why.empty()) return RuleOutcome{};
  const bool by_week = gt(rec.precip_7d, t.precip_high_7d);

  if (!t.index_independent) {
    if (is_set(t.ndmi_wet)) {
      if (!gt(rec.indices.ndmi, t.ndmi_wet)) return RuleOutcome{};
      why.add(clause("NDMI", rec.indices.ndmi, kIndexDecimals, '>', t.ndmi_wet));
    }
    if (is_set(t.ndvi_sparse)) {
      if (!lt(rec.indices.ndvi, t.ndvi_sparse)) return RuleOutcome{};
      why.add(clause("NDVI", rec.indices.ndvi, kIndexDecimals, '<', t.ndvi_sparse));
    }
  }
  return by_week ? fired(why, rec.precip_7d, MetricVariable::Precip7d)
                 : fired(why, rec.precip_1d, MetricVariable::Precip1d);
}

const std::array<RuleEntry, kCategoryCount>& rule_table() noexcept {
  static const std::array<RuleEntry, kCategoryCount> kTable{{
      {Category::Drought, &evaluate_drought},
      {Category::ColdStress, &evaluate_cold_stress},
      {Category::HeatStress, &evaluate_heat_stress},
      {Category::NutrientOrPest, &evaluate_nutrient_or_pest},
      {Category::Waterlogging, &evaluate_waterlogging},
  }};
  return kTable;
}

RuleOutcome evaluate_rule(Category c, const DailyRecord& rec, const RuleThresholds& thr) {
  return rule_table()[index_of(c)].fn(rec, thr);
}

RuleOutcomeSet evaluate_rules(const DailyRecord& rec, const RuleThresholds& thr) {
  RuleOutcomeSet out{};
  for (const auto& e : rule_table()) {
    out[index_of(e.category)] = e.fn(rec, thr);
  }
  return out;
}

} // namespace cropwatch::alerts
