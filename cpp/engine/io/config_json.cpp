/*
================================================================================
Fragment 4.3 — IO: Alert Config Loader (Implementation)
FILE: cpp/engine/io/config_json.cpp
================================================================================
*/

#include "engine/io/config_json.hpp"

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/io/json_value.hpp"

#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace cropwatch::io {

namespace {

using alerts::AlertConfig;

// Typed accessors over one JSON object, carrying the dotted key path for
// error messages.
class Section {
 public:
  Section(const JsonValue* v, std::string path) : v_(v), path_(std::move(path)) {}

  std::string path_of(std::string_view key) const {
    return path_.empty() ? std::string(key) : path_ + "." + std::string(key);
  }

  std::optional<Section> child(std::string_view key) const {
    const JsonValue* c = v_->find(key);
    if (!c) return std::nullopt;
    if (!c->is_object()) type_error(key, *c, "object");
    return Section(c, path_of(key));
  }

  // number | null (null -> unset)
  void threshold(std::string_view key, double& out) const {
    const JsonValue* c = v_->find(key);
    if (!c) return;
    if (c->is_null()) {
      out = std::numeric_limits<double>::quiet_NaN();
      return;
    }
    if (c->type != JsonType::kNum) type_error(key, *c, "number or null");
    out = c->num;
  }

  void integer(std::string_view key, int& out) const {
    const JsonValue* c = v_->find(key);
    if (!c) return;
    if (c->type != JsonType::kNum) type_error(key, *c, "integer");
    if (c->num != std::floor(c->num) || std::fabs(c->num) > 1.0e9) {
      CROPWATCH_THROW(ErrorCode::kConfig, path_of(key) + " must be an integer");
    }
    out = static_cast<int>(c->num);
  }

  void boolean(std::string_view key, bool& out) const {
    const JsonValue* c = v_->find(key);
    if (!c) return;
    if (c->type != JsonType::kBool) type_error(key, *c, "boolean");
    out = c->b;
  }

  std::optional<std::string> string(std::string_view key) const {
    const JsonValue* c = v_->find(key);
    if (!c) return std::nullopt;
    if (c->type != JsonType::kStr) type_error(key, *c, "string");
    return c->str;
  }

  std::optional<CivilDate> date(std::string_view key) const {
    auto s = string(key);
    if (!s) return std::nullopt;
    auto d = CivilDate::parse(*s);
    if (!d) CROPWATCH_THROW(ErrorCode::kConfig, path_of(key) + " is not a YYYY-MM-DD date: '" + *s + "'");
    return d;
  }

  template <class T, class ParseFn>
  void enumeration(std::string_view key, T& out, ParseFn parse) const {
    auto s = string(key);
    if (!s) return;
    auto v = parse(*s);
    if (!v) CROPWATCH_THROW(ErrorCode::kConfig, path_of(key) + " unknown value '" + *s + "'");
    out = *v;
  }

  void months(std::string_view key, std::vector<int>& out) const {
    const JsonValue* c = v_->find(key);
    if (!c) return;
    if (c->type != JsonType::kArr) type_error(key, *c, "array of months");
    std::vector<int> tmp;
    for (const auto& m : c->arr) {
      if (m.type != JsonType::kNum || m.num != std::floor(m.num) || std::fabs(m.num) > 1000.0) {
        CROPWATCH_THROW(ErrorCode::kConfig, path_of(key) + " entries must be integers");
      }
      tmp.push_back(static_cast<int>(m.num));
    }
    out = std::move(tmp);
  }

 private:
  [[noreturn]] void type_error(std::string_view key, const JsonValue& got, const char* want) const {
    CROPWATCH_THROW(ErrorCode::kConfig,
                    path_of(key) + " must be " + want + " (got " + json_type_name(got.type) + ")");
  }

  const JsonValue* v_;
  std::string path_;
};

void load_period(const Section& s, alerts::PeriodConfig& p) {
  auto ds = s.date("data_start");
  auto de = s.date("data_end");
  if (!ds) CROPWATCH_THROW(ErrorCode::kConfig, s.path_of("data_start") + " is required");
  if (!de) CROPWATCH_THROW(ErrorCode::kConfig, s.path_of("data_end") + " is required");
  p.data = DateRange{*ds, *de};
  p.report = p.data;
  if (auto rs = s.date("report_start")) p.report.start = *rs;
  if (auto re = s.date("report_end")) p.report.end = *re;
}

void load_support(const Section& s, alerts::SupportConfig& c) {
  s.integer("window_half_days", c.window_half_days);
  s.enumeration("window_mode", c.mode, alerts::parse_window_mode);
  s.integer("max_age_days", c.max_age_days);
  s.enumeration("pick", c.pick, alerts::parse_support_pick);
}

void load_gating(const Section& s, alerts::GatingConfig& c) {
  s.enumeration("mode", c.mode, alerts::parse_gating_mode);
  s.months("season_months", c.season_months);
  s.integer("canopy_obs_min", c.canopy_obs_min);
  s.boolean("reset_at_season_start", c.reset_at_season_start);
  s.boolean("apply_to_weather_only", c.apply_to_weather_only);
}

void load_rules(const Section& s, alerts::RuleThresholds& r) {
  if (auto d = s.child("drought")) {
    d->threshold("ndmi_strong", r.drought.ndmi_strong);
    d->threshold("msi_strong", r.drought.msi_strong);
    d->threshold("ndmi_soft", r.drought.ndmi_soft);
    d->threshold("msi_soft", r.drought.msi_soft);
    d->threshold("precip_low_7d", r.drought.precip_low_7d);
    d->threshold("precip_only_max", r.drought.precip_only_max);
    d->boolean("index_independent", r.drought.index_independent);
  }
  if (auto c = s.child("cold_stress")) {
    c->threshold("tmean_max", r.cold.tmean_max);
    c->threshold("tmin_max", r.cold.tmin_max);
    c->threshold("rh_min", r.cold.rh_min);
    c->boolean("index_independent", r.cold.index_independent);
  }
  if (auto h = s.child("heat_stress")) {
    h->threshold("tmean_min", r.heat.tmean_min);
    h->threshold("tmax_min", r.heat.tmax_min);
    h->threshold("rh_max", r.heat.rh_max);
    h->threshold("evi_max", r.heat.evi_max);
    h->boolean("index_independent", r.heat.index_independent);
  }
  if (auto n = s.child("nutrient_or_pest")) {
    n->threshold("ndre_max", r.nutrient.ndre_max);
    n->threshold("ndre_strong", r.nutrient.ndre_strong);
    n->threshold("gndvi_max", r.nutrient.gndvi_max);
    n->threshold("evi_max", r.nutrient.evi_max);
    n->threshold("ndmi_moist_min", r.nutrient.ndmi_moist_min);
    n->threshold("rh_humid", r.nutrient.rh_humid);
    n->boolean("require_humidity", r.nutrient.require_humidity);
    n->integer("min_index_deficits", r.nutrient.min_index_deficits);
    n->boolean("index_independent", r.nutrient.index_independent);
  }
  if (auto w = s.child("waterlogging")) {
    w->threshold("precip_high_7d", r.waterlogging.precip_high_7d);
    w->threshold("precip_high_1d", r.waterlogging.precip_high_1d);
    w->threshold("ndmi_wet", r.waterlogging.ndmi_wet);
    w->threshold("ndvi_sparse", r.waterlogging.ndvi_sparse);
    w->boolean("index_independent", r.waterlogging.index_independent);
  }
}

}  // namespace

AlertConfig load_alert_config_json(std::string_view json_text) {
  JsonValue root;
  JsonParseError perr;
  if (!parse_json(json_text, &root, &perr)) {
    std::ostringstream oss;
    oss << "config JSON parse error at line " << perr.line << ", col " << perr.col << ": " << perr.message;
    CROPWATCH_THROW(ErrorCode::kParse, oss.str());
  }
  if (!root.is_object()) {
    CROPWATCH_THROW(ErrorCode::kConfig, std::string("config root must be an object (got ") +
                                            json_type_name(root.type) + ")");
  }

  AlertConfig cfg{};
  const Section top(&root, "");

  auto period = top.child("period");
  if (!period) CROPWATCH_THROW(ErrorCode::kConfig, "period section is required");
  load_period(*period, cfg.period);

  if (auto s = top.child("support")) load_support(*s, cfg.support);
  if (auto s = top.child("canopy")) {
    s->threshold("ndvi_min", cfg.canopy.ndvi_min);
    s->threshold("evi_min", cfg.canopy.evi_min);
  }
  if (auto s = top.child("gating")) load_gating(*s, cfg.gating);
  if (auto s = top.child("rules")) load_rules(*s, cfg.rules);
  if (auto s = top.child("merge")) s->integer("merge_gap_days", cfg.merge.merge_gap_days);
  if (auto s = top.child("input")) {
    s->enumeration("duplicate_dates", cfg.input.duplicate_dates, alerts::parse_duplicate_policy);
  }
  if (auto s = top.child("logging")) {
    if (auto lvl = s->string("level")) {
      if (!parse_log_level(*lvl, &cfg.logging.level)) {
        CROPWATCH_THROW(ErrorCode::kConfig, "logging.level unknown value '" + *lvl + "'");
      }
    }
  }

  cfg.validate();
  return cfg;
}

AlertConfig load_alert_config_file(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) CROPWATCH_THROW(ErrorCode::kIo, "cannot open config file: " + path);
  const std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  if (f.bad()) CROPWATCH_THROW(ErrorCode::kIo, "failed reading config file: " + path);
  log(LogLevel::DEBUG, "config", "loaded " + std::to_string(text.size()) + " bytes from " + path);
  return load_alert_config_json(text);
}

}  // namespace cropwatch::io
