#pragma once
/*
================================================================================
Fragment 2.0 — Alerts: Core Data Model
FILE: cpp/engine/alerts/alert_types.hpp

Purpose:
  Strict, explicit types for the daily alert scan:
    1) DailyRecord       fused weather + index observations for one date
    2) SupportStatus     which index observation supports the date
    3) QCResult          skip reason + canopy readiness
    4) GatingDecision    season / canopy eligibility
    5) RuleOutcome       per-category trigger + evidence string + qualifying metric
    6) DailyAlert        triggered categories for one date (raw or gated view)
    7) Event             merged span of alerts (single category or composite)

Hardening rules:
  - Any double field set to NaN means "UNSET / missing".
  - Missing values never raise; they only remove clauses or support.
  - Category order is fixed by declaration and drives every listing.

Note:
  Types only. Computation lives in the component .cpp files.
================================================================================
*/

#include "engine/core/civil_date.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cropwatch::alerts {

// Sentinel for "unset" numeric values (NaN by default).
inline constexpr double kUnset = std::numeric_limits<double>::quiet_NaN();

inline bool is_set(double x) noexcept { return std::isfinite(x); }

// ----------------------------- Categories ------------------------------------
// Declaration order is the stable display / iteration order.
enum class Category : std::uint8_t {
  Drought = 0,
  ColdStress = 1,
  HeatStress = 2,
  NutrientOrPest = 3,
  Waterlogging = 4,
};

inline constexpr std::size_t kCategoryCount = 5;

inline constexpr std::array<Category, kCategoryCount> kAllCategories{
    Category::Drought, Category::ColdStress, Category::HeatStress,
    Category::NutrientOrPest, Category::Waterlogging};

inline constexpr std::size_t index_of(Category c) noexcept { return static_cast<std::size_t>(c); }

const char* category_name(Category c) noexcept;
std::optional<Category> parse_category(std::string_view s) noexcept;

// Variable behind a rule's qualifying metric. Within a category, declaration
// order is the peak preference: an event peak stays on the earliest-declared
// variable any member day qualified on.
enum class MetricVariable : std::uint8_t {
  None = 0,
  Ndmi,
  Msi,
  Ndre,
  Gndvi,
  Evi,
  Tmean7d,
  Tmin7d,
  Tmax7d,
  Precip7d,
  Precip1d,
};

const char* metric_variable_name(MetricVariable v) noexcept;  // "ndmi", "tmin_7d", ... ("" for None)

// Which way "more extreme" points for a peak metric.
enum class PeakDirection : std::uint8_t { Lower = 0, Higher = 1 };

PeakDirection peak_direction(Category c, MetricVariable v) noexcept;

// True when (cand_var, candidate) should replace (cur_var, current) as a
// category peak. An unset candidate never wins; any set candidate beats an
// unset current. Values are compared only when the variables match;
// otherwise the preferred variable wins.
bool more_extreme(Category c, MetricVariable cand_var, double candidate,
                  MetricVariable cur_var, double current) noexcept;

// ----------------------------- Severity --------------------------------------
enum class SeverityLevel : std::uint8_t { Minor = 0, Moderate = 1, Major = 2 };

inline constexpr std::size_t kSeverityLevelCount = 3;

const char* severity_level_name(SeverityLevel l) noexcept;

// ----------------------------- Daily input -----------------------------------
struct IndexValues {
  double ndvi = kUnset;
  double ndmi = kUnset;
  double msi = kUnset;
  double ndre = kUnset;
  double evi = kUnset;
  double gndvi = kUnset;

  bool any_set() const noexcept {
    return is_set(ndvi) || is_set(ndmi) || is_set(msi) ||
           is_set(ndre) || is_set(evi) || is_set(gndvi);
  }
};

struct DailyRecord {
  CivilDate date{};

  // Weather aggregates
  double tmean_7d = kUnset;   // degC, trailing 7-day mean of daily mean temperature
  double tmin_7d = kUnset;    // degC, trailing 7-day minimum
  double tmax_7d = kUnset;    // degC, trailing 7-day maximum
  double precip_7d = kUnset;  // mm, trailing 7-day cumulative precipitation
  double precip_1d = kUnset;  // mm, same-day precipitation
  double rh_mean = kUnset;    // %, daily mean relative humidity (0..100)

  // Remote-sensing observations on this exact date (unset when no pass).
  IndexValues indices;

  bool has_index_observation() const noexcept { return indices.any_set(); }
};

// ----------------------------- Support / QC ----------------------------------
enum class WindowMode : std::uint8_t { Symmetric = 0, PastOnly = 1 };

// Which indices the rules see for a supported date.
enum class SupportPick : std::uint8_t {
  Nearest = 0,  // indices of the chosen support observation
  SameDay = 1,  // only the record's own indices (unset when no pass that day)
};

struct SupportStatus {
  bool rs_support = false;
  int rs_age = -1;            // days between the date and the chosen observation; -1 when none
  CivilDate support_date{};   // valid only when rs_support
  IndexValues support{};      // observation values at support_date
};

enum class SkipReason : std::uint8_t {
  Ok = 0,
  NoRemoteSensing = 1,
  Stale = 2,
  LowCanopyConfidence = 3,
};

inline constexpr std::size_t kSkipReasonCount = 4;

const char* skip_reason_name(SkipReason r) noexcept;

struct QCResult {
  SkipReason skip_reason = SkipReason::NoRemoteSensing;
  bool canopy_ready = false;

  bool ok() const noexcept { return skip_reason == SkipReason::Ok; }
};

// ----------------------------- Gating ----------------------------------------
enum class GatingMode : std::uint8_t { Off = 0, MonthWindow = 1, CanopyObs = 2, Both = 3 };

struct GatingDecision {
  bool gating_ok = false;
  bool in_season = false;
  int canopy_obs_count = 0;  // running counter value after this date
};

// ----------------------------- Rules -----------------------------------------
struct RuleOutcome {
  bool triggered = false;
  std::string reason;     // ordered contributing clauses, "; "-joined
  double metric = kUnset; // qualifying value for event peaks
  MetricVariable variable = MetricVariable::None;  // which variable `metric` reads
};

using RuleOutcomeSet = std::array<RuleOutcome, kCategoryCount>;

// ----------------------------- Alerts ----------------------------------------
struct CategoryHit {
  Category category = Category::Drought;
  std::string reason;
  double metric = kUnset;
  MetricVariable variable = MetricVariable::None;
};

struct DailyAlert {
  CivilDate date{};
  std::vector<CategoryHit> hits;  // declaration order, never empty once emitted

  bool has(Category c) const noexcept;

  // "drought+cold_stress": display label, not a rule.
  std::string label() const;

  // "drought: <reason> | cold_stress: <reason>"
  std::string combined_reason() const;
};

// ----------------------------- Events ----------------------------------------
struct CategoryPeak {
  Category category = Category::Drought;
  double value = kUnset;
  CivilDate date{};  // valid only when value is set
  MetricVariable variable = MetricVariable::None;
};

struct Event {
  bool composite = false;
  std::vector<Category> categories;  // one entry for single-category events

  CivilDate start_date{};
  CivilDate end_date{};
  int duration_days = 0;

  // Single-category events: most extreme metric in the span. Composite: unset
  // (directions differ across members; see `peaks`).
  double peak_metric = kUnset;
  CivilDate peak_date{};
  MetricVariable peak_variable = MetricVariable::None;

  std::vector<CategoryPeak> peaks;        // per-category peaks, declaration order
  std::vector<std::string> reason_union;  // distinct, first-seen order
  std::vector<CivilDate> member_dates;    // distinct, ascending

  // Filled by attach_severity() once the event list is final; unset otherwise.
  double severity_score = kUnset;
  SeverityLevel severity_level = SeverityLevel::Minor;

  // "drought", "cold_stress", ..., or "composite".
  std::string event_type() const;

  std::string categories_label() const;  // "drought+cold_stress"
};

// ----------------------------- Per-day pipeline row --------------------------
struct DayResult {
  DailyRecord record;
  SupportStatus support;
  QCResult qc;
  GatingDecision gating;
  RuleOutcomeSet rules;

  bool allow_alert() const noexcept { return qc.ok() && gating.gating_ok; }
};

} // namespace cropwatch::alerts
