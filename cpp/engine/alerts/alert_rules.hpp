#pragma once
/*
================================================================================
Fragment 2.5 — Alerts: Rule Evaluator (Table-Driven)
FILE: cpp/engine/alerts/alert_rules.hpp

Purpose:
  One pure function per category, same signature:
      (DailyRecord, RuleThresholds) -> RuleOutcome
  looked up through a fixed table indexed by Category. Rules never look at
  QC or gating; the assembler applies those.

Reason strings:
  - Only clauses that contributed to the trigger are emitted, in a fixed
    order, joined with "; ". A non-triggered outcome has an empty reason.
  - Each clause cites the observed value, the operator and the threshold:
        "NDMI=0.175<0.25", "precip_7d=1.8mm<20mm", "RH=88%>75%"

Hardening:
  - Strict comparisons only. Unset value or unset threshold drops the clause.
  - Never throws on missing inputs.
================================================================================
*/

#include "engine/alerts/alert_config.hpp"
#include "engine/alerts/alert_types.hpp"

#include <array>

namespace cropwatch::alerts {

using RuleFn = RuleOutcome (*)(const DailyRecord& rec, const RuleThresholds& thr);

struct RuleEntry {
  Category category;
  RuleFn fn;
};

// Indexed by index_of(Category); order matches kAllCategories.
const std::array<RuleEntry, kCategoryCount>& rule_table() noexcept;

RuleOutcome evaluate_drought(const DailyRecord& rec, const RuleThresholds& thr);
RuleOutcome evaluate_cold_stress(const DailyRecord& rec, const RuleThresholds& thr);
RuleOutcome evaluate_heat_stress(const DailyRecord& rec, const RuleThresholds& thr);
RuleOutcome evaluate_nutrient_or_pest(const DailyRecord& rec, const RuleThresholds& thr);
RuleOutcome evaluate_waterlogging(const DailyRecord& rec, const RuleThresholds& thr);

RuleOutcome evaluate_rule(Category c, const DailyRecord& rec, const RuleThresholds& thr);

// All categories, declaration order.
RuleOutcomeSet evaluate_rules(const DailyRecord& rec, const RuleThresholds& thr);

} // namespace cropwatch::alerts
