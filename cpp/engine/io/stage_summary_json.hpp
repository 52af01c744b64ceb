#pragma once
/*
================================================================================
Fragment 4.6 — IO: Stage Summary (JSON)
FILE: cpp/engine/io/stage_summary_json.hpp

Writes stage_summary.json:
  ranges, totals, stage table (days / alerts / events / removed), pass rates,
  skip-reason counts + ratios, per-category counts, event counts, and an echo
  of the effective configuration. Rates with a zero denominator are null.
================================================================================
*/

#include "engine/alerts/alert_config.hpp"
#include "engine/alerts/run_summary.hpp"
#include "engine/io/json_writer.hpp"

#include <iosfwd>
#include <string>

namespace cropwatch::io {

void write_stage_summary_json(std::ostream& os,
                              const alerts::RunSummary& summary,
                              const alerts::AlertConfig& cfg,
                              const JsonWriteOptions& opt = {});

std::string stage_summary_to_json(const alerts::RunSummary& summary,
                                  const alerts::AlertConfig& cfg,
                                  const JsonWriteOptions& opt = {});

}  // namespace cropwatch::io
