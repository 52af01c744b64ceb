#pragma once
/*
================================================================================
Fragment 4.5 — IO: Alert Artifacts (CSV)
FILE: cpp/engine/io/alert_csv.hpp

  02_rs_debug.csv       one row per report day (support / QC / gating / rules)
  03_alerts_raw.csv     raw daily alerts
  04_alerts_gated.csv   gated daily alerts
  05_events.csv         merged events; peaks as "category:variable=value@date",
                        severity from attach_severity()

Unset numbers are written as empty cells. Text cells are quoted when they
contain a comma, quote or newline.
================================================================================
*/

#include "engine/alerts/alert_types.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace cropwatch::io {

std::string csv_escape(const std::string& s);

void write_rs_debug_csv(std::ostream& os, const std::vector<alerts::DayResult>& days);
void write_alerts_csv(std::ostream& os, const std::vector<alerts::DailyAlert>& rows);
void write_events_csv(std::ostream& os, const std::vector<alerts::Event>& events);

}  // namespace cropwatch::io
