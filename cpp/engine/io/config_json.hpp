#pragma once
/*
================================================================================
Fragment 4.3 — IO: Alert Config Loader (JSON)
FILE: cpp/engine/io/config_json.hpp

Layout (every section optional except period.data_start / period.data_end):
  {
    "period":  { "data_start": "YYYY-MM-DD", "data_end": "...",
                 "report_start": "...", "report_end": "..." },
    "support": { "window_half_days": 5, "window_mode": "past_only",
                 "max_age_days": 5, "pick": "nearest" },
    "canopy":  { "ndvi_min": 0.35, "evi_min": 0.20 },
    "gating":  { "mode": "both", "season_months": [4,5,6,7,8,9,10],
                 "canopy_obs_min": 3, "reset_at_season_start": false,
                 "apply_to_weather_only": false },
    "rules":   { "drought": {...}, "cold_stress": {...}, "heat_stress": {...},
                 "nutrient_or_pest": {...}, "waterlogging": {...} },
    "merge":   { "merge_gap_days": 2 },
    "input":   { "duplicate_dates": "reject" },
    "logging": { "level": "info" }
  }

Rules:
  - `null` on a threshold = unset (clause disabled).
  - Unknown keys are ignored.
  - Malformed JSON  -> ErrorCode::kParse (line/col in message).
  - Wrong types, unknown enum strings, bad dates -> ErrorCode::kConfig naming
    the key path ("rules.drought.ndmi_soft").
  - report_start/report_end default to the data range.
  - The result has passed AlertConfig::validate().
================================================================================
*/

#include "engine/alerts/alert_config.hpp"

#include <string>
#include <string_view>

namespace cropwatch::io {

alerts::AlertConfig load_alert_config_json(std::string_view json_text);

// Throws ErrorCode::kIo when the file cannot be read.
alerts::AlertConfig load_alert_config_file(const std::string& path);

}  // namespace cropwatch::io
