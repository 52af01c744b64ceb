#pragma once
/*
================================================================================
Fragment 4.4 — IO: Fused Daily CSV Ingestor
FILE: cpp/engine/io/daily_csv.hpp

Input:
  Header row, then one row per date. Header names are case-insensitive.
    date                          YYYY-MM-DD (required column)
    tmean_7d, tmin_7d, tmax_7d    degC
    precip_7d                     mm
    precip_1d | precipitation_sum mm
    rh_mean | relative_humidity_2m_mean   percent
    <index>_obs | <index>_mean | <index>
        for index in ndvi, ndmi, msi, ndre, evi, gndvi (_obs preferred)

Rules:
  - Empty cells and "nan"/"na"/"null" -> unset. Other non-numeric text ->
    ErrorCode::kParse naming line and column.
  - Missing optional columns -> all values unset.
  - Rows are returned sorted by date.
  - Duplicate dates: reject (kParse naming the date) or keep_last (last row
    in file order wins, WARN logged).
================================================================================
*/

#include "engine/alerts/alert_config.hpp"
#include "engine/alerts/alert_types.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace cropwatch::io {

std::vector<alerts::DailyRecord> read_daily_records_csv(std::istream& is, const alerts::InputConfig& cfg);

// Throws ErrorCode::kIo when the file cannot be opened.
std::vector<alerts::DailyRecord> read_daily_records_file(const std::string& path, const alerts::InputConfig& cfg);

}  // namespace cropwatch::io
