/*
================================================================================
Fragment 4.4 — IO: Fused Daily CSV Ingestor (Implementation)
FILE: cpp/engine/io/daily_csv.cpp
================================================================================
*/

#include "engine/io/daily_csv.hpp"

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cropwatch::io {

namespace {

using alerts::DailyRecord;

std::string trim(std::string_view v) {
  std::size_t b = 0;
  std::size_t e = v.size();
  while (b < e && std::isspace(static_cast<unsigned char>(v[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(v[e - 1]))) --e;
  return std::string(v.substr(b, e - b));
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Quote-aware splitter ("" inside quotes is a literal quote).
std::vector<std::string> split_csv_row(const std::string& line) {
  std::vector<std::string> out;
  std::string cur;
  bool in_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (in_quotes) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        cur.push_back('"');
        ++i;
      } else if (c == '"') {
        in_quotes = false;
      } else {
        cur.push_back(c);
      }
    } else if (c == '"') {
      in_quotes = true;
    } else if (c == ',') {
      out.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  out.push_back(cur);
  return out;
}

bool is_missing_token(const std::string& s) {
  if (s.empty()) return true;
  const std::string l = lower(s);
  return l == "nan" || l == "na" || l == "null" || l == "none";
}

using ColumnMap = std::unordered_map<std::string, std::size_t>;

std::optional<std::size_t> find_column(const ColumnMap& cols, std::initializer_list<const char*> names) {
  for (const char* n : names) {
    auto it = cols.find(n);
    if (it != cols.end()) return it->second;
  }
  return std::nullopt;
}

struct Layout {
  std::size_t date = 0;
  std::optional<std::size_t> tmean_7d, tmin_7d, tmax_7d, precip_7d, precip_1d, rh_mean;
  std::optional<std::size_t> ndvi, ndmi, msi, ndre, evi, gndvi;
};

Layout resolve_layout(const ColumnMap& cols) {
  Layout l{};
  auto date = find_column(cols, {"date"});
  if (!date) CROPWATCH_THROW(ErrorCode::kParse, "daily CSV header has no 'date' column");
  l.date = *date;
  l.tmean_7d = find_column(cols, {"tmean_7d"});
  l.tmin_7d = find_column(cols, {"tmin_7d"});
  l.tmax_7d = find_column(cols, {"tmax_7d"});
  l.precip_7d = find_column(cols, {"precip_7d"});
  l.precip_1d = find_column(cols, {"precip_1d", "precipitation_sum"});
  l.rh_mean = find_column(cols, {"rh_mean", "relative_humidity_2m_mean"});
  l.ndvi = find_column(cols, {"ndvi_obs", "ndvi_mean", "ndvi"});
  l.ndmi = find_column(cols, {"ndmi_obs", "ndmi_mean", "ndmi"});
  l.msi = find_column(cols, {"msi_obs", "msi_mean", "msi"});
  l.ndre = find_column(cols, {"ndre_obs", "ndre_mean", "ndre"});
  l.evi = find_column(cols, {"evi_obs", "evi_mean", "evi"});
  l.gndvi = find_column(cols, {"gndvi_obs", "gndvi_mean", "gndvi"});
  return l;
}

class RowReader {
 public:
  RowReader(const std::vector<std::string>& fields, std::size_t line_no, const std::vector<std::string>& header)
      : fields_(fields), line_no_(line_no), header_(header) {}

  double number(const std::optional<std::size_t>& col) const {
    if (!col || *col >= fields_.size()) return alerts::kUnset;
    const std::string s = trim(fields_[*col]);
    if (is_missing_token(s)) return alerts::kUnset;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0' || !std::isfinite(v)) {
      CROPWATCH_THROW(ErrorCode::kParse, "daily CSV line " + std::to_string(line_no_) + ", column '" +
                                             header_[*col] + "': not a number: '" + s + "'");
    }
    return v;
  }

  CivilDate date(std::size_t col) const {
    const std::string s = col < fields_.size() ? trim(fields_[col]) : std::string();
    // Accept "YYYY-MM-DD" and timestamps starting with it.
    auto d = CivilDate::parse(std::string_view(s).substr(0, 10));
    if (!d || (s.size() > 10 && s[10] != 'T' && s[10] != ' ')) {
      CROPWATCH_THROW(ErrorCode::kParse,
                      "daily CSV line " + std::to_string(line_no_) + ": invalid date '" + s + "'");
    }
    return *d;
  }

 private:
  const std::vector<std::string>& fields_;
  std::size_t line_no_;
  const std::vector<std::string>& header_;
};

}  // namespace

std::vector<DailyRecord> read_daily_records_csv(std::istream& is, const alerts::InputConfig& cfg) {
  std::string line;
  std::size_t line_no = 0;

  // Header
  while (std::getline(is, line)) {
    ++line_no;
    if (!trim(line).empty()) break;
  }
  if (trim(line).empty()) CROPWATCH_THROW(ErrorCode::kParse, "daily CSV is empty (no header row)");
  if (!line.empty() && line.back() == '\r') line.pop_back();
  // UTF-8 BOM
  if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);

  std::vector<std::string> header = split_csv_row(line);
  ColumnMap cols;
  for (std::size_t i = 0; i < header.size(); ++i) {
    header[i] = lower(trim(header[i]));
    cols.emplace(header[i], i);  // first occurrence wins
  }
  const Layout l = resolve_layout(cols);

  std::vector<DailyRecord> rows;
  while (std::getline(is, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (trim(line).empty()) continue;

    const auto fields = split_csv_row(line);
    const RowReader r(fields, line_no, header);

    DailyRecord rec{};
    rec.date = r.date(l.date);
    rec.tmean_7d = r.number(l.tmean_7d);
    rec.tmin_7d = r.number(l.tmin_7d);
    rec.tmax_7d = r.number(l.tmax_7d);
    rec.precip_7d = r.number(l.precip_7d);
    rec.precip_1d = r.number(l.precip_1d);
    rec.rh_mean = r.number(l.rh_mean);
    rec.indices.ndvi = r.number(l.ndvi);
    rec.indices.ndmi = r.number(l.ndmi);
    rec.indices.msi = r.number(l.msi);
    rec.indices.ndre = r.number(l.ndre);
    rec.indices.evi = r.number(l.evi);
    rec.indices.gndvi = r.number(l.gndvi);
    rows.push_back(rec);
  }

  std::stable_sort(rows.begin(), rows.end(),
                   [](const DailyRecord& a, const DailyRecord& b) { return a.date < b.date; });

  std::vector<DailyRecord> out;
  out.reserve(rows.size());
  std::size_t dropped = 0;
  for (auto& r : rows) {
    if (!out.empty() && out.back().date == r.date) {
      if (cfg.duplicate_dates == alerts::DuplicateDatePolicy::Reject) {
        CROPWATCH_THROW(ErrorCode::kParse, "daily CSV has duplicate date " + r.date.to_string());
      }
      out.back() = r;  // keep_last: later row in file order wins
      ++dropped;
      continue;
    }
    out.push_back(r);
  }

  if (dropped > 0) {
    log(LogLevel::WARN, "daily_csv", "duplicate dates resolved by keep_last: " + std::to_string(dropped) + " row(s) replaced");
  }
  log(LogLevel::DEBUG, "daily_csv", "read " + std::to_string(out.size()) + " daily row(s)");
  return out;
}

std::vector<DailyRecord> read_daily_records_file(const std::string& path, const alerts::InputConfig& cfg) {
  std::ifstream f(path, std::ios::binary);
  if (!f) CROPWATCH_THROW(ErrorCode::kIo, "cannot open daily CSV: " + path);
  return read_daily_records_csv(f, cfg);
}

}  // namespace cropwatch::io
