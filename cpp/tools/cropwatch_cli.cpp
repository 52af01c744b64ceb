/*
  Fragment 5.1 — CropWatch Alert CLI Runner

  Objective
  ---------
  Run the composite alert pipeline end to end:
    1) Load + validate the JSON configuration (null -> unset threshold)
    2) Read the fused daily CSV (duplicate-date policy from config)
    3) Evaluate support / QC / gating / rules / assembler / merger
    4) Write 02_rs_debug.csv, 03_alerts_raw.csv, 04_alerts_gated.csv,
       05_events.csv and stage_summary.json into --out-dir
    5) Return deterministic exit codes

  Exit codes
  ----------
    0  => success
    1  => invalid arguments / IO error
    2  => configuration error
    3  => ordering error (non-monotonic or duplicate dates)
    4  => parse error (malformed CSV / JSON)

  Usage
  -----
  cropwatch_cli --config <json> --in <csv|-> --out-dir <dir> [options]

  Options
  -------
  --log-level debug|info|warn|error   Overrides logging.level from config.
  --pretty 0|1                        Pretty stage_summary.json (default 1).
*/

#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include "engine/alerts/alert_pipeline.hpp"
#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/io/alert_csv.hpp"
#include "engine/io/config_json.hpp"
#include "engine/io/daily_csv.hpp"
#include "engine/io/stage_summary_json.hpp"

namespace cropwatch {
namespace {

enum class ExitCode : int {
  kOk = 0,
  kUsageOrIo = 1,
  kConfig = 2,
  kOrdering = 3,
  kParse = 4,
};

constexpr int to_int(ExitCode c) { return static_cast<int>(c); }

struct Args {
  std::string config_path;
  std::string in_path;
  std::string out_dir;
  bool has_log_level = false;  // false -> config value
  LogLevel log_level = LogLevel::INFO;
  bool pretty = true;
};

static void print_usage(std::ostream& os) {
  os <<
    "cropwatch_cli --config <json> --in <csv|-> --out-dir <dir> [options]\n"
    "\n"
    "Options:\n"
    "  --log-level debug|info|warn|error\n"
    "  --pretty 0|1\n";
}

static bool parse_bool01(const char* s, bool* out) {
  if (!s || !out) return false;
  if (std::strcmp(s, "1") == 0) { *out = true; return true; }
  if (std::strcmp(s, "0") == 0) { *out = false; return true; }
  return false;
}

static bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

static bool parse_args(int argc, char** argv, Args* a, std::string* err, bool* help_requested) {
  if (!a) return false;

  for (int i = 1; i < argc; ++i) {
    const char* k = argv[i];

    if (std::strcmp(k, "--help") == 0 || std::strcmp(k, "-h") == 0) {
      if (help_requested) *help_requested = true;
      return true;
    }

    const char* v = nullptr;
    if (std::strcmp(k, "--config") == 0) {
      if (!get_next(i, argc, argv, &v)) { if (err) *err = "--config requires a value"; return false; }
      a->config_path = v;
      continue;
    }
    if (std::strcmp(k, "--in") == 0) {
      if (!get_next(i, argc, argv, &v)) { if (err) *err = "--in requires a value"; return false; }
      a->in_path = v;
      continue;
    }
    if (std::strcmp(k, "--out-dir") == 0) {
      if (!get_next(i, argc, argv, &v)) { if (err) *err = "--out-dir requires a value"; return false; }
      a->out_dir = v;
      continue;
    }
    if (std::strcmp(k, "--log-level") == 0) {
      if (!get_next(i, argc, argv, &v)) { if (err) *err = "--log-level requires a value"; return false; }
      if (!parse_log_level(v, &a->log_level)) { if (err) *err = "--log-level must be debug|info|warn|error"; return false; }
      a->has_log_level = true;
      continue;
    }
    if (std::strcmp(k, "--pretty") == 0) {
      if (!get_next(i, argc, argv, &v)) { if (err) *err = "--pretty requires 0|1"; return false; }
      if (!parse_bool01(v, &a->pretty)) { if (err) *err = "--pretty must be 0 or 1"; return false; }
      continue;
    }

    if (err) *err = std::string("Unknown argument: ") + k;
    return false;
  }

  if (a->config_path.empty()) { if (err) *err = "Missing --config"; return false; }
  if (a->in_path.empty()) { if (err) *err = "Missing --in"; return false; }
  if (a->out_dir.empty()) { if (err) *err = "Missing --out-dir"; return false; }
  return true;
}

static void write_artifact(const std::filesystem::path& path, const std::function<void(std::ostream&)>& body) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f.good()) CROPWATCH_THROW(ErrorCode::kIo, "cannot open for writing: " + path.string());
  body(f);
  f.flush();
  if (!f.good()) CROPWATCH_THROW(ErrorCode::kIo, "failed writing: " + path.string());
  log(LogLevel::DEBUG, "cli", "wrote " + path.string());
}

static ExitCode exit_code_for(ErrorCode c) {
  switch (c) {
    case ErrorCode::kConfig:   return ExitCode::kConfig;
    case ErrorCode::kOrdering: return ExitCode::kOrdering;
    case ErrorCode::kParse:    return ExitCode::kParse;
    case ErrorCode::kIo:       return ExitCode::kUsageOrIo;
    default:                   return ExitCode::kUsageOrIo;
  }
}

static ExitCode run(const Args& a) {
  const alerts::AlertConfig cfg = io::load_alert_config_file(a.config_path);

  set_log_level(a.has_log_level ? a.log_level : cfg.logging.level);

  std::vector<alerts::DailyRecord> records;
  if (a.in_path == "-") {
    records = io::read_daily_records_csv(std::cin, cfg.input);
  } else {
    records = io::read_daily_records_file(a.in_path, cfg.input);
  }
  log(LogLevel::INFO, "cli", "loaded " + std::to_string(records.size()) + " daily row(s)");

  const alerts::PipelineResult res = alerts::run_alert_pipeline(records, cfg);

  const std::filesystem::path out_dir(a.out_dir);
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  if (ec) CROPWATCH_THROW(ErrorCode::kIo, "cannot create output directory " + a.out_dir + ": " + ec.message());

  write_artifact(out_dir / "02_rs_debug.csv", [&](std::ostream& os) { io::write_rs_debug_csv(os, res.days); });
  write_artifact(out_dir / "03_alerts_raw.csv", [&](std::ostream& os) { io::write_alerts_csv(os, res.raw); });
  write_artifact(out_dir / "04_alerts_gated.csv", [&](std::ostream& os) { io::write_alerts_csv(os, res.gated); });
  write_artifact(out_dir / "05_events.csv", [&](std::ostream& os) { io::write_events_csv(os, res.events); });

  io::JsonWriteOptions jopt{};
  jopt.pretty = a.pretty;
  write_artifact(out_dir / "stage_summary.json",
                 [&](std::ostream& os) { io::write_stage_summary_json(os, res.summary, cfg, jopt); });

  log(LogLevel::INFO, "cli", "wrote artifacts to " + a.out_dir);
  return ExitCode::kOk;
}

}  // namespace
}  // namespace cropwatch

int main(int argc, char** argv) {
  using namespace cropwatch;

  Args a{};
  std::string arg_err;
  bool help = false;
  if (!parse_args(argc, argv, &a, &arg_err, &help)) {
    if (!arg_err.empty()) {
      std::cerr << "Argument error: " << arg_err << "\n\n";
    }
    print_usage(std::cerr);
    return to_int(ExitCode::kUsageOrIo);
  }
  if (help) {
    print_usage(std::cout);
    return to_int(ExitCode::kOk);
  }

  try {
    return to_int(run(a));
  } catch (const Error& e) {
    log(LogLevel::ERROR, "cli", e.what());
    return to_int(exit_code_for(e.code()));
  } catch (const std::exception& e) {
    log(LogLevel::ERROR, "cli", std::string("unexpected failure: ") + e.what());
    return to_int(ExitCode::kUsageOrIo);
  }
}
