#pragma once
#include "tabjson/metrics.hpp"
#include "tabjson/schema.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tj {

struct RunReport {
  // Top-level KPIs
  std::uint64_t rows = 0;
  std::uint64_t bytes = 0;
  std::uint64_t batches = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double rows_per_sec = 0.0;

  // Stages and errors
  std::vector<std::pair<std::string, double>> stage_times;
  std::vector<std::pair<std::string, std::uint64_t>> errors_by_kind;
  std::uint64_t skipped_lines = 0;
  std::vector<std::string> error_samples; // Error::to_string() of reported errors
  bool ok = true;
  std::string error;

  // Input/output metadata
  std::string input;
  std::string input_format;
  std::string content_type;
  std::string output;
  std::string output_format;
  std::uint64_t input_size = 0;
  std::string mode; // "read" | "scan"

  Schema schema;

  // Copies counters and stage times out of a metrics snapshot.
  void fill_from(const RunStats& s, double wall_ms);
};

class RunReportWriter {
public:
  // Serialize report to a compact JSON object.
  static std::string to_json(const RunReport& r);
};

}
