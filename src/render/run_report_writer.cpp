#include "tabjson/run_report.hpp"
#include "tabjson/json_text.hpp"
#include <algorithm>
#include <cmath> // std::isfinite
#include <sstream>

namespace tj {

static void esc(std::ostringstream& o, const std::string& s){
  std::string q;
  append_json_string(q, s);
  o << q;
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

void RunReport::fill_from(const RunStats& s, double wall_ms) {
  rows = s.rows;
  bytes = s.bytes;
  batches = s.batches;
  skipped_lines = s.skipped_lines;
  wall_time_ms = wall_ms;
  throughput_mb_s = s.throughput_mb_s;
  rows_per_sec = s.rows_per_sec;

  stage_times.clear();
  for (auto& st : s.stages) stage_times.emplace_back(st.name, st.duration_ms);

  // Sorted so the report is stable across runs.
  errors_by_kind.assign(s.errors_by_kind.begin(), s.errors_by_kind.end());
  std::sort(errors_by_kind.begin(), errors_by_kind.end());
}

std::string RunReportWriter::to_json(const RunReport& r) {
  std::ostringstream o;
  o << "{";
  o << "\"ok\":" << (r.ok ? "true" : "false") << ",";
  o << "\"mode\":"; esc(o, r.mode); o << ",";
  o << "\"rows\":" << r.rows << ",";
  o << "\"bytes\":" << r.bytes << ",";
  o << "\"batches\":" << r.batches << ",";
  o << "\"wall_time_ms\":" << safe_num(r.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(r.throughput_mb_s) << ",";
  o << "\"rows_per_sec\":" << safe_num(r.rows_per_sec) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<r.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, r.stage_times[i].first);
    o << ",\"duration_ms\":" << safe_num(r.stage_times[i].second) << "}";
  }
  o << "],";

  o << "\"errors_by_kind\":{";
  for (size_t i=0;i<r.errors_by_kind.size();++i){
    if (i) o << ",";
    esc(o, r.errors_by_kind[i].first); o << ":" << r.errors_by_kind[i].second;
  }
  o << "},";
  o << "\"skipped_lines\":" << r.skipped_lines << ",";

  o << "\"error_samples\":[";
  for (size_t i=0;i<r.error_samples.size();++i){
    if (i) o << ",";
    esc(o, r.error_samples[i]);
  }
  o << "],";
  o << "\"error\":"; esc(o, r.error); o << ",";

  o << "\"schema\":[";
  for (size_t i=0;i<r.schema.size();++i){
    if (i) o << ",";
    const auto& f = r.schema.field(i);
    o << "{\"name\":"; esc(o, f.name);
    o << ",\"type\":"; esc(o, type_name(f.type));
    o << ",\"nullable\":" << (f.nullable ? "true" : "false") << "}";
  }
  o << "],";

  o << "\"input\":";         esc(o, r.input);         o << ",";
  o << "\"input_format\":";  esc(o, r.input_format);  o << ",";
  o << "\"content_type\":";  esc(o, r.content_type);  o << ",";
  o << "\"input_size\":" << r.input_size << ",";
  o << "\"output\":";        esc(o, r.output);        o << ",";
  o << "\"output_format\":"; esc(o, r.output_format);

  o << "}";
  return o.str();
}

}
