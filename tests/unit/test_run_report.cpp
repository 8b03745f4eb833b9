#include "tabjson/metrics.hpp"
#include "tabjson/run_report.hpp"
#include <simdjson.h>
#include <iostream>
#include <string>

static int failures = 0;
static void check(bool cond, const std::string& what) {
  if (cond) std::cout << "[PASS] " << what << "\n";
  else { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

int main() {
  tj::MetricsRegistry m;
  m.start_stage("read");
  m.end_stage("read");
  m.start_stage("write");
  m.end_stage("write");
  m.start_stage("read");
  m.end_stage("read");
  m.end_stage("never-started");
  m.add_rows(3);
  m.add_bytes(2 * 1024 * 1024);
  m.add_batch();
  m.add_skipped(2);
  m.add_error(tj::ErrorKind::MalformedInput, 2);
  m.add_error(tj::ErrorKind::IOFailure);
  m.add_error(tj::ErrorKind::None);

  tj::RunStats st = m.snapshot(1000.0);
  check(st.rows == 3 && st.bytes == 2 * 1024 * 1024 && st.batches == 1 && st.skipped_lines == 2, "counters");
  check(st.stages.size() == 2 && st.stages[0].name == "read" && st.stages[1].name == "write",
        "stages in first-start order");
  check(st.throughput_mb_s == 2.0 && st.rows_per_sec == 3.0, "rates over one second");
  check(st.errors_by_kind.size() == 2 && st.errors_by_kind.at("MalformedInput") == 2, "errors by kind");
  check(m.snapshot(0.0).throughput_mb_s == 0.0, "zero wall time gives zero rate");

  tj::RunReport rep;
  rep.fill_from(st, 1000.0);
  rep.mode = "read";
  rep.input = "in \"quoted\".ndjson";
  rep.input_format = "ndjson";
  rep.schema = *tj::Schema::from_fields({tj::Field{"foo", tj::DataType::Int, false},
                                         tj::Field{"bar", tj::DataType::String, true}});
  rep.error_samples.push_back("MalformedInput at line 2 (byte 8): x");

  const std::string json = tj::RunReportWriter::to_json(rep);
  simdjson::dom::parser parser;
  simdjson::dom::element doc;
  auto err = parser.parse(json).get(doc);
  check(!err, "report is valid JSON: " + json);
  if (!err) {
    std::uint64_t rows = 0;
    check(!doc["rows"].get(rows) && rows == 3, "rows");
    std::string_view input;
    check(!doc["input"].get(input) && input == "in \"quoted\".ndjson", "input escaped");
    std::uint64_t malformed = 0;
    check(!doc["errors_by_kind"]["MalformedInput"].get(malformed) && malformed == 2, "errors_by_kind");
    simdjson::dom::array schema;
    check(!doc["schema"].get(schema) && schema.size() == 2, "schema array");
    std::string_view type;
    bool nullable = false;
    check(!schema.at(1)["type"].get(type) && type == "str" &&
          !schema.at(1)["nullable"].get(nullable) && nullable, "schema field types");
    bool ok = false;
    check(!doc["ok"].get(ok) && ok, "ok flag");
    simdjson::dom::array stages;
    check(!doc["stage_times"].get(stages) && stages.size() == 2, "stage times");
  }

  if (failures) { std::cerr << failures << " failure(s)\n"; return 1; }
  return 0;
}
