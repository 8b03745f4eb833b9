#include "tabjson/io.hpp"
#include <iostream>
#include <string>
#include <utility>
#include <vector>

static int failures = 0;
static void check(bool cond, const std::string& what) {
  if (cond) std::cout << "[PASS] " << what << "\n";
  else { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

using Status = tj::NdjsonScanner::Status;

// Drains the scanner; returns the final status.
static Status drain(tj::NdjsonScanner& s, std::vector<std::size_t>& sizes, tj::Table& all) {
  tj::Table batch;
  Status st;
  while ((st = s.next_batch(batch)) == Status::Batch) {
    sizes.push_back(batch.num_rows());
    if (!all.append(batch)) {
      std::cerr << "[ERR] batches disagree on columns\n";
      return Status::Error;
    }
  }
  return st;
}

static tj::NdjsonScanner scanner_for(const std::string& text, tj::NdjsonScanner::Config cfg) {
  return tj::NdjsonScanner(tj::memory_source_factory(text), std::move(cfg));
}

int main() {
  const std::string three = "{\"a\":1}\n{\"a\":2}\n{\"a\":3}\n";

  // batches of 2 concatenate to the eager read
  {
    tj::NdjsonScanner::Config cfg;
    cfg.batch_size = 2;
    auto s = scanner_for(three, cfg);
    std::vector<std::size_t> sizes;
    tj::Table all;
    check(drain(s, sizes, all) == Status::End, "scan ends cleanly");
    check(sizes == std::vector<std::size_t>({2, 1}), "batch sizes [2,1]");

    tj::NdjsonReader r;
    tj::Table eager;
    check(r.read_string(three, eager) && all == eager, "batches equal a single-pass read");
    check(s.stats().rows == 3 && s.stats().lines == 3, "scan counters");

    tj::Table untouched;
    check(s.next_batch(untouched) == Status::End && untouched.empty(), "End repeats after exhaustion");

    check(s.restart(), "restart");
    sizes.clear();
    tj::Table again;
    check(drain(s, sizes, again) == Status::End && again == eager, "restart replays the source");
  }

  // sample vs full schema
  const std::string late = "{\"a\":1}\n{\"a\":2,\"b\":\"x\"}\n{\"a\":3}\n";
  {
    tj::NdjsonScanner::Config cfg;
    cfg.sample_rows = 1;
    auto s = scanner_for(late, cfg);
    std::vector<std::size_t> sizes;
    tj::Table all;
    check(drain(s, sizes, all) == Status::End, "sample scan");
    check(all.num_columns() == 1 && s.stats().dropped_fields == 1, "sample misses the late key");

    cfg.schema_mode = tj::NdjsonScanner::SchemaMode::FullScan;
    auto f = scanner_for(late, cfg);
    tj::Table full;
    sizes.clear();
    check(drain(f, sizes, full) == Status::End, "full scan");
    tj::NdjsonReader r;
    tj::Table eager;
    check(r.read_string(late, eager) && full == eager, "full scan agrees with eager read");
    check(f.schema().to_string() == "{a: int64, b: str?}", "full schema: " + f.schema().to_string());

    cfg.schema_mode = tj::NdjsonScanner::SchemaMode::Sample;
    cfg.read.strict = true;
    cfg.batch_size = 1;
    auto st = scanner_for(late, cfg);
    tj::Table b;
    check(st.next_batch(b) == Status::Batch, "strict: first batch");
    check(st.next_batch(b) == Status::Error && st.error().kind == tj::ErrorKind::SchemaMismatch &&
          st.error().line == 2, "strict: late key fails at its line");
  }

  // n_rows
  {
    tj::NdjsonScanner::Config cfg;
    cfg.batch_size = 2;
    cfg.read.n_rows = 3;
    auto s = scanner_for("{\"a\":1}\n{\"a\":2}\n{\"a\":3}\n{\"a\":4}\n{\"a\":5}\n", cfg);
    std::vector<std::size_t> sizes;
    tj::Table all;
    check(drain(s, sizes, all) == Status::End && sizes == std::vector<std::size_t>({2, 1}), "n_rows caps the scan");
  }

  // mid-stream errors
  const std::string bad = "{\"a\":1}\n{\"a\":2}\nnot json\n{\"a\":4}\n";
  {
    tj::NdjsonScanner::Config cfg;
    cfg.batch_size = 1;
    cfg.sample_rows = 1;
    auto s = scanner_for(bad, cfg);
    tj::Table b;
    check(s.next_batch(b) == Status::Batch && s.next_batch(b) == Status::Batch, "rows before the bad line");
    check(s.next_batch(b) == Status::Error, "bad line fails the scan");
    check(s.error().kind == tj::ErrorKind::MalformedInput && s.error().line == 3 && s.error().byte_offset == 16,
          "error position: " + s.error().to_string());
    check(s.next_batch(b) == Status::Error, "error is sticky");
    check(!s.open() && s.error().line == 3, "open reports the sticky error");
    check(s.restart() && s.open() && s.next_batch(b) == Status::Batch, "restart clears the error");

    cfg.read.policy.on_error = tj::ParsePolicy::OnError::SkipLine;
    auto k = scanner_for(bad, cfg);
    std::vector<std::size_t> sizes;
    tj::Table all;
    check(drain(k, sizes, all) == Status::End && all.num_rows() == 3, "skip-line scan");
    check(k.stats().skipped_lines == 1 && k.stats().errors.size() == 1 && k.stats().errors[0].line == 3,
          "skipped line reported");
  }

  // empty input and missing files
  {
    auto s = scanner_for("", tj::NdjsonScanner::Config{});
    tj::Table b;
    check(s.next_batch(b) == Status::End && s.schema().empty(), "empty input ends at once");

    auto m = tj::scan_ndjson("tests/data/does_not_exist.ndjson");
    check(!m.open() && m.error().kind == tj::ErrorKind::IOFailure, "missing file is IOFailure");
    check(m.next_batch(b) == Status::Error, "missing file scan reports Error");

    auto moved = std::move(s);
    check(moved.next_batch(b) == Status::End, "moved scanner keeps its state");
  }

  if (failures) { std::cerr << failures << " failure(s)\n"; return 1; }
  return 0;
}
