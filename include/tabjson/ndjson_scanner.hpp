#pragma once
#include "tabjson/byte_source.hpp"
#include "tabjson/error.hpp"
#include "tabjson/read_options.hpp"
#include "tabjson/schema.hpp"
#include "tabjson/table.hpp"
#include <cstddef>

namespace tj {

// Lazy, forward-only batches over newline-delimited JSON.
//
//   NdjsonScanner scan(file_source_factory("events.ndjson"), cfg);
//   Table batch;
//   while (scan.next_batch(batch) == NdjsonScanner::Status::Batch) { ... }
//
// Memory is bounded by one batch plus the chunk reader's buffer (plus the
// sample in SchemaMode::Sample). The scanner keeps nothing of a batch once
// it is handed out. restart() reopens the source; there is no mid-stream
// resume.
class NdjsonScanner {
public:
  // How the schema is obtained when ReadOptions::schema is not set:
  //  Sample   - infer from the first `sample_rows` records; one pass, later
  //             records that disagree follow the ColumnBuilder rules
  //             (dropped/nulled, or SchemaMismatch in strict mode).
  //  FullScan - a first pass over the whole source infers the schema, a
  //             second pass produces batches. Always agrees with an eager read.
  enum class SchemaMode { Sample, FullScan };

  enum class Status { Batch, End, Error };

  struct Config {
    ReadOptions read;
    SchemaMode schema_mode = SchemaMode::Sample;
    std::size_t sample_rows = 100;
    std::size_t batch_size = 1024; // rows per batch
  };

  NdjsonScanner(SourceFactory factory, Config cfg);
  ~NdjsonScanner();
  NdjsonScanner(NdjsonScanner&& o) noexcept;
  NdjsonScanner& operator=(NdjsonScanner&& o) noexcept;
  NdjsonScanner(const NdjsonScanner&) = delete;
  NdjsonScanner& operator=(const NdjsonScanner&) = delete;

  // Resolve the schema; next_batch() calls this on first use. False after
  // a failure until restart().
  bool open();

  // Batch: `out` holds 1..batch_size rows. End: input exhausted (or n_rows
  // reached), `out` untouched. Error: see error(); further calls keep
  // returning Error until restart().
  Status next_batch(Table& out);

  bool restart();

  bool is_open() const noexcept;
  const Schema& schema() const noexcept;
  const ReadStats& stats() const noexcept;
  const Error& error() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
