#pragma once
#include "tabjson/chunk_reader.hpp"
#include "tabjson/error.hpp"
#include "tabjson/parse_policy.hpp"
#include "tabjson/record.hpp"
#include "tabjson/schema.hpp"
#include "tabjson/table.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace tj {

struct ReadOptions {
  ParsePolicy policy;                   // on_error, big_int, value caps
  bool strict = false;                  // unknown keys / type conflicts fail
  bool promote_int_to_float = false;    // Int + Float widen to Float
  std::optional<Schema> schema;         // use as-is, no inference
  std::optional<std::uint64_t> n_rows;  // stop after this many rows
  std::size_t max_reported_errors = 100;
  ChunkReader::Config chunk;
};

struct ReadStats {
  std::uint64_t lines = 0;          // lines seen (NDJSON)
  std::uint64_t blank_lines = 0;
  std::uint64_t rows = 0;           // rows placed in the output
  std::uint64_t skipped_lines = 0;  // lines dropped under OnError::SkipLine
  std::map<ErrorKind, std::uint64_t> skipped_by_kind; // sums to skipped_lines
  std::uint64_t dropped_fields = 0; // keys outside a provided/sampled schema
  std::uint64_t nulled_values = 0;  // values the column type could not hold
  std::uint64_t bytes = 0;
  std::vector<Error> errors;        // first max_reported_errors skipped-line errors

  void clear() { *this = ReadStats{}; }
};

// Input position of a materialized record, for error reports.
struct RecordPos {
  std::uint64_t line = 0;
  std::uint64_t offset = 0;
};

// Infer (unless opts.schema is set) from the first `infer_schema_length`
// records (all when unset) and build the table from every record.
bool records_to_table(const std::vector<Record>& records,
                      const std::vector<RecordPos>* positions,
                      const ReadOptions& opts,
                      std::optional<std::size_t> infer_schema_length,
                      Table& out, ReadStats& stats, Error& err);

}
