#pragma once
#include "tabjson/chunk_reader.hpp"
#include "tabjson/error.hpp"
#include "tabjson/read_options.hpp"
#include "tabjson/record.hpp"
#include "tabjson/record_parser.hpp"

namespace tj {

// Turns NDJSON lines into records and applies the per-line error policy,
// keeping the counters in ReadStats.
class LineDecoder {
public:
  enum class Outcome { Record, Skipped, Failed };

  LineDecoder(const ReadOptions& opts, ReadStats& stats);

  Outcome decode(const ChunkReader::Line& line, Record& out);

  // Set when decode() returned Failed.
  const Error& error() const { return err_; }

private:
  Outcome reject(Error e);

  const ReadOptions& opts_;
  ReadStats& stats_;
  RecordParser parser_;
  Error err_;
};

}
