#pragma once
#include "tabjson/error.hpp"
#include "tabjson/json_reader.hpp"
#include "tabjson/ndjson_reader.hpp"
#include "tabjson/ndjson_scanner.hpp"
#include "tabjson/read_options.hpp"
#include "tabjson/table.hpp"
#include "tabjson/table_writer.hpp"
#include <string>

namespace tj {

// One-call entry points over the reader/writer/scanner classes. Each returns
// false on failure and fills `err` when given.

bool read_json(const std::string& path, Table& out,
               const JsonReader::Config& cfg = JsonReader::Config{},
               Error* err = nullptr);

bool read_ndjson(const std::string& path, Table& out,
                 const NdjsonReader::Config& cfg = NdjsonReader::Config{},
                 Error* err = nullptr, ReadStats* stats = nullptr);

bool write_json(const Table& t, const std::string& path, Error* err = nullptr);
bool write_ndjson(const Table& t, const std::string& path, Error* err = nullptr);

// The file is opened on the first next_batch() (or open()), and again on restart().
NdjsonScanner scan_ndjson(const std::string& path,
                          NdjsonScanner::Config cfg = NdjsonScanner::Config{});

}
