#pragma once
#include "tabjson/error.hpp"
#include "tabjson/parse_policy.hpp"
#include "tabjson/record.hpp"
#include <functional>
#include <string_view>

namespace tj {

// simdjson On-Demand decoding of JSON objects into Records.
// Errors from parse_line() carry no position; callers stamp the line.
class RecordParser {
public:
  using RecordCallback = std::function<bool(Record&)>; // false -> stop

  explicit RecordParser(ParsePolicy policy = {});
  ~RecordParser();
  RecordParser(const RecordParser&) = delete;
  RecordParser& operator=(const RecordParser&) = delete;

  // One NDJSON line holding exactly one JSON object.
  bool parse_line(std::string_view line, Record& out);

  // A whole document holding one top-level array of objects. Errors report
  // the line and byte offset of the element being decoded.
  bool parse_document(std::string_view text, const RecordCallback& on_record);

  const Error& error() const { return err_; }
  const ParsePolicy& policy() const;

private:
  struct Impl; Impl* p_;
  Error err_;
};

}
