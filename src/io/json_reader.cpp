#include "tabjson/json_reader.hpp"
#include "tabjson/record_parser.hpp"
#include <vector>

namespace tj {

bool JsonReader::read_file(const std::string& path, Table& out) {
  err_.clear();
  stats_.clear();
  auto src = open_file_source(path, err_);
  if (!src) return false;
  return read(std::move(src), out);
}

bool JsonReader::read(std::unique_ptr<ByteSource> src, Table& out) {
  err_.clear();
  stats_.clear();
  if (!src) {
    err_ = Error::make(ErrorKind::IOFailure, "no input source");
    return false;
  }

  std::string text;
  std::vector<char> chunk(cfg_.read.chunk.chunk_bytes ? cfg_.read.chunk.chunk_bytes : 4096);
  while (true) {
    std::size_t n = src->read(chunk.data(), chunk.size());
    if (n == 0) break;
    text.append(chunk.data(), n);
  }
  if (src->failed()) {
    err_ = Error::make(ErrorKind::IOFailure, "read failed: " + src->name());
    return false;
  }
  src.reset(); // release before the parse
  return read_string(text, out);
}

bool JsonReader::read_string(std::string_view text, Table& out) {
  err_.clear();
  stats_.clear();
  stats_.bytes = text.size();

  RecordParser parser(cfg_.read.policy);
  std::vector<Record> records;
  const auto& limit = cfg_.read.n_rows;
  if (limit && *limit == 0) {
    return records_to_table(records, nullptr, cfg_.read, cfg_.infer_schema_length,
                            out, stats_, err_);
  }

  bool ok = parser.parse_document(text, [&](Record& rec) {
    records.push_back(std::move(rec));
    return !limit || records.size() < *limit;
  });
  if (!ok) {
    err_ = parser.error();
    return false;
  }
  return records_to_table(records, nullptr, cfg_.read, cfg_.infer_schema_length,
                          out, stats_, err_);
}

}
