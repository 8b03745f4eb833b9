#include "tabjson/ndjson_reader.hpp"
#include "tabjson/chunk_reader.hpp"
#include "tabjson/line_decoder.hpp"
#include <vector>

namespace tj {

bool NdjsonReader::read_file(const std::string& path, Table& out) {
  err_.clear();
  stats_.clear();
  auto src = open_file_source(path, err_);
  if (!src) return false;
  return read(std::move(src), out);
}

bool NdjsonReader::read_string(std::string data, Table& out) {
  return read(std::make_unique<MemorySource>(std::move(data)), out);
}

bool NdjsonReader::read(std::unique_ptr<ByteSource> src, Table& out) {
  err_.clear();
  stats_.clear();

  ChunkReader reader(std::move(src), cfg_.read.chunk);
  LineDecoder decoder(cfg_.read, stats_);
  std::vector<Record> records;
  std::vector<RecordPos> positions;
  const auto& limit = cfg_.read.n_rows;

  ChunkReader::Line line;
  Record rec;
  while ((!limit || records.size() < *limit) && reader.next_line(line)) {
    switch (decoder.decode(line, rec)) {
      case LineDecoder::Outcome::Record:
        records.push_back(std::move(rec));
        positions.push_back(RecordPos{line.number, line.offset});
        break;
      case LineDecoder::Outcome::Skipped:
        break;
      case LineDecoder::Outcome::Failed:
        err_ = decoder.error();
        stats_.bytes = reader.bytes_read();
        return false;
    }
  }
  stats_.bytes = reader.bytes_read();
  if (reader.failed()) {
    err_ = reader.error();
    return false;
  }
  return records_to_table(records, &positions, cfg_.read, cfg_.infer_schema_length,
                          out, stats_, err_);
}

}
