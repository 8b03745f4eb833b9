#include "tabjson/line_decoder.hpp"

namespace tj {

LineDecoder::LineDecoder(const ReadOptions& opts, ReadStats& stats)
  : opts_(opts), stats_(stats), parser_(opts.policy) {}

LineDecoder::Outcome LineDecoder::reject(Error e) {
  if (opts_.policy.on_error == ParsePolicy::OnError::SkipLine) {
    ++stats_.skipped_lines;
    ++stats_.skipped_by_kind[e.kind];
    if (stats_.errors.size() < opts_.max_reported_errors) stats_.errors.push_back(std::move(e));
    return Outcome::Skipped;
  }
  err_ = std::move(e);
  return Outcome::Failed;
}

LineDecoder::Outcome LineDecoder::decode(const ChunkReader::Line& line, Record& out) {
  ++stats_.lines;
  if (line.oversize) {
    return reject(Error::make(ErrorKind::UnsupportedValue,
                              "line exceeds max_record_bytes (" +
                              std::to_string(opts_.chunk.max_record_bytes) + ")",
                              line.number, line.offset));
  }
  if (opts_.policy.is_blank(line.text)) {
    ++stats_.blank_lines;
    return Outcome::Skipped;
  }
  if (!parser_.parse_line(line.text, out)) {
    Error e = parser_.error();
    e.line = line.number;
    e.byte_offset = line.offset;
    return reject(std::move(e));
  }
  return Outcome::Record;
}

}
