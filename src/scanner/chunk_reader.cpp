#include "tabjson/chunk_reader.hpp"
#include <string_view>
#include <vector>

namespace tj {

struct ChunkReader::Impl {
  std::unique_ptr<ByteSource> src;
  Config cfg;
  Error err;
  std::uint64_t bytes{0};
  std::uint64_t line_no{0};

  std::string buf;            // unconsumed bytes start at `pos`
  std::size_t pos{0};
  std::size_t scan_from{0};   // no '\n' in [pos, scan_from)
  std::uint64_t buf_base{0};  // absolute offset of buf[0]
  std::vector<char> chunk;
  bool eof{false};

  bool skipping_oversize{false}; // dropping bytes until the next newline
  std::uint64_t oversize_start{0};

  Impl(std::unique_ptr<ByteSource> s, Config c) : src(std::move(s)), cfg(c) {
    if (cfg.chunk_bytes == 0) cfg.chunk_bytes = 1;
    chunk.resize(cfg.chunk_bytes);
    if (!src) {
      err = Error::make(ErrorKind::IOFailure, "no input source");
      eof = true;
    }
  }

  void emit(Line& out, std::string_view text, std::uint64_t offset) {
    if (cfg.strip_cr && !text.empty() && text.back() == '\r') text.remove_suffix(1);
    out.text = text;
    out.number = ++line_no;
    out.offset = offset;
    out.oversize = false;
  }

  void emit_oversize(Line& out) {
    out.text = {};
    out.number = ++line_no;
    out.offset = oversize_start;
    out.oversize = true;
    skipping_oversize = false;
  }

  bool fill() {
    // Compact consumed prefix before growing the buffer.
    if (pos > 0) {
      buf.erase(0, pos);
      buf_base += pos;
      scan_from -= pos;
      pos = 0;
    }
    std::size_t n = src->read(chunk.data(), chunk.size());
    if (n == 0) {
      if (src->failed()) {
        err = Error::make(ErrorKind::IOFailure, "read failed: " + src->name());
      }
      eof = true;
      return false;
    }
    bytes += n;
    buf.append(chunk.data(), n);
    return true;
  }

  bool next(Line& out) {
    if (!err.ok()) return false;
    while (true) {
      std::size_t nl = buf.find('\n', scan_from);
      if (nl != std::string::npos) {
        std::string_view text(buf.data() + pos, nl - pos);
        std::uint64_t offset = buf_base + pos;
        pos = scan_from = nl + 1;
        if (!skipping_oversize && text.size() > cfg.max_record_bytes) {
          skipping_oversize = true;
          oversize_start = offset;
        }
        if (skipping_oversize) { emit_oversize(out); return true; }
        emit(out, text, offset);
        return true;
      }
      scan_from = buf.size();

      if (eof) {
        if (skipping_oversize) { emit_oversize(out); return true; }
        if (pos < buf.size()) {
          // Final line without a trailing newline.
          std::string_view text(buf.data() + pos, buf.size() - pos);
          std::uint64_t offset = buf_base + pos;
          pos = scan_from = buf.size();
          if (text.size() > cfg.max_record_bytes) {
            oversize_start = offset;
            emit_oversize(out);
            return true;
          }
          emit(out, text, offset);
          return true;
        }
        return false;
      }

      // Unfinished line -> check guard before pulling more.
      if (skipping_oversize || buf.size() - pos > cfg.max_record_bytes) {
        if (!skipping_oversize) {
          skipping_oversize = true;
          oversize_start = buf_base + pos;
        }
        buf_base += buf.size();
        buf.clear();
        pos = scan_from = 0;
      }
      if (!fill() && !err.ok()) return false;
    }
  }
};

ChunkReader::ChunkReader(std::unique_ptr<ByteSource> src)
  : ChunkReader(std::move(src), Config{}) {}

ChunkReader::ChunkReader(std::unique_ptr<ByteSource> src, Config cfg)
  : p_(new Impl(std::move(src), cfg)) {}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::next_line(Line& out) { return p_->next(out); }

bool ChunkReader::for_each_line(const LineCallback& cb) {
  Line line;
  while (p_->next(line)) {
    if (!cb(line)) return true;
  }
  return p_->err.ok();
}

bool ChunkReader::failed() const noexcept { return !p_->err.ok(); }
const Error& ChunkReader::error() const noexcept { return p_->err; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t ChunkReader::lines() const noexcept { return p_->line_no; }

}
