#include "tabjson/ndjson_scanner.hpp"
#include "tabjson/chunk_reader.hpp"
#include "tabjson/column_builder.hpp"
#include "tabjson/line_decoder.hpp"
#include "tabjson/schema_inference.hpp"
#include <algorithm>
#include <deque>
#include <memory>
#include <utility>

namespace tj {

namespace {

enum class Pull { Record, End, Error };

Pull pull_record(ChunkReader& reader, LineDecoder& decoder,
                 Record& rec, RecordPos& pos, Error& err) {
  ChunkReader::Line line;
  while (reader.next_line(line)) {
    switch (decoder.decode(line, rec)) {
      case LineDecoder::Outcome::Record:
        pos = RecordPos{line.number, line.offset};
        return Pull::Record;
      case LineDecoder::Outcome::Skipped:
        continue;
      case LineDecoder::Outcome::Failed:
        err = decoder.error();
        return Pull::Error;
    }
  }
  if (reader.failed()) {
    err = reader.error();
    return Pull::Error;
  }
  return Pull::End;
}

}

struct NdjsonScanner::Impl {
  SourceFactory factory;
  Config cfg;
  Schema schema;
  ReadStats stats;
  Error err;

  std::unique_ptr<ChunkReader> reader;
  std::unique_ptr<LineDecoder> decoder; // refers to cfg.read and stats
  std::deque<std::pair<Record, RecordPos>> pending; // sampled, not yet emitted

  bool opened{false};
  bool exhausted{false};
  bool failed{false};
  std::uint64_t emitted{0};

  Impl(SourceFactory f, Config c) : factory(std::move(f)), cfg(std::move(c)) {}

  std::size_t row_limit() const {
    return cfg.read.n_rows ? static_cast<std::size_t>(*cfg.read.n_rows) : static_cast<std::size_t>(-1);
  }

  bool open_reader() {
    Error e;
    auto src = factory ? factory(e) : nullptr;
    if (!src) {
      err = e.ok() ? Error::make(ErrorKind::IOFailure, "no input source") : e;
      return false;
    }
    reader = std::make_unique<ChunkReader>(std::move(src), cfg.read.chunk);
    decoder = std::make_unique<LineDecoder>(cfg.read, stats);
    return true;
  }

  void release() {
    if (reader) stats.bytes = reader->bytes_read();
    decoder.reset();
    reader.reset();
  }

  // First pass of SchemaMode::FullScan; its counters are not kept.
  bool infer_full(SchemaInferencer& inf) {
    Error e;
    auto src = factory ? factory(e) : nullptr;
    if (!src) {
      err = e.ok() ? Error::make(ErrorKind::IOFailure, "no input source") : e;
      return false;
    }
    ReadStats pass_stats;
    ChunkReader r(std::move(src), cfg.read.chunk);
    LineDecoder d(cfg.read, pass_stats);
    Record rec;
    RecordPos pos;
    const std::size_t limit = row_limit();
    for (std::size_t n = 0; n < limit; ++n) {
      Pull p = pull_record(r, d, rec, pos, err);
      if (p == Pull::Error) return false;
      if (p == Pull::End) break;
      inf.observe(rec);
    }
    return true;
  }

  bool open() {
    release();
    err.clear();
    stats.clear();
    pending.clear();
    emitted = 0;
    exhausted = failed = opened = false;

    SchemaInferencer inf(SchemaInferencer::Config{cfg.read.promote_int_to_float});
    if (cfg.read.schema) {
      schema = *cfg.read.schema;
      if (!open_reader()) return fail();
    } else if (cfg.schema_mode == SchemaMode::FullScan) {
      if (!infer_full(inf)) return fail();
      schema = inf.schema();
      if (!open_reader()) return fail();
    } else {
      if (!open_reader()) return fail();
      const std::size_t want = std::min(std::max<std::size_t>(cfg.sample_rows, 1), row_limit());
      while (pending.size() < want) {
        Record rec;
        RecordPos pos;
        Pull p = pull_record(*reader, *decoder, rec, pos, err);
        if (p == Pull::Error) return fail();
        if (p == Pull::End) { exhausted = true; break; }
        inf.observe(rec);
        pending.emplace_back(std::move(rec), pos);
      }
      schema = inf.schema();
    }
    opened = true;
    return true;
  }

  bool fail() {
    failed = true;
    release();
    return false;
  }

  Status next(Table& out) {
    if (failed) return Status::Error;
    if (!opened && !open()) return Status::Error;

    ColumnBuilder builder(schema, ColumnBuilder::Config{cfg.read.strict, cfg.read.promote_int_to_float});
    const std::size_t batch = std::max<std::size_t>(cfg.batch_size, 1);
    const std::size_t limit = row_limit();

    while (builder.rows() < batch && emitted + builder.rows() < limit) {
      Record rec;
      RecordPos pos;
      if (!pending.empty()) {
        rec = std::move(pending.front().first);
        pos = pending.front().second;
        pending.pop_front();
      } else if (exhausted || !reader) {
        break;
      } else {
        Pull p = pull_record(*reader, *decoder, rec, pos, err);
        if (p == Pull::Error) { fail(); return Status::Error; }
        if (p == Pull::End) { exhausted = true; break; }
      }
      if (!builder.append(rec)) {
        err = builder.error();
        err.line = pos.line;
        err.byte_offset = pos.offset;
        fail();
        return Status::Error;
      }
    }

    if (builder.rows() == 0) {
      release();
      return Status::End;
    }
    stats.rows += builder.rows();
    stats.dropped_fields += builder.dropped_fields();
    stats.nulled_values += builder.nulled_values();
    if (reader) stats.bytes = reader->bytes_read();
    emitted += builder.rows();
    out = builder.finish();
    return Status::Batch;
  }
};

NdjsonScanner::NdjsonScanner(SourceFactory factory, Config cfg)
  : p_(new Impl(std::move(factory), std::move(cfg))) {}

NdjsonScanner::~NdjsonScanner() { delete p_; }

NdjsonScanner::NdjsonScanner(NdjsonScanner&& o) noexcept : p_(std::exchange(o.p_, nullptr)) {}

NdjsonScanner& NdjsonScanner::operator=(NdjsonScanner&& o) noexcept {
  if (this != &o) {
    delete p_;
    p_ = std::exchange(o.p_, nullptr);
  }
  return *this;
}

bool NdjsonScanner::open() {
  if (p_->failed) return false;
  return p_->opened || p_->open();
}
NdjsonScanner::Status NdjsonScanner::next_batch(Table& out) { return p_->next(out); }
bool NdjsonScanner::restart() { return p_->open(); }

bool NdjsonScanner::is_open() const noexcept { return p_->opened; }
const Schema& NdjsonScanner::schema() const noexcept { return p_->schema; }
const ReadStats& NdjsonScanner::stats() const noexcept { return p_->stats; }
const Error& NdjsonScanner::error() const noexcept { return p_->err; }

}
