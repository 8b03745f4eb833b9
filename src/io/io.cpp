#include "tabjson/io.hpp"
#include <utility>

namespace tj {

namespace {

bool write_as(const Table& t, const std::string& path, JsonFormat fmt, Error* err) {
  TableWriter::Config cfg;
  cfg.format = fmt;
  TableWriter w(cfg);
  if (w.write_file(t, path)) return true;
  if (err) *err = w.error();
  return false;
}

}

bool read_json(const std::string& path, Table& out,
               const JsonReader::Config& cfg, Error* err) {
  JsonReader r(cfg);
  if (r.read_file(path, out)) return true;
  if (err) *err = r.error();
  return false;
}

bool read_ndjson(const std::string& path, Table& out,
                 const NdjsonReader::Config& cfg, Error* err, ReadStats* stats) {
  NdjsonReader r(cfg);
  const bool ok = r.read_file(path, out);
  if (stats) *stats = r.stats();
  if (!ok && err) *err = r.error();
  return ok;
}

bool write_json(const Table& t, const std::string& path, Error* err) {
  return write_as(t, path, JsonFormat::Array, err);
}

bool write_ndjson(const Table& t, const std::string& path, Error* err) {
  return write_as(t, path, JsonFormat::Lines, err);
}

NdjsonScanner scan_ndjson(const std::string& path, NdjsonScanner::Config cfg) {
  return NdjsonScanner(file_source_factory(path), std::move(cfg));
}

}
