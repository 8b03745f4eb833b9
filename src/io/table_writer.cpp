#include "tabjson/table_writer.hpp"
#include "tabjson/json_text.hpp"
#include "tabjson/path_utils.hpp"
#include <simdjson.h>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <sstream>

namespace tj {

std::optional<JsonFormat> json_format_from(std::string_view s) {
  if (s == "json" || s == "array") return JsonFormat::Array;
  if (s == "ndjson" || s == "jsonl" || s == "lines") return JsonFormat::Lines;
  return std::nullopt;
}

static Error cell_error(const Column& col, std::size_t row, const char* what) {
  return Error::make(ErrorKind::UnsupportedValue,
                     "column \"" + col.name() + "\" row " + std::to_string(row) + ": " + what);
}

bool TableWriter::encode_row(const Table& t, std::size_t row, std::string& buf) {
  buf += '{';
  for (std::size_t c = 0; c < t.num_columns(); ++c) {
    if (c) buf += ',';
    buf += keys_[c];
    const Column& col = t.column(c);
    if (col.is_null(row)) { buf += "null"; continue; }
    const Value v = col.at(row);
    switch (v.type()) {
      case DataType::Null:   buf += "null"; break;
      case DataType::Bool:   buf += v.as_bool() ? "true" : "false"; break;
      case DataType::Int:    buf += std::to_string(v.as_int()); break;
      case DataType::Float:
        if (!std::isfinite(v.as_float())) {
          err_ = cell_error(col, row, "non-finite float has no JSON form");
          return false;
        }
        buf += format_double(v.as_float());
        break;
      case DataType::String:
        if (!simdjson::validate_utf8(v.as_string())) {
          err_ = cell_error(col, row, "string is not valid UTF-8");
          return false;
        }
        append_json_string(buf, v.as_string());
        break;
      case DataType::Nested: {
        // Minified so each NDJSON record stays on one line.
        const std::string& raw = v.as_string();
        if (!simdjson::validate_utf8(raw)) {
          err_ = cell_error(col, row, "nested text is not valid UTF-8");
          return false;
        }
        const std::size_t at = buf.size();
        buf.resize(at + raw.size());
        std::size_t len = 0;
        if (simdjson::minify(raw.data(), raw.size(), &buf[at], len) != simdjson::SUCCESS) {
          err_ = cell_error(col, row, "nested text is not JSON");
          return false;
        }
        buf.resize(at + len);
        break;
      }
    }
  }
  buf += '}';
  return true;
}

bool TableWriter::write(const Table& t, std::ostream& out) {
  err_.clear();
  bytes_ = 0;

  keys_.clear();
  keys_.reserve(t.num_columns());
  for (const auto& col : t.columns()) {
    if (!simdjson::validate_utf8(col.name())) {
      err_ = Error::make(ErrorKind::UnsupportedValue, "column name is not valid UTF-8");
      return false;
    }
    std::string k;
    append_json_string(k, col.name());
    k += ':';
    keys_.push_back(std::move(k));
  }

  std::string buf;
  buf.reserve(cfg_.flush_bytes + 1024);
  auto flush = [&]() {
    out.write(buf.data(), static_cast<std::streamsize>(buf.size()));
    if (!out) {
      err_ = Error::make(ErrorKind::IOFailure, "write to output failed");
      return false;
    }
    bytes_ += buf.size();
    buf.clear();
    return true;
  };

  const bool array = cfg_.format == JsonFormat::Array;
  if (array) buf += '[';
  for (std::size_t r = 0; r < t.num_rows(); ++r) {
    if (array && r) buf += ',';
    if (!encode_row(t, r, buf)) return false;
    if (!array) buf += '\n';
    if (buf.size() >= cfg_.flush_bytes && !flush()) return false;
  }
  if (array) buf += ']';
  if (!flush()) return false;

  out.flush();
  if (!out) {
    err_ = Error::make(ErrorKind::IOFailure, "flush of output failed");
    return false;
  }
  return true;
}

bool TableWriter::write_string(const Table& t, std::string& out) {
  std::ostringstream ss;
  if (!write(t, ss)) return false;
  out = ss.str();
  return true;
}

bool TableWriter::write_file(const Table& t, const std::string& path) {
  err_.clear();
  const std::filesystem::path p(path);
  if (!ensure_parent_dirs(p)) {
    err_ = Error::make(ErrorKind::IOFailure, "cannot create parent directories of " + path);
    return false;
  }

  bool ok = false;
  {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out) {
      err_ = Error::make(ErrorKind::IOFailure, "cannot open " + path + " for writing");
      return false;
    }
    ok = write(t, out);
    if (ok) {
      out.close();
      if (!out) {
        err_ = Error::make(ErrorKind::IOFailure, "close of " + path + " failed");
        ok = false;
      }
    }
  }
  if (!ok) {
    std::error_code ec;
    std::filesystem::remove(p, ec);
    if (err_.message.find(path) == std::string::npos) err_.message += " (" + path + ")";
  }
  return ok;
}

}
