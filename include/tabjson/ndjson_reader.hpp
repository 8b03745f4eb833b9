#pragma once
#include "tabjson/byte_source.hpp"
#include "tabjson/error.hpp"
#include "tabjson/read_options.hpp"
#include "tabjson/table.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace tj {

// Eager single-pass read of newline-delimited JSON into one Table.
class NdjsonReader {
public:
  struct Config {
    ReadOptions read;
    std::optional<std::size_t> infer_schema_length; // unset -> infer from all rows
  };

  NdjsonReader() : NdjsonReader(Config{}) {}
  explicit NdjsonReader(Config cfg) : cfg_(std::move(cfg)) {}

  bool read_file(const std::string& path, Table& out);
  bool read_string(std::string data, Table& out);
  bool read(std::unique_ptr<ByteSource> src, Table& out);

  const Error& error() const noexcept { return err_; }
  const ReadStats& stats() const noexcept { return stats_; }

private:
  Config cfg_;
  Error err_;
  ReadStats stats_;
};

}
