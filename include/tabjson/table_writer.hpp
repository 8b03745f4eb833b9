#pragma once
#include "tabjson/error.hpp"
#include "tabjson/table.hpp"
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tj {

enum class JsonFormat {
  Array, // [{"a":1},{"a":2}]
  Lines  // {"a":1}\n{"a":2}\n
};

// "json"/"array" -> Array; "ndjson"/"jsonl"/"lines" -> Lines
std::optional<JsonFormat> json_format_from(std::string_view s);

// Writes every row as a dense object: a null is written as `null`, never
// by leaving the key out.
class TableWriter {
public:
  struct Config {
    JsonFormat format = JsonFormat::Array;
    std::size_t flush_bytes = 64 * 1024; // buffered bytes per sink write
  };

  TableWriter() : TableWriter(Config{}) {}
  explicit TableWriter(Config cfg) : cfg_(cfg) {}

  // Creates parent directories; a failed write removes the partial file.
  bool write_file(const Table& t, const std::string& path);
  bool write(const Table& t, std::ostream& out);
  bool write_string(const Table& t, std::string& out);

  const Error& error() const noexcept { return err_; }
  std::uint64_t bytes_written() const noexcept { return bytes_; }

private:
  bool encode_row(const Table& t, std::size_t row, std::string& buf);

  Config cfg_;
  Error err_;
  std::uint64_t bytes_{0};
  std::vector<std::string> keys_; // pre-escaped "name": per column
};

}
