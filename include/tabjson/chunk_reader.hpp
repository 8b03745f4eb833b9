#pragma once
#include "tabjson/byte_source.hpp"
#include "tabjson/error.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace tj {

// Splits a byte source into lines, pulling fixed-size chunks on demand so
// memory stays bounded by chunk_bytes + max_record_bytes.
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes      = 512 * 1024;      // 512 KiB
    std::size_t max_record_bytes = 8 * 1024 * 1024; // 8 MiB guard per line
    bool        strip_cr         = true;            // trim trailing '\r' (CRLF)
  };

  struct Line {
    std::string_view text;     // valid until the next call to next_line()
    std::uint64_t number = 0;  // 1-based
    std::uint64_t offset = 0;  // byte offset of the first character
    bool oversize = false;     // longer than max_record_bytes; text is empty
  };

  explicit ChunkReader(std::unique_ptr<ByteSource> src);      // uses default Config{}
  ChunkReader(std::unique_ptr<ByteSource> src, Config cfg);   // explicit Config
  ~ChunkReader();
  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // Next line, or false at end of input / on a source failure (see failed()).
  bool next_line(Line& out);

  // Callback returns false to stop early.
  using LineCallback = std::function<bool(const Line&)>;
  bool for_each_line(const LineCallback& cb);

  bool failed() const noexcept;
  const Error& error() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t lines() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
