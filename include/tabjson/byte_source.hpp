#pragma once
#include "tabjson/error.hpp"
#include <cstddef>
#include <cstdio>
#include <functional>
#include <memory>
#include <string>

namespace tj {

// Scoped input: acquired on construction, released in the destructor.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Read up to `n` bytes into `dst`; 0 means end of input (or failure, see failed()).
  virtual std::size_t read(char* dst, std::size_t n) = 0;
  virtual bool failed() const noexcept = 0;
  virtual std::string name() const = 0;
};

class FileSource : public ByteSource {
public:
  explicit FileSource(std::string path);
  ~FileSource() override;
  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  bool is_open() const noexcept { return f_ != nullptr; }
  int last_errno() const noexcept { return errno_; }

  std::size_t read(char* dst, std::size_t n) override;
  bool failed() const noexcept override { return errno_ != 0; }
  std::string name() const override { return path_; }

private:
  std::string path_;
  std::FILE* f_{nullptr};
  int errno_{0};
};

class MemorySource : public ByteSource {
public:
  explicit MemorySource(std::string data);
  explicit MemorySource(std::shared_ptr<const std::string> data);

  std::size_t read(char* dst, std::size_t n) override;
  bool failed() const noexcept override { return false; }
  std::string name() const override { return "<memory>"; }

private:
  std::shared_ptr<const std::string> data_;
  std::size_t pos_{0};
};

// Opens `path`; on failure returns nullptr and sets `err` to IOFailure.
std::unique_ptr<ByteSource> open_file_source(const std::string& path, Error& err);

// Produces a fresh source per call so multi-pass readers can restart.
using SourceFactory = std::function<std::unique_ptr<ByteSource>(Error&)>;

SourceFactory file_source_factory(std::string path);
SourceFactory memory_source_factory(std::string data);

}
