#include "tabjson/byte_source.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace tj {

FileSource::FileSource(std::string path) : path_(std::move(path)) {
  f_ = std::fopen(path_.c_str(), "rb");
  if (!f_) errno_ = errno ? errno : EIO;
}

FileSource::~FileSource() {
  if (f_) std::fclose(f_);
}

std::size_t FileSource::read(char* dst, std::size_t n) {
  if (!f_ || errno_ != 0) return 0;
  std::size_t got = std::fread(dst, 1, n, f_);
  if (got == 0 && std::ferror(f_)) errno_ = errno ? errno : EIO;
  return got;
}

MemorySource::MemorySource(std::string data)
  : data_(std::make_shared<const std::string>(std::move(data))) {}

MemorySource::MemorySource(std::shared_ptr<const std::string> data)
  : data_(std::move(data)) {}

std::size_t MemorySource::read(char* dst, std::size_t n) {
  if (!data_ || pos_ >= data_->size()) return 0;
  std::size_t k = std::min(n, data_->size() - pos_);
  std::memcpy(dst, data_->data() + pos_, k);
  pos_ += k;
  return k;
}

std::unique_ptr<ByteSource> open_file_source(const std::string& path, Error& err) {
  auto src = std::make_unique<FileSource>(path);
  if (!src->is_open()) {
    err = Error::make(ErrorKind::IOFailure,
                      "cannot open " + path + ": " + std::strerror(src->last_errno()));
    return nullptr;
  }
  return src;
}

SourceFactory file_source_factory(std::string path) {
  return [path = std::move(path)](Error& err) { return open_file_source(path, err); };
}

SourceFactory memory_source_factory(std::string data) {
  auto shared = std::make_shared<const std::string>(std::move(data));
  return [shared](Error&) -> std::unique_ptr<ByteSource> {
    return std::make_unique<MemorySource>(shared);
  };
}

}
