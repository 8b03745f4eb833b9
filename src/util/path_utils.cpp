#include "tabjson/path_utils.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace tj {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

FileFormat detect_format(std::string_view path) {
  auto ext = std::filesystem::path(std::string(path)).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (ext == ".json") return FileFormat::JSON;
  if (ext == ".jsonl" || ext == ".ndjson") return FileFormat::NDJSON;
  return FileFormat::Unknown;
}

const char* format_name(FileFormat f) noexcept {
  switch (f) {
    case FileFormat::JSON:    return "json";
    case FileFormat::NDJSON:  return "ndjson";
    case FileFormat::Unknown: break;
  }
  return "unknown";
}

const char* content_type(FileFormat f) noexcept {
  switch (f) {
    case FileFormat::JSON:    return "application/json";
    case FileFormat::NDJSON:  return "application/x-ndjson";
    case FileFormat::Unknown: break;
  }
  return "application/octet-stream";
}

}
