#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace tj {

enum class FileFormat { JSON, NDJSON, Unknown };

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Guess format from extension (.json | .jsonl | .ndjson), case-insensitive.
FileFormat detect_format(std::string_view path);

const char* format_name(FileFormat f) noexcept;

// Content type used in run reports.
const char* content_type(FileFormat f) noexcept;

}
