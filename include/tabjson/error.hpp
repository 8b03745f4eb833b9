#pragma once
#include <cstdint>
#include <string>

namespace tj {

enum class ErrorKind {
  None,
  MalformedInput,    // JSON syntax violation or non-object row
  SchemaMismatch,    // strict-mode key/type conflict
  UnsupportedValue,  // value outside representable range (big ints, caps, non-finite)
  IOFailure          // source/sink unavailable
};

const char* error_kind_name(ErrorKind k) noexcept;

struct Error {
  ErrorKind kind = ErrorKind::None;
  std::string message;
  std::uint64_t line = 0;         // 1-based; 0 when no input position applies
  std::uint64_t byte_offset = 0;  // offset of the offending line/element in the input

  bool ok() const noexcept { return kind == ErrorKind::None; }
  bool has_position() const noexcept { return line != 0; }
  void clear();

  // "MalformedInput at line 3 (byte 18): ..."
  std::string to_string() const;

  static Error make(ErrorKind kind, std::string message,
                    std::uint64_t line = 0, std::uint64_t byte_offset = 0);
};

}
