#include "tabjson/error.hpp"

namespace tj {

const char* error_kind_name(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::None:             return "None";
    case ErrorKind::MalformedInput:   return "MalformedInput";
    case ErrorKind::SchemaMismatch:   return "SchemaMismatch";
    case ErrorKind::UnsupportedValue: return "UnsupportedValue";
    case ErrorKind::IOFailure:        return "IOFailure";
  }
  return "Unknown";
}

void Error::clear() {
  kind = ErrorKind::None;
  message.clear();
  line = byte_offset = 0;
}

std::string Error::to_string() const {
  std::string out = error_kind_name(kind);
  if (has_position()) {
    out += " at line " + std::to_string(line) + " (byte " + std::to_string(byte_offset) + ")";
  }
  if (!message.empty()) {
    out += ": ";
    out += message;
  }
  return out;
}

Error Error::make(ErrorKind kind, std::string message,
                  std::uint64_t line, std::uint64_t byte_offset) {
  Error e;
  e.kind = kind;
  e.message = std::move(message);
  e.line = line;
  e.byte_offset = byte_offset;
  return e;
}

}
