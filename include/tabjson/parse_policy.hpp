#pragma once
#include <cstddef>
#include <optional>
#include <string_view>

namespace tj {

struct ParsePolicy {
  // Behavior when an NDJSON line fails to decode:
  // fail_fast -> abort the read; skip_line -> drop the line and count it
  enum class OnError { FailFast, SkipLine };

  // Integers that do not fit int64:
  // fail -> UnsupportedValue; as_float -> keep as float64
  enum class BigInt { Fail, AsFloat };

  OnError on_error = OnError::FailFast;
  BigInt  big_int  = BigInt::Fail;

  std::size_t max_string_bytes = 64 * 1024 * 1024; // per string value
  std::size_t max_nested_bytes = 8 * 1024 * 1024;  // raw text of one array/object

  // Parse a raw JSON number token (fast_float in .cpp). Trailing whitespace
  // is ignored; nullopt if the token is not a finite number.
  std::optional<double> parse_number(std::string_view s) const;

  // Whitespace-only lines carry no record.
  bool is_blank(std::string_view line) const noexcept;

  static std::optional<OnError> on_error_from(std::string_view s);
  static std::optional<BigInt>  big_int_from(std::string_view s);
};

}
