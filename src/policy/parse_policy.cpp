#include "tabjson/parse_policy.hpp"
#include <cmath>
#include <string_view>
#include <system_error>
#include <fast_float/fast_float.h>

namespace tj {

static bool is_ws(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

std::optional<double> ParsePolicy::parse_number(std::string_view s) const {
  while (!s.empty() && is_ws(s.back())) s.remove_suffix(1);
  if (s.empty()) return std::nullopt;
  double out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  if (!std::isfinite(out)) return std::nullopt;
  return out;
}

bool ParsePolicy::is_blank(std::string_view line) const noexcept {
  for (char c : line) if (!is_ws(c)) return false;
  return true;
}

std::optional<ParsePolicy::OnError> ParsePolicy::on_error_from(std::string_view s) {
  if (s == "fail" || s == "fail_fast" || s == "fail-fast") return OnError::FailFast;
  if (s == "skip" || s == "skip_line" || s == "skip-line") return OnError::SkipLine;
  return std::nullopt;
}

std::optional<ParsePolicy::BigInt> ParsePolicy::big_int_from(std::string_view s) {
  if (s == "fail")  return BigInt::Fail;
  if (s == "float" || s == "as_float") return BigInt::AsFloat;
  return std::nullopt;
}

}
