#include "tabjson/record_parser.hpp"

#include <simdjson.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace tj {

static ErrorKind kind_for(simdjson::error_code ec) {
  switch (ec) {
    case simdjson::NUMBER_OUT_OF_RANGE:
    case simdjson::BIGINT_ERROR:
    case simdjson::CAPACITY:
    case simdjson::DEPTH_ERROR:
      return ErrorKind::UnsupportedValue;
    case simdjson::IO_ERROR:
      return ErrorKind::IOFailure;
    default:
      return ErrorKind::MalformedInput;
  }
}

static const char* json_type_name(simdjson::ondemand::json_type t) {
  switch (t) {
    case simdjson::ondemand::json_type::array:   return "array";
    case simdjson::ondemand::json_type::object:  return "object";
    case simdjson::ondemand::json_type::number:  return "number";
    case simdjson::ondemand::json_type::string:  return "string";
    case simdjson::ondemand::json_type::boolean: return "boolean";
    case simdjson::ondemand::json_type::null:    return "null";
    default:                                     return "unknown";
  }
}

// JSON number grammar: -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
static bool is_number_syntax(std::string_view t) {
  std::size_t i = 0;
  auto digits = [&]() {
    const std::size_t start = i;
    while (i < t.size() && t[i] >= '0' && t[i] <= '9') ++i;
    return i > start;
  };
  if (i < t.size() && t[i] == '-') ++i;
  if (i < t.size() && t[i] == '0') ++i;
  else if (!digits()) return false;
  if (i < t.size() && t[i] == '.') { ++i; if (!digits()) return false; }
  if (i < t.size() && (t[i] == 'e' || t[i] == 'E')) {
    ++i;
    if (i < t.size() && (t[i] == '+' || t[i] == '-')) ++i;
    if (!digits()) return false;
  }
  return i == t.size();
}

static std::string_view trim_token(std::string_view tok) {
  while (!tok.empty() && (tok.back() == ' ' || tok.back() == '\t' ||
                          tok.back() == '\r' || tok.back() == '\n'))
    tok.remove_suffix(1);
  return tok;
}

struct RecordParser::Impl {
  ParsePolicy policy;
  simdjson::ondemand::parser parser;
  simdjson::dom::parser nested_parser; // full validation of nested raw text
  std::string scratch;                 // padded copy of the current line

  explicit Impl(ParsePolicy p) : policy(p) {}

  bool number_error(simdjson::error_code ec, std::string_view tok, Error& err) {
    // Well-formed digits that simdjson cannot hold as a double (1e400).
    if ((ec == simdjson::NUMBER_ERROR || ec == simdjson::NUMBER_OUT_OF_RANGE) && is_number_syntax(tok)) {
      err = Error::make(ErrorKind::UnsupportedValue, "number out of range: " + std::string(tok));
    } else {
      err = Error::make(kind_for(ec), simdjson::error_message(ec));
    }
    return false;
  }

  bool read_number(simdjson::ondemand::value& v, Value& out, Error& err) {
    const std::string_view tok = trim_token(v.raw_json_token());
    simdjson::ondemand::number_type nt;
    if (auto ec = v.get_number_type().get(nt)) return number_error(ec, tok, err);
    switch (nt) {
      case simdjson::ondemand::number_type::signed_integer: {
        std::int64_t i = 0;
        if (auto ec = v.get_int64().get(i)) return number_error(ec, tok, err);
        out = Value::integer(i);
        return true;
      }
      case simdjson::ondemand::number_type::floating_point_number: {
        double d = 0;
        if (auto ec = v.get_double().get(d)) return number_error(ec, tok, err);
        out = Value::floating(d);
        return true;
      }
      case simdjson::ondemand::number_type::unsigned_integer:
      case simdjson::ondemand::number_type::big_integer:
      default:
        break;
    }
    // Integer outside int64.
    if (policy.big_int == ParsePolicy::BigInt::AsFloat) {
      if (auto d = policy.parse_number(tok)) {
        out = Value::floating(*d);
        return true;
      }
    }
    err = Error::make(ErrorKind::UnsupportedValue,
                      "integer out of int64 range: " + std::string(tok));
    return false;
  }

  bool read_value(simdjson::ondemand::value& v, Value& out, Error& err) {
    switch (v.type().value()) {
      case simdjson::ondemand::json_type::number:
        return read_number(v, out, err);
      case simdjson::ondemand::json_type::string: {
        std::string_view s = v.get_string().value();
        if (s.size() > policy.max_string_bytes) {
          err = Error::make(ErrorKind::UnsupportedValue,
                            "string of " + std::to_string(s.size()) + " bytes exceeds max_string_bytes");
          return false;
        }
        out = Value::string(std::string(s));
        return true;
      }
      case simdjson::ondemand::json_type::boolean:
        out = Value::boolean(v.get_bool().value());
        return true;
      case simdjson::ondemand::json_type::null:
        if (!v.is_null()) {
          err = Error::make(ErrorKind::MalformedInput, "invalid literal");
          return false;
        }
        out = Value::null();
        return true;
      default: {
        // arrays/objects: keep the raw text, validated in full
        std::string_view raw = v.raw_json().value();
        if (raw.size() > policy.max_nested_bytes) {
          err = Error::make(ErrorKind::UnsupportedValue,
                            "nested value of " + std::to_string(raw.size()) + " bytes exceeds max_nested_bytes");
          return false;
        }
        raw = trim_token(raw);
        auto checked = nested_parser.parse(raw.data(), raw.size());
        if (checked.error()) {
          err = Error::make(kind_for(checked.error()),
                            std::string("nested value: ") + simdjson::error_message(checked.error()));
          return false;
        }
        // Stored minified so a value never spans lines on output.
        std::string mini(raw.size(), '\0');
        std::size_t mini_len = 0;
        if (auto ec = simdjson::minify(raw.data(), raw.size(), &mini[0], mini_len)) {
          err = Error::make(kind_for(ec), std::string("nested value: ") + simdjson::error_message(ec));
          return false;
        }
        mini.resize(mini_len);
        out = Value::nested(std::move(mini));
        return true;
      }
    }
  }

  bool read_object(simdjson::ondemand::object& obj, Record& out, Error& err) {
    out.clear();
    for (auto field : obj) {
      std::string key(field.unescaped_key().value());
      simdjson::ondemand::value v = field.value();
      Value val;
      if (!read_value(v, val, err)) {
        if (!err.message.empty()) err.message = "field \"" + key + "\": " + err.message;
        return false;
      }
      out.set(std::move(key), std::move(val));
    }
    return true;
  }
};

RecordParser::RecordParser(ParsePolicy policy) : p_(new Impl(policy)) {}
RecordParser::~RecordParser() { delete p_; }

const ParsePolicy& RecordParser::policy() const { return p_->policy; }

bool RecordParser::parse_line(std::string_view line, Record& out) {
  err_.clear();
  out.clear();

  auto& scratch = p_->scratch;
  scratch.assign(line.data(), line.size());
  scratch.resize(line.size() + simdjson::SIMDJSON_PADDING, '\0');
  simdjson::padded_string_view view(scratch.data(), line.size(), scratch.size());

  try {
    simdjson::ondemand::document doc = p_->parser.iterate(view);
    auto t = doc.type().value();
    if (t != simdjson::ondemand::json_type::object) {
      err_ = Error::make(ErrorKind::MalformedInput,
                         std::string("expected a JSON object, got ") + json_type_name(t));
      return false;
    }
    simdjson::ondemand::object obj = doc.get_object();
    if (!p_->read_object(obj, out, err_)) return false;
    if (!doc.at_end()) {
      err_ = Error::make(ErrorKind::MalformedInput, "trailing content after object");
      return false;
    }
    return true;
  } catch (const simdjson::simdjson_error& e) {
    err_ = Error::make(kind_for(e.error()), simdjson::error_message(e.error()));
    return false;
  }
}

static std::uint64_t line_of(std::string_view text, std::uint64_t offset) {
  std::uint64_t line = 1;
  const std::size_t end = offset < text.size() ? static_cast<std::size_t>(offset) : text.size();
  for (std::size_t i = 0; i < end; ++i) if (text[i] == '\n') ++line;
  return line;
}

bool RecordParser::parse_document(std::string_view text, const RecordCallback& on_record) {
  err_.clear();

  simdjson::padded_string padded(text.data(), text.size());
  const char* base = padded.data();
  std::uint64_t elem_offset = 0;
  std::uint64_t index = 0;

  auto fail_at = [&](Error e) {
    e.byte_offset = elem_offset;
    e.line = line_of(text, elem_offset);
    err_ = std::move(e);
    return false;
  };

  Record rec;
  try {
    simdjson::ondemand::document doc = p_->parser.iterate(padded);
    auto t = doc.type().value();
    if (t != simdjson::ondemand::json_type::array) {
      return fail_at(Error::make(ErrorKind::MalformedInput,
                                 std::string("expected a top-level array of objects, got ") + json_type_name(t)));
    }
    simdjson::ondemand::array arr = doc.get_array();
    for (auto elem : arr) {
      simdjson::ondemand::value v = elem.value();
      auto loc = v.current_location();
      if (!loc.error()) elem_offset = static_cast<std::uint64_t>(loc.value_unsafe() - base);

      auto et = v.type().value();
      if (et != simdjson::ondemand::json_type::object) {
        return fail_at(Error::make(ErrorKind::MalformedInput,
                                   "array element " + std::to_string(index) + " is a " +
                                   json_type_name(et) + ", expected an object"));
      }
      simdjson::ondemand::object obj = v.get_object();
      Error e;
      if (!p_->read_object(obj, rec, e)) return fail_at(std::move(e));
      ++index;
      if (!on_record(rec)) return true;
    }
    if (!doc.at_end()) {
      return fail_at(Error::make(ErrorKind::MalformedInput, "trailing content after array"));
    }
    return true;
  } catch (const simdjson::simdjson_error& e) {
    return fail_at(Error::make(kind_for(e.error()), simdjson::error_message(e.error())));
  }
}

}
