#pragma once
#include <string>
#include <string_view>

namespace tj {

// Appends `s` as a quoted JSON string (RFC 8259 escapes; UTF-8 passes through).
void append_json_string(std::string& out, std::string_view s);

}
