#ifndef MODLIST_CORE_JSON_UTILS_HPP_
#define MODLIST_CORE_JSON_UTILS_HPP_

#include "core/json_dom.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace modlist::core {

// JSON string escaping used by Serialize.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

namespace json {

namespace detail {

// JSON has no NaN/Infinity; those serialize as null.
inline std::string FormatNumber(double value) {
  if (!std::isfinite(value)) {
    return "null";
  }

  constexpr double kMaxExactInteger = 9007199254740992.0; // 2^53
  if (std::floor(value) == value && std::fabs(value) <= kMaxExactInteger) {
    return std::to_string(static_cast<std::int64_t>(value));
  }

  char buffer[64];
  const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
  if (result.ec != std::errc{}) {
    return "null";
  }
  return std::string(buffer, result.ptr);
}

inline void NewLine(std::string& out, int indent, int depth) {
  out.push_back('\n');
  out.append(static_cast<std::size_t>(indent) * static_cast<std::size_t>(depth), ' ');
}

inline void SerializeInto(const Value& value, int indent, int depth, std::string& out) {
  switch (value.type) {
  case Value::Type::kNull:
    out += "null";
    return;
  case Value::Type::kBool:
    out += value.bool_value ? "true" : "false";
    return;
  case Value::Type::kNumber:
    out += FormatNumber(value.number_value);
    return;
  case Value::Type::kString:
    out += '"';
    out += EscapeJson(value.string_value);
    out += '"';
    return;
  case Value::Type::kArray: {
    if (value.array_value.empty()) {
      out += "[]";
      return;
    }
    out.push_back('[');
    bool first = true;
    for (const Value& item : value.array_value) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      if (indent > 0) {
        NewLine(out, indent, depth + 1);
      }
      SerializeInto(item, indent, depth + 1, out);
    }
    if (indent > 0) {
      NewLine(out, indent, depth);
    }
    out.push_back(']');
    return;
  }
  case Value::Type::kObject: {
    if (value.object_value.empty()) {
      out += "{}";
      return;
    }
    out.push_back('{');
    bool first = true;
    for (const auto& [key, item] : value.object_value) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      if (indent > 0) {
        NewLine(out, indent, depth + 1);
      }
      out += '"';
      out += EscapeJson(key);
      out += indent > 0 ? "\": " : "\":";
      SerializeInto(item, indent, depth + 1, out);
    }
    if (indent > 0) {
      NewLine(out, indent, depth);
    }
    out.push_back('}');
    return;
  }
  }
}

} // namespace detail

// Renders a DOM value. indent == 0 gives compact output; otherwise each
// member/item sits on its own line, indented `indent` spaces per level.
inline std::string Serialize(const Value& value, int indent = 0) {
  std::string out;
  detail::SerializeInto(value, indent < 0 ? 0 : indent, 0, out);
  return out;
}

} // namespace json

} // namespace modlist::core

#endif // MODLIST_CORE_JSON_UTILS_HPP_
