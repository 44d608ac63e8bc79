#ifndef COMFYTEST_CORE_JSON_UTILS_HPP_
#define COMFYTEST_CORE_JSON_UTILS_HPP_

#include "core/json_dom.hpp"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace comfytest::core {

// Shared JSON string escaping for report/event/prompt writers.
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

inline std::string QuoteJson(std::string_view input) {
  return "\"" + EscapeJson(input) + "\"";
}

// Integral values print without a fraction so seeds and step counts survive a
// round trip through the host unchanged. Non-finite values become null.
inline std::string FormatJsonNumber(double value) {
  if (!std::isfinite(value)) {
    return "null";
  }
  if (std::floor(value) == value && std::fabs(value) < 9.007199254740992e15) {
    std::ostringstream out;
    out << static_cast<long long>(value);
    return out.str();
  }
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.17g", value);
  return buffer;
}

// Compact serializer; object members are emitted in stored order.
inline void SerializeJson(const json::Value& value, std::ostringstream& out) {
  switch (value.type) {
  case json::Value::Type::kObject: {
    out << '{';
    bool first = true;
    for (const auto& [key, member] : value.object_value) {
      if (!first) {
        out << ',';
      }
      first = false;
      out << QuoteJson(key) << ':';
      SerializeJson(member, out);
    }
    out << '}';
    break;
  }
  case json::Value::Type::kArray: {
    out << '[';
    for (std::size_t i = 0; i < value.array_value.size(); ++i) {
      if (i != 0U) {
        out << ',';
      }
      SerializeJson(value.array_value[i], out);
    }
    out << ']';
    break;
  }
  case json::Value::Type::kString:
    out << QuoteJson(value.string_value);
    break;
  case json::Value::Type::kNumber:
    out << FormatJsonNumber(value.number_value);
    break;
  case json::Value::Type::kBool:
    out << (value.bool_value ? "true" : "false");
    break;
  case json::Value::Type::kNull:
    out << "null";
    break;
  }
}

inline std::string SerializeJson(const json::Value& value) {
  std::ostringstream out;
  SerializeJson(value, out);
  return out.str();
}

} // namespace comfytest::core

#endif // COMFYTEST_CORE_JSON_UTILS_HPP_
