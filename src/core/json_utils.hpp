#ifndef RESILAB_CORE_JSON_UTILS_HPP_
#define RESILAB_CORE_JSON_UTILS_HPP_

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace resilab::core {

// Shared JSON string escaping for artifact, window-log and event writers.
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

// JSON has no NaN/Infinity; those serialize as null so readers fail loudly on
// the field instead of on the whole document.
inline std::string FormatJsonNumber(double value) {
  if (!std::isfinite(value)) {
    return "null";
  }
  std::ostringstream out;
  out << std::setprecision(12) << value;
  return out.str();
}

// Fixed-point rendering for Markdown/CSV tables.
inline std::string FormatFixedDouble(double value, int precision) {
  if (!std::isfinite(value)) {
    return "n/a";
  }
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

inline std::string FormatJsonStringArray(const std::vector<std::string>& values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0U) {
      out += ',';
    }
    out += QuoteJson(values[i]);
  }
  out += ']';
  return out;
}

} // namespace resilab::core

#endif // RESILAB_CORE_JSON_UTILS_HPP_
