#ifndef CHAOSSCORE_CORE_JSON_UTILS_HPP_
#define CHAOSSCORE_CORE_JSON_UTILS_HPP_

#include "core/utf8_utils.hpp"

#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace chaosscore::core {

// Shared JSON string escaping for report and event writers.
// Keeping one implementation avoids subtle formatting drift across outputs.
// Invalid UTF-8 is replaced with U+FFFD so the output is always valid JSON.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : ReplaceInvalidUtf8(input)) {
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

// Fixed-point rendering for rates and scores so report diffs stay stable.
inline std::string FormatFixedDouble(double value, int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

} // namespace chaosscore::core

#endif // CHAOSSCORE_CORE_JSON_UTILS_HPP_
