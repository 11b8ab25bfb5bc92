#ifndef RUNTAPE_CORE_JSON_UTILS_HPP_
#define RUNTAPE_CORE_JSON_UTILS_HPP_

#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace runtape::core {

// Shared JSON string escaping for metadata, index records and tool payloads.
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

inline std::string ToJsonStringArray(const std::vector<std::string>& values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i != 0U) {
      out += ",";
    }
    out += QuoteJson(values[i]);
  }
  out += "]";
  return out;
}

} // namespace runtape::core

#endif // RUNTAPE_CORE_JSON_UTILS_HPP_
