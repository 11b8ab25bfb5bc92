#ifndef RUNTAPE_CORE_JSON_DOM_HPP_
#define RUNTAPE_CORE_JSON_DOM_HPP_

#include "core/json_utils.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace runtape::core::json {

// Minimal DOM shared by metadata readers and the tool server.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;
};

// JSON parser with line/column diagnostics. Corrupt metadata files surface
// the exact location in store errors.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  bool ParseValue(Value& value, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }
    if (++depth_ > kMaxDepth) {
      return Fail("JSON nesting is too deep", error);
    }

    bool ok = false;
    const char c = Peek();
    if (c == '{') {
      ok = ParseObject(value, error);
    } else if (c == '[') {
      ok = ParseArray(value, error);
    } else if (c == '"') {
      value.type = Value::Type::kString;
      ok = ParseString(value.string_value, error);
    } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value.type = Value::Type::kNumber;
      ok = ParseNumber(value.number_value, error);
    } else if (StartsWith("true")) {
      value.type = Value::Type::kBool;
      value.bool_value = true;
      AdvanceN(4);
      ok = true;
    } else if (StartsWith("false")) {
      value.type = Value::Type::kBool;
      value.bool_value = false;
      AdvanceN(5);
      ok = true;
    } else if (StartsWith("null")) {
      value.type = Value::Type::kNull;
      AdvanceN(4);
      ok = true;
    } else {
      ok = Fail("expected JSON value", error);
    }

    --depth_;
    return ok;
  }

  bool ParseObject(Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kObject;

    if (!ConsumeChar('{', "expected '{' to start object", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }

      SkipWhitespace();
      if (!ConsumeChar(':', "expected ':' after object key", error)) {
        return false;
      }

      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.object_value[key] = std::move(item);

      SkipWhitespace();
      if (Match('}')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between object entries", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseArray(Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kArray;

    if (!ConsumeChar('[', "expected '[' to start array", error)) {
      return false;
    }
    SkipWhitespace();

    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between array items", error)) {
        return false;
      }
    }

    return true;
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!ConsumeChar('"', "expected '\"' to start string", error)) {
      return false;
    }

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (c == '\\') {
        if (AtEnd()) {
          return Fail("unterminated escape sequence in string", error);
        }
        const char esc = Advance();
        switch (esc) {
        case '"':
        case '\\':
        case '/':
          output.push_back(esc);
          break;
        case 'b':
          output.push_back('\b');
          break;
        case 'f':
          output.push_back('\f');
          break;
        case 'n':
          output.push_back('\n');
          break;
        case 'r':
          output.push_back('\r');
          break;
        case 't':
          output.push_back('\t');
          break;
        case 'u':
          if (!ParseUnicodeEscape(output, error)) {
            return false;
          }
          break;
        default:
          return Fail("invalid escape sequence in string", error);
        }
        continue;
      }

      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      output.push_back(c);
    }

    return Fail("unterminated string literal", error);
  }

  bool ReadHex4(std::uint32_t& code, std::string& error) {
    code = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("truncated \\u escape", error);
      }
      const char h = Advance();
      code <<= 4U;
      if (h >= '0' && h <= '9') {
        code |= static_cast<std::uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code |= static_cast<std::uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code |= static_cast<std::uint32_t>(h - 'A' + 10);
      } else {
        return Fail("invalid hex digit in \\u escape", error);
      }
    }
    return true;
  }

  // Decodes \uXXXX (with surrogate pairs) into UTF-8.
  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    std::uint32_t code = 0;
    if (!ReadHex4(code, error)) {
      return false;
    }
    if (code >= 0xD800U && code <= 0xDBFFU) {
      if (!StartsWith("\\u")) {
        return Fail("unpaired high surrogate in \\u escape", error);
      }
      AdvanceN(2);
      std::uint32_t low = 0;
      if (!ReadHex4(low, error)) {
        return false;
      }
      if (low < 0xDC00U || low > 0xDFFFU) {
        return Fail("invalid low surrogate in \\u escape", error);
      }
      code = 0x10000U + ((code - 0xD800U) << 10U) + (low - 0xDC00U);
    } else if (code >= 0xDC00U && code <= 0xDFFFU) {
      return Fail("unpaired low surrogate in \\u escape", error);
    }

    if (code < 0x80U) {
      output.push_back(static_cast<char>(code));
    } else if (code < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (code >> 6U)));
      output.push_back(static_cast<char>(0x80U | (code & 0x3FU)));
    } else if (code < 0x10000U) {
      output.push_back(static_cast<char>(0xE0U | (code >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((code >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xF0U | (code >> 18U)));
      output.push_back(static_cast<char>(0x80U | ((code >> 12U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | ((code >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code & 0x3FU)));
    }
    return true;
  }

  bool ParseNumber(double& output, std::string& error) {
    const std::size_t start = pos_;

    if (Match('-')) {
      // optional sign
    }

    if (Match('0')) {
      // single leading zero
    } else {
      if (!ConsumeDigits()) {
        return Fail("expected digits in number", error);
      }
    }

    if (Match('.')) {
      if (!ConsumeDigits()) {
        return Fail("expected digits after decimal point", error);
      }
    }

    if (Match('e') || Match('E')) {
      if (Match('+') || Match('-')) {
        // exponent sign
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string text(input_.substr(start, pos_ - start));
    char* end = nullptr;
    output = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(output)) {
      return Fail("invalid numeric value", error);
    }

    return true;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool ConsumeDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count > 0U;
  }

  bool ConsumeChar(char expected, std::string_view message, std::string& error) {
    if (AtEnd() || Peek() != expected) {
      return Fail(message, error);
    }
    Advance();
    return true;
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  bool StartsWith(std::string_view token) const {
    if (pos_ + token.size() > input_.size()) {
      return false;
    }
    return input_.substr(pos_, token.size()) == token;
  }

  void AdvanceN(std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
      Advance();
    }
  }

  char Peek() const {
    return input_[pos_];
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  static constexpr int kMaxDepth = 128;

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
  int depth_ = 0;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

inline const Value* FindObjectField(const Value::Object& object, std::string_view key) {
  const auto it = object.find(std::string(key));
  if (it == object.end()) {
    return nullptr;
  }
  return &it->second;
}

// Reads an integral JSON number that fits in int64. Fractional or
// non-finite numbers are rejected.
inline bool AsInt64(const Value& value, std::int64_t& out) {
  if (value.type != Value::Type::kNumber) {
    return false;
  }
  const double number = value.number_value;
  if (!std::isfinite(number) || std::floor(number) != number ||
      number < static_cast<double>(std::numeric_limits<std::int64_t>::min()) ||
      number >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
    return false;
  }
  out = static_cast<std::int64_t>(number);
  return true;
}

inline std::string FormatNumber(double number) {
  std::int64_t integral = 0;
  Value probe;
  probe.type = Value::Type::kNumber;
  probe.number_value = number;
  if (AsInt64(probe, integral)) {
    return std::to_string(integral);
  }
  std::ostringstream out;
  out.precision(17);
  out << number;
  return out.str();
}

// Compact serializer. Object keys come out in map order.
inline std::string Serialize(const Value& value) {
  switch (value.type) {
  case Value::Type::kObject: {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, item] : value.object_value) {
      if (!first) {
        out += ",";
      }
      first = false;
      out += QuoteJson(key);
      out += ":";
      out += Serialize(item);
    }
    out += "}";
    return out;
  }
  case Value::Type::kArray: {
    std::string out = "[";
    for (std::size_t i = 0; i < value.array_value.size(); ++i) {
      if (i != 0U) {
        out += ",";
      }
      out += Serialize(value.array_value[i]);
    }
    out += "]";
    return out;
  }
  case Value::Type::kString:
    return QuoteJson(value.string_value);
  case Value::Type::kNumber:
    return FormatNumber(value.number_value);
  case Value::Type::kBool:
    return value.bool_value ? "true" : "false";
  case Value::Type::kNull:
    return "null";
  }
  return "null";
}

} // namespace runtape::core::json

#endif // RUNTAPE_CORE_JSON_DOM_HPP_
