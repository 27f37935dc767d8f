#ifndef RESILAB_CORE_JSON_DOM_HPP_
#define RESILAB_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace resilab::core::json {

// STL-only document model for everything resilab reads back: targets and
// replica files, trace exports, window logs and stored artifacts.
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

namespace detail {

// Recursive-descent reader over one document. Position is tracked as a byte
// offset; line/column are only computed when an error is reported so a
// malformed targets.json or trace export points straight at the bad byte.
class Reader {
public:
  explicit Reader(std::string_view text) : text_(text) {}

  bool ReadDocument(Value& root, std::string& error) {
    SkipSpace();
    if (!ReadValue(root, 0, error)) {
      return false;
    }
    SkipSpace();
    if (offset_ != text_.size()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  // Jaeger span trees nest deeply but never near this; the cap keeps a
  // hostile document from exhausting the stack.
  static constexpr int kMaxDepth = 256;

  bool ReadValue(Value& out, int depth, std::string& error) {
    if (depth > kMaxDepth) {
      return Fail("document nests deeper than " + std::to_string(kMaxDepth) + " levels", error);
    }
    if (Done()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    out = Value{};
    switch (text_[offset_]) {
    case '{':
      return ReadObject(out, depth, error);
    case '[':
      return ReadArray(out, depth, error);
    case '"':
      out.type = Value::Type::kString;
      return ReadString(out.string_value, error);
    case 't':
      return ReadLiteral("true", Value::Type::kBool, true, out, error);
    case 'f':
      return ReadLiteral("false", Value::Type::kBool, false, out, error);
    case 'n':
      return ReadLiteral("null", Value::Type::kNull, false, out, error);
    default:
      break;
    }
    if (text_[offset_] == '-' || IsDigit(text_[offset_])) {
      out.type = Value::Type::kNumber;
      return ReadNumber(out.number_value, error);
    }
    return Fail("expected JSON value", error);
  }

  bool ReadLiteral(std::string_view word, Value::Type type, bool flag, Value& out,
                   std::string& error) {
    if (text_.substr(offset_, word.size()) != word) {
      return Fail("expected JSON value", error);
    }
    offset_ += word.size();
    out.type = type;
    out.bool_value = flag;
    return true;
  }

  bool ReadObject(Value& out, int depth, std::string& error) {
    out.type = Value::Type::kObject;
    ++offset_; // '{'
    SkipSpace();
    if (Take('}')) {
      return true;
    }
    for (;;) {
      SkipSpace();
      if (Done() || text_[offset_] != '"') {
        return Fail("expected '\"' to start object key", error);
      }
      std::string key;
      if (!ReadString(key, error)) {
        return false;
      }
      SkipSpace();
      if (!Take(':')) {
        return Fail("expected ':' after object key", error);
      }
      SkipSpace();
      // Duplicate keys: the last occurrence wins.
      if (!ReadValue(out.object_value[key], depth + 1, error)) {
        return false;
      }
      SkipSpace();
      if (Take('}')) {
        return true;
      }
      if (!Take(',')) {
        return Fail("expected ',' between object entries", error);
      }
    }
  }

  bool ReadArray(Value& out, int depth, std::string& error) {
    out.type = Value::Type::kArray;
    ++offset_; // '['
    SkipSpace();
    if (Take(']')) {
      return true;
    }
    for (;;) {
      SkipSpace();
      out.array_value.emplace_back();
      if (!ReadValue(out.array_value.back(), depth + 1, error)) {
        return false;
      }
      SkipSpace();
      if (Take(']')) {
        return true;
      }
      if (!Take(',')) {
        return Fail("expected ',' between array items", error);
      }
    }
  }

  bool ReadString(std::string& out, std::string& error) {
    out.clear();
    ++offset_; // opening quote
    while (!Done()) {
      const char c = text_[offset_++];
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        --offset_;
        return Fail("control character in string is not allowed", error);
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (Done()) {
        return Fail("unterminated escape sequence in string", error);
      }
      const char tag = text_[offset_++];
      if (tag == 'u') {
        if (!ReadUnicodeEscape(out, error)) {
          return false;
        }
        continue;
      }
      const char decoded = DecodeSimpleEscape(tag);
      if (decoded == '\0') {
        --offset_;
        return Fail("invalid escape sequence in string", error);
      }
      out.push_back(decoded);
    }
    return Fail("unterminated string literal", error);
  }

  static char DecodeSimpleEscape(char tag) {
    switch (tag) {
    case '"':
    case '\\':
    case '/':
      return tag;
    case 'b':
      return '\b';
    case 'f':
      return '\f';
    case 'n':
      return '\n';
    case 'r':
      return '\r';
    case 't':
      return '\t';
    default:
      return '\0';
    }
  }

  bool ReadHexQuad(std::uint32_t& unit, std::string& error) {
    if (text_.size() - offset_ < 4U) {
      return Fail("truncated \\u escape in string", error);
    }
    unit = 0;
    for (int i = 0; i < 4; ++i) {
      const int digit = HexValue(text_[offset_]);
      if (digit < 0) {
        return Fail("invalid hex digit in \\u escape", error);
      }
      unit = (unit << 4U) | static_cast<std::uint32_t>(digit);
      ++offset_;
    }
    return true;
  }

  bool ReadUnicodeEscape(std::string& out, std::string& error) {
    std::uint32_t unit = 0;
    if (!ReadHexQuad(unit, error)) {
      return false;
    }
    if (unit >= 0xDC00U && unit <= 0xDFFFU) {
      return Fail("unpaired low surrogate in \\u escape", error);
    }
    if (unit >= 0xD800U && unit <= 0xDBFFU) {
      if (text_.substr(offset_, 2) != "\\u") {
        return Fail("unpaired high surrogate in \\u escape", error);
      }
      offset_ += 2;
      std::uint32_t low = 0;
      if (!ReadHexQuad(low, error)) {
        return false;
      }
      if (low < 0xDC00U || low > 0xDFFFU) {
        return Fail("invalid low surrogate in \\u escape", error);
      }
      unit = 0x10000U + (((unit - 0xD800U) << 10U) | (low - 0xDC00U));
    }
    AppendUtf8(unit, out);
    return true;
  }

  static void AppendUtf8(std::uint32_t cp, std::string& out) {
    const auto byte = [&out](std::uint32_t bits) { out.push_back(static_cast<char>(bits)); };
    if (cp < 0x80U) {
      byte(cp);
      return;
    }
    if (cp < 0x800U) {
      byte(0xC0U | (cp >> 6U));
    } else if (cp < 0x10000U) {
      byte(0xE0U | (cp >> 12U));
      byte(0x80U | ((cp >> 6U) & 0x3FU));
    } else {
      byte(0xF0U | (cp >> 18U));
      byte(0x80U | ((cp >> 12U) & 0x3FU));
      byte(0x80U | ((cp >> 6U) & 0x3FU));
    }
    byte(0x80U | (cp & 0x3FU));
  }

  // Validates the JSON number grammar first, then converts the whole token.
  bool ReadNumber(double& out, std::string& error) {
    const std::size_t begin = offset_;
    Take('-');
    if (!Take('0') && SkipDigits() == 0U) {
      return Fail("expected digits in number", error);
    }
    if (Take('.') && SkipDigits() == 0U) {
      return Fail("expected digits after decimal point", error);
    }
    if (Take('e') || Take('E')) {
      if (!Take('+')) {
        Take('-');
      }
      if (SkipDigits() == 0U) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string token(text_.substr(begin, offset_ - begin));
    char* end = nullptr;
    out = std::strtod(token.c_str(), &end);
    if (end != token.c_str() + token.size()) {
      offset_ = begin;
      return Fail("invalid number token", error);
    }
    return true;
  }

  std::size_t SkipDigits() {
    const std::size_t begin = offset_;
    while (!Done() && IsDigit(text_[offset_])) {
      ++offset_;
    }
    return offset_ - begin;
  }

  void SkipSpace() {
    while (!Done()) {
      const char c = text_[offset_];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
        return;
      }
      ++offset_;
    }
  }

  bool Take(char expected) {
    if (Done() || text_[offset_] != expected) {
      return false;
    }
    ++offset_;
    return true;
  }

  bool Done() const {
    return offset_ >= text_.size();
  }

  static bool IsDigit(char c) {
    return c >= '0' && c <= '9';
  }

  static int HexValue(char c) {
    if (IsDigit(c)) {
      return c - '0';
    }
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower >= 'a' && lower <= 'f') {
      return lower - 'a' + 10;
    }
    return -1;
  }

  bool Fail(std::string_view message, std::string& error) const {
    std::size_t line = 1;
    std::size_t col = 1;
    const std::size_t stop = offset_ < text_.size() ? offset_ : text_.size();
    for (std::size_t i = 0; i < stop; ++i) {
      if (text_[i] == '\n') {
        ++line;
        col = 1;
      } else {
        ++col;
      }
    }
    error = "parse error at line " + std::to_string(line) + ", col " + std::to_string(col) +
            ": " + std::string(message);
    return false;
  }

  std::string_view text_;
  std::size_t offset_ = 0;
};

} // namespace detail

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  root = Value{};
  detail::Reader reader(input);
  return reader.ReadDocument(root, error);
}

inline bool IsObject(const Value* value) {
  return value != nullptr && value->type == Value::Type::kObject;
}

inline bool IsArray(const Value* value) {
  return value != nullptr && value->type == Value::Type::kArray;
}

inline bool IsString(const Value* value) {
  return value != nullptr && value->type == Value::Type::kString;
}

inline bool IsNumber(const Value* value) {
  return value != nullptr && value->type == Value::Type::kNumber;
}

inline bool IsBool(const Value* value) {
  return value != nullptr && value->type == Value::Type::kBool;
}

inline const Value* GetField(const Value& object_value, std::string_view key) {
  if (object_value.type != Value::Type::kObject) {
    return nullptr;
  }
  const auto it = object_value.object_value.find(std::string(key));
  if (it == object_value.object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

// Returns the first present string field among `keys`, or empty. Trace and
// dependency exports disagree on field names (`parent` vs `caller`), so
// readers probe aliases in priority order.
inline std::string GetStringAny(const Value& object_value,
                                std::initializer_list<std::string_view> keys) {
  for (const auto key : keys) {
    const Value* field = GetField(object_value, key);
    if (IsString(field) && !field->string_value.empty()) {
      return field->string_value;
    }
  }
  return "";
}

inline bool TryGetInteger(const Value& value, std::int64_t& out) {
  if (value.type != Value::Type::kNumber || !std::isfinite(value.number_value)) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value) {
    return false;
  }
  if (floored > static_cast<double>(std::numeric_limits<std::int64_t>::max()) ||
      floored < static_cast<double>(std::numeric_limits<std::int64_t>::min())) {
    return false;
  }
  out = static_cast<std::int64_t>(floored);
  return true;
}

} // namespace resilab::core::json

#endif // RESILAB_CORE_JSON_DOM_HPP_
