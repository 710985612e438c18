/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cmath>
#include <cstdlib>
#include <limits>
#include <format>
#include <fstream>
#include <sstream>

namespace SentinelEngine {

namespace {
const JsonValue &nullValue() {
  static const JsonValue null_value;
  return null_value;
}
} // namespace

std::optional<bool> JsonValue::tryAsBool() const {
  if (const bool *value = std::get_if<bool>(&m_value))
    return *value;
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (const double *value = std::get_if<double>(&m_value))
    return *value;
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  auto number = tryAsNumber();
  if (!number || !std::isfinite(*number) || std::trunc(*number) != *number)
    return std::nullopt;
  if (*number < static_cast<double>(std::numeric_limits<int>::min()) ||
      *number > static_cast<double>(std::numeric_limits<int>::max()))
    return std::nullopt;
  return static_cast<int>(*number);
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (const std::string *value = std::get_if<std::string>(&m_value))
    return *value;
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return std::get_if<JsonArray>(&m_value);
}

bool JsonValue::hasKey(const std::string &key) const {
  const JsonObject *object = std::get_if<JsonObject>(&m_value);
  return object && object->count(key) > 0;
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  if (const JsonObject *object = std::get_if<JsonObject>(&m_value)) {
    auto it = object->find(key);
    if (it != object->end())
      return it->second;
  }
  return nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const JsonArray *array = tryAsArray();
  return (array && index < array->size()) ? (*array)[index] : nullValue();
}

size_t JsonValue::size() const {
  if (const JsonArray *array = tryAsArray())
    return array->size();
  if (const JsonObject *object = std::get_if<JsonObject>(&m_value))
    return object->size();
  return 0;
}

bool JsonValue::readNumber(const std::string &key, float &out) const {
  auto value = (*this)[key].tryAsNumber();
  if (value)
    out = static_cast<float>(*value);
  return value.has_value();
}

bool JsonValue::readNumber(const std::string &key, int &out) const {
  auto value = (*this)[key].tryAsInt();
  if (value)
    out = *value;
  return value.has_value();
}

// JsonReader

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    setError("Could not open file: " + path);
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  skipWhitespace();
  if (m_position >= m_input.size()) {
    setError("Empty JSON input");
    return false;
  }

  JsonValue root;
  if (!parseValue(root, 0)) {
    return false;
  }

  skipWhitespace();
  if (m_position < m_input.size()) {
    setError("Unexpected token after JSON value");
    return false;
  }

  m_root = std::move(root);
  return true;
}

void JsonReader::setError(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = std::format("{} at line {}, column {}", message, m_line,
                              m_column);
  }
}

char JsonReader::peek() const {
  return m_position < m_input.size() ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.size())
    return '\0';
  char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (m_position < m_input.size()) {
    char c = peek();
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      advance();
    } else {
      break;
    }
  }
}

bool JsonReader::expectLiteral(const char *literal) {
  for (const char *p = literal; *p; ++p) {
    if (advance() != *p) {
      setError(std::format("Invalid literal, expected '{}'", literal));
      return false;
    }
  }
  return true;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return false;
  }

  skipWhitespace();
  char c = peek();
  switch (c) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
  case '"': {
    std::string s;
    if (!parseString(s))
      return false;
    out = JsonValue(std::move(s));
    return true;
  }
  case 't':
    if (!expectLiteral("true"))
      return false;
    out = JsonValue(true);
    return true;
  case 'f':
    if (!expectLiteral("false"))
      return false;
    out = JsonValue(false);
    return true;
  case 'n':
    if (!expectLiteral("null"))
      return false;
    out = JsonValue();
    return true;
  default:
    if (c == '-' || (c >= '0' && c <= '9')) {
      double number = 0.0;
      if (!parseNumber(number))
        return false;
      out = JsonValue(number);
      return true;
    }
    setError(c == '\0' ? std::string("Unexpected end of input")
                       : "Unexpected character: " + std::string(1, c));
    return false;
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // '{'
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(object));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      return false;
    }
    std::string key;
    if (!parseString(key))
      return false;

    skipWhitespace();
    if (advance() != ':') {
      setError("Expected ':' after object key");
      return false;
    }

    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    object[key] = std::move(value);

    skipWhitespace();
    char c = advance();
    if (c == '}')
      break;
    if (c != ',') {
      setError("Expected '}' or ',' in object");
      return false;
    }
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // '['
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    array.push_back(std::move(value));

    skipWhitespace();
    char c = advance();
    if (c == ']')
      break;
    if (c != ',') {
      setError("Expected ']' or ',' in array");
      return false;
    }
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote

  while (m_position < m_input.size()) {
    char c = advance();
    if (c == '"')
      return true;

    if (static_cast<unsigned char>(c) < 0x20) {
      setError("Unescaped control character in string");
      return false;
    }

    if (c != '\\') {
      out.push_back(c);
      continue;
    }

    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      out.push_back(escaped);
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'u': {
      uint32_t codepoint = 0;
      for (int i = 0; i < 4; ++i) {
        char h = advance();
        codepoint <<= 4;
        if (h >= '0' && h <= '9')
          codepoint |= static_cast<uint32_t>(h - '0');
        else if (h >= 'a' && h <= 'f')
          codepoint |= static_cast<uint32_t>(h - 'a' + 10);
        else if (h >= 'A' && h <= 'F')
          codepoint |= static_cast<uint32_t>(h - 'A' + 10);
        else {
          setError("Invalid Unicode escape sequence");
          return false;
        }
      }
      appendUtf8(out, codepoint);
      break;
    }
    default:
      setError("Invalid escape sequence: \\" + std::string(1, escaped));
      return false;
    }
  }

  setError("Unterminated string");
  return false;
}

bool JsonReader::parseNumber(double &out) {
  size_t start = m_position;
  if (peek() == '-')
    advance();

  auto digits = [this]() {
    size_t count = 0;
    while (peek() >= '0' && peek() <= '9') {
      advance();
      ++count;
    }
    return count;
  };

  if (digits() == 0) {
    setError("Invalid number format");
    return false;
  }
  if (peek() == '.') {
    advance();
    if (digits() == 0) {
      setError("Invalid number format: expected digit after decimal point");
      return false;
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (digits() == 0) {
      setError("Invalid number format: expected digit in exponent");
      return false;
    }
  }

  std::string text = m_input.substr(start, m_position - start);
  out = std::strtod(text.c_str(), nullptr);
  return true;
}

void JsonReader::appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint < 0x80) {
    out.push_back(static_cast<char>(codepoint));
  } else if (codepoint < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
    out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  }
}

} // namespace SentinelEngine
