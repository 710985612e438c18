/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace SentinelEngine {

class JsonValue;

using JsonObject = std::unordered_map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

/**
 * @brief Immutable parsed JSON node
 *
 * Lookups never throw. A missing key, an out-of-range index or a value of the
 * wrong type reads as null / std::nullopt, so loaders can walk optional
 * sections without checking every level first.
 */
class JsonValue {
public:
  JsonValue() = default;
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(std::string &&value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonArray &&value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonObject &&value) : m_value(std::move(value)) {}

  bool isObject() const { return std::holds_alternative<JsonObject>(m_value); }

  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  // Only whole numbers that fit in an int; 2.5 or 1e20 read as std::nullopt
  std::optional<int> tryAsInt() const;
  std::optional<std::string> tryAsString() const;
  const JsonArray *tryAsArray() const;

  bool hasKey(const std::string &key) const;
  const JsonValue &operator[](const std::string &key) const;
  const JsonValue &operator[](size_t index) const;
  // Element count for arrays and objects, 0 otherwise
  size_t size() const;

  // Overlay a numeric member onto 'out'; 'out' is untouched when the member is absent
  bool readNumber(const std::string &key, float &out) const;
  bool readNumber(const std::string &key, int &out) const;

private:
  std::variant<std::nullptr_t, bool, double, std::string, JsonArray, JsonObject> m_value{nullptr};
};

/**
 * @brief Minimal recursive-descent JSON reader used for map and tuning files.
 *
 * Errors never throw out of parse(); they are reported through the return
 * value and getLastError() (with line/column).
 */
class JsonReader {
private:
  std::string m_input;
  size_t m_position{0};
  size_t m_line{1};
  size_t m_column{1};
  std::string m_lastError;
  JsonValue m_root;

  char peek() const;
  char advance();
  void skipWhitespace();
  bool expectLiteral(const char *literal);

  bool parseValue(JsonValue &out, int depth);
  bool parseObject(JsonValue &out, int depth);
  bool parseArray(JsonValue &out, int depth);
  bool parseString(std::string &out);
  bool parseNumber(double &out);
  void appendUtf8(std::string &out, uint32_t codepoint);

  static constexpr int MAX_DEPTH = 64;

public:
  JsonReader() = default;

  bool loadFromFile(const std::string &path);
  bool parse(const std::string &jsonString);
  const JsonValue &getRoot() const { return m_root; }
  const std::string &getLastError() const { return m_lastError; }

private:
  void setError(const std::string &message);
};

} // namespace SentinelEngine

#endif // JSONREADER_HPP
