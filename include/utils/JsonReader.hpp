/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace Wayfarer {

class JsonValue;

// Ordered so that written files are stable between saves
using JsonObject = std::map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

enum class JsonType { Null, Boolean, Number, String, Array, Object };

inline std::ostream &operator<<(std::ostream &os, JsonType type) {
  switch (type) {
  case JsonType::Null:
    return os << "Null";
  case JsonType::Boolean:
    return os << "Boolean";
  case JsonType::Number:
    return os << "Number";
  case JsonType::String:
    return os << "String";
  case JsonType::Array:
    return os << "Array";
  case JsonType::Object:
    return os << "Object";
  }
  return os << "Unknown";
}

class JsonValue {
public:
  using ValueType = std::variant<std::nullptr_t, bool, double, std::string,
                                 JsonArray, JsonObject>;

  JsonValue() : m_value(nullptr) {}
  explicit JsonValue(std::nullptr_t) : m_value(nullptr) {}
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(int value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(int64_t value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(const std::string &value) : m_value(value) {}
  explicit JsonValue(std::string &&value) : m_value(std::move(value)) {}
  explicit JsonValue(const char *value) : m_value(std::string(value)) {}
  explicit JsonValue(JsonArray value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonObject value) : m_value(std::move(value)) {}

  static JsonValue object() { return JsonValue(JsonObject{}); }
  static JsonValue array() { return JsonValue(JsonArray{}); }

  JsonType getType() const;
  bool isNull() const { return std::holds_alternative<std::nullptr_t>(m_value); }
  bool isBool() const { return std::holds_alternative<bool>(m_value); }
  bool isNumber() const { return std::holds_alternative<double>(m_value); }
  bool isString() const { return std::holds_alternative<std::string>(m_value); }
  bool isArray() const { return std::holds_alternative<JsonArray>(m_value); }
  bool isObject() const { return std::holds_alternative<JsonObject>(m_value); }

  // Throw std::bad_variant_access on a type mismatch. Integer reads
  // saturate at the limits of the target type.
  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  int asInt() const { return saturate<int>(std::get<double>(m_value)); }
  int64_t asInt64() const { return saturate<int64_t>(std::get<double>(m_value)); }
  const std::string &asString() const { return std::get<std::string>(m_value); }
  const JsonArray &asArray() const { return std::get<JsonArray>(m_value); }
  const JsonObject &asObject() const { return std::get<JsonObject>(m_value); }
  JsonArray &asArray() { return std::get<JsonArray>(m_value); }
  JsonObject &asObject() { return std::get<JsonObject>(m_value); }

  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  // Empty for non-numbers and for numbers outside the int range
  std::optional<int> tryAsInt() const;
  std::optional<std::string> tryAsString() const;
  const JsonArray *tryAsArray() const;
  const JsonObject *tryAsObject() const;

  bool hasKey(const std::string &key) const;
  // Missing keys and non-objects yield a shared null value
  const JsonValue &operator[](const std::string &key) const;
  const JsonValue &operator[](size_t index) const;
  size_t size() const;

  // Lookups with a fallback when the member is missing or the wrong type
  int getInt(const std::string &key, int fallback) const;
  int64_t getInt64(const std::string &key, int64_t fallback) const;
  double getNumber(const std::string &key, double fallback) const;
  bool getBool(const std::string &key, bool fallback) const;
  std::string getString(const std::string &key, const std::string &fallback) const;

  // Builders; convert a null value into an object or array on first use
  JsonValue &set(const std::string &key, JsonValue value);
  JsonValue &push(JsonValue value);

  std::string toString() const;

private:
  template <typename T> static T saturate(double value) {
    if (std::isnan(value)) {
      return 0;
    }
    if (value <= static_cast<double>(std::numeric_limits<T>::min())) {
      return std::numeric_limits<T>::min();
    }
    if (value >= static_cast<double>(std::numeric_limits<T>::max())) {
      return std::numeric_limits<T>::max();
    }
    return static_cast<T>(value);
  }

  ValueType m_value;
};

/**
 * @brief Recursive-descent JSON parser reporting line and column on failure.
 */
class JsonReader {
public:
  JsonReader() = default;

  bool loadFromFile(const std::string &path);
  bool parse(const std::string &jsonString);
  const JsonValue &getRoot() const { return m_root; }
  const std::string &getLastError() const { return m_lastError; }
  void clearError() { m_lastError.clear(); }

private:
  bool parseValue(JsonValue &out, int depth);
  bool parseObject(JsonValue &out, int depth);
  bool parseArray(JsonValue &out, int depth);
  bool parseString(std::string &out);
  bool parseNumber(JsonValue &out);
  bool parseLiteral(const char *word, JsonValue value, JsonValue &out);
  bool parseHex4(uint32_t &out);

  void skipWhitespace();
  bool atEnd() const { return m_pos >= m_input.size(); }
  char peek() const { return atEnd() ? '\0' : m_input[m_pos]; }
  char advance();
  bool fail(const std::string &message);

  static constexpr int MAX_DEPTH = 256;

  std::string m_input;
  size_t m_pos{0};
  size_t m_line{1};
  size_t m_column{1};
  std::string m_lastError;
  JsonValue m_root;
};

/**
 * @brief Serializes JsonValue trees with full string escaping.
 */
class JsonWriter {
public:
  static std::string write(const JsonValue &value, bool pretty = true);
  static bool saveToFile(const JsonValue &value, const std::string &path,
                         std::string &error);

private:
  static void writeValue(std::string &out, const JsonValue &value, bool pretty,
                         int indent);
  static void writeString(std::string &out, const std::string &text);
  static void writeNumber(std::string &out, double number);
  static void newline(std::string &out, bool pretty, int indent);
};

} // namespace Wayfarer

#endif // JSONREADER_HPP
