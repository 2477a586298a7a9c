/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <charconv>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace Wayfarer {

namespace {
const JsonValue &nullValue() {
  static const JsonValue value;
  return value;
}

void appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint < 0x80) {
    out += static_cast<char>(codepoint);
  } else if (codepoint < 0x800) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint < 0x10000) {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codepoint >> 18));
    out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
}
} // namespace

// JsonValue

JsonType JsonValue::getType() const {
  switch (m_value.index()) {
  case 1:
    return JsonType::Boolean;
  case 2:
    return JsonType::Number;
  case 3:
    return JsonType::String;
  case 4:
    return JsonType::Array;
  case 5:
    return JsonType::Object;
  default:
    return JsonType::Null;
  }
}

std::optional<bool> JsonValue::tryAsBool() const {
  return isBool() ? std::optional<bool>(asBool()) : std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  return isNumber() ? std::optional<double>(asNumber()) : std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (!isNumber()) {
    return std::nullopt;
  }
  const double value = asNumber();
  if (!(value >= static_cast<double>(std::numeric_limits<int>::min()) &&
        value <= static_cast<double>(std::numeric_limits<int>::max()))) {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

std::optional<std::string> JsonValue::tryAsString() const {
  return isString() ? std::optional<std::string>(asString()) : std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return isArray() ? &asArray() : nullptr;
}

const JsonObject *JsonValue::tryAsObject() const {
  return isObject() ? &asObject() : nullptr;
}

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().count(key) > 0;
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  if (!isObject()) {
    return nullValue();
  }
  auto it = asObject().find(key);
  return it != asObject().end() ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  if (!isArray() || index >= asArray().size()) {
    return nullValue();
  }
  return asArray()[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

int JsonValue::getInt(const std::string &key, int fallback) const {
  return (*this)[key].tryAsInt().value_or(fallback);
}

int64_t JsonValue::getInt64(const std::string &key, int64_t fallback) const {
  const JsonValue &v = (*this)[key];
  return v.isNumber() ? v.asInt64() : fallback;
}

double JsonValue::getNumber(const std::string &key, double fallback) const {
  return (*this)[key].tryAsNumber().value_or(fallback);
}

bool JsonValue::getBool(const std::string &key, bool fallback) const {
  return (*this)[key].tryAsBool().value_or(fallback);
}

std::string JsonValue::getString(const std::string &key,
                                 const std::string &fallback) const {
  return (*this)[key].tryAsString().value_or(fallback);
}

JsonValue &JsonValue::set(const std::string &key, JsonValue value) {
  if (!isObject()) {
    m_value = JsonObject{};
  }
  asObject()[key] = std::move(value);
  return *this;
}

JsonValue &JsonValue::push(JsonValue value) {
  if (!isArray()) {
    m_value = JsonArray{};
  }
  asArray().push_back(std::move(value));
  return *this;
}

std::string JsonValue::toString() const { return JsonWriter::write(*this, false); }

// JsonReader

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_lastError = std::format("Failed to open file: {}", path);
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_pos = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  JsonValue root;
  skipWhitespace();
  if (atEnd()) {
    return fail("Empty JSON document");
  }
  if (!parseValue(root, 0)) {
    return false;
  }
  skipWhitespace();
  if (!atEnd()) {
    return fail("Unexpected trailing characters");
  }
  m_root = std::move(root);
  return true;
}

char JsonReader::advance() {
  char c = m_input[m_pos++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      break;
    }
    advance();
  }
}

bool JsonReader::fail(const std::string &message) {
  m_lastError = std::format("{} at line {}, column {}", message, m_line, m_column);
  return false;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail("Nesting too deep");
  }
  skipWhitespace();
  switch (peek()) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
  case '"': {
    std::string text;
    if (!parseString(text)) {
      return false;
    }
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    return parseLiteral("true", JsonValue(true), out);
  case 'f':
    return parseLiteral("false", JsonValue(false), out);
  case 'n':
    return parseLiteral("null", JsonValue(), out);
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
      return parseNumber(out);
    }
    return fail(atEnd() ? "Unexpected end of input"
                        : std::format("Unexpected character '{}'", peek()));
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // {
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
      return fail("Expected string key");
    }
    std::string key;
    if (!parseString(key)) {
      return false;
    }
    skipWhitespace();
    if (peek() != ':') {
      return fail("Expected ':' after key");
    }
    advance();

    JsonValue value;
    if (!parseValue(value, depth)) {
      return false;
    }
    object[key] = std::move(value);

    skipWhitespace();
    if (peek() == ',') {
      advance();
      continue;
    }
    if (peek() == '}') {
      advance();
      break;
    }
    return fail("Expected ',' or '}' in object");
  }
  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // [
  JsonArray array;
  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    JsonValue element;
    if (!parseValue(element, depth)) {
      return false;
    }
    array.push_back(std::move(element));

    skipWhitespace();
    if (peek() == ',') {
      advance();
      continue;
    }
    if (peek() == ']') {
      advance();
      break;
    }
    return fail("Expected ',' or ']' in array");
  }
  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseHex4(uint32_t &out) {
  out = 0;
  for (int i = 0; i < 4; ++i) {
    if (atEnd()) {
      return fail("Truncated unicode escape");
    }
    char c = advance();
    out <<= 4;
    if (c >= '0' && c <= '9') {
      out |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      out |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      out |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return fail("Invalid hex digit in unicode escape");
    }
  }
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();
  while (true) {
    if (atEnd()) {
      return fail("Unterminated string");
    }
    char c = advance();
    if (c == '"') {
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Control character in string");
    }
    if (c != '\\') {
      out += c;
      continue;
    }
    if (atEnd()) {
      return fail("Unterminated escape sequence");
    }
    char e = advance();
    switch (e) {
    case '"':
      out += '"';
      break;
    case '\\':
      out += '\\';
      break;
    case '/':
      out += '/';
      break;
    case 'b':
      out += '\b';
      break;
    case 'f':
      out += '\f';
      break;
    case 'n':
      out += '\n';
      break;
    case 'r':
      out += '\r';
      break;
    case 't':
      out += '\t';
      break;
    case 'u': {
      uint32_t cp = 0;
      if (!parseHex4(cp)) {
        return false;
      }
      if (cp >= 0xD800 && cp <= 0xDBFF) {
        if (peek() != '\\') {
          return fail("Unpaired surrogate in unicode escape");
        }
        advance();
        if (peek() != 'u') {
          return fail("Unpaired surrogate in unicode escape");
        }
        advance();
        uint32_t low = 0;
        if (!parseHex4(low)) {
          return false;
        }
        if (low < 0xDC00 || low > 0xDFFF) {
          return fail("Invalid low surrogate");
        }
        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(out, cp);
      break;
    }
    default:
      return fail(std::format("Invalid escape '\\{}'", e));
    }
  }
}

bool JsonReader::parseNumber(JsonValue &out) {
  size_t start = m_pos;
  if (peek() == '-') {
    advance();
  }
  if (peek() == '0') {
    advance();
  } else if (peek() >= '1' && peek() <= '9') {
    while (peek() >= '0' && peek() <= '9') {
      advance();
    }
  } else {
    return fail("Invalid number");
  }
  if (peek() == '.') {
    advance();
    if (!(peek() >= '0' && peek() <= '9')) {
      return fail("Expected digit after decimal point");
    }
    while (peek() >= '0' && peek() <= '9') {
      advance();
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (!(peek() >= '0' && peek() <= '9')) {
      return fail("Expected digit in exponent");
    }
    while (peek() >= '0' && peek() <= '9') {
      advance();
    }
  }

  const std::string text = m_input.substr(start, m_pos - start);
  try {
    out = JsonValue(std::stod(text));
  } catch (const std::out_of_range &) {
    return fail(std::format("Number out of range: {}", text));
  }
  return true;
}

bool JsonReader::parseLiteral(const char *word, JsonValue value, JsonValue &out) {
  for (const char *p = word; *p != '\0'; ++p) {
    if (atEnd() || peek() != *p) {
      return fail(std::format("Invalid literal, expected '{}'", word));
    }
    advance();
  }
  out = std::move(value);
  return true;
}

// JsonWriter

std::string JsonWriter::write(const JsonValue &value, bool pretty) {
  std::string out;
  writeValue(out, value, pretty, 0);
  if (pretty) {
    out += '\n';
  }
  return out;
}

bool JsonWriter::saveToFile(const JsonValue &value, const std::string &path,
                            std::string &error) {
  namespace fs = std::filesystem;
  // Write beside the target then rename, so a crash never leaves half a file
  const fs::path target(path);
  const fs::path temp = fs::path(path + ".tmp");
  {
    std::ofstream file(temp, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
      error = std::format("Failed to open {} for writing", temp.string());
      return false;
    }
    file << write(value, true);
    if (!file.good()) {
      error = std::format("Failed writing {}", temp.string());
      return false;
    }
  }
  std::error_code ec;
  fs::rename(temp, target, ec);
  if (ec) {
    error = std::format("Failed to replace {}: {}", path, ec.message());
    fs::remove(temp, ec);
    return false;
  }
  return true;
}

void JsonWriter::newline(std::string &out, bool pretty, int indent) {
  if (pretty) {
    out += '\n';
    out.append(static_cast<size_t>(indent) * 2, ' ');
  }
}

void JsonWriter::writeString(std::string &out, const std::string &text) {
  out += '"';
  for (char c : text) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        out += std::format("\\u{:04x}", static_cast<unsigned>(c));
      } else {
        out += c;
      }
    }
  }
  out += '"';
}

void JsonWriter::writeNumber(std::string &out, double number) {
  if (!std::isfinite(number)) {
    out += "null";
    return;
  }
  if (std::floor(number) == number && std::abs(number) < 1e15) {
    out += std::to_string(static_cast<long long>(number));
    return;
  }
  char buffer[32];
  auto result = std::to_chars(buffer, buffer + sizeof(buffer), number);
  out.append(buffer, result.ptr);
}

void JsonWriter::writeValue(std::string &out, const JsonValue &value, bool pretty,
                            int indent) {
  switch (value.getType()) {
  case JsonType::Null:
    out += "null";
    break;
  case JsonType::Boolean:
    out += value.asBool() ? "true" : "false";
    break;
  case JsonType::Number:
    writeNumber(out, value.asNumber());
    break;
  case JsonType::String:
    writeString(out, value.asString());
    break;
  case JsonType::Array: {
    const auto &array = value.asArray();
    if (array.empty()) {
      out += "[]";
      break;
    }
    // Arrays of scalars stay on one line
    bool flat = true;
    for (const auto &element : array) {
      if (element.isArray() || element.isObject()) {
        flat = false;
        break;
      }
    }
    out += '[';
    for (size_t i = 0; i < array.size(); ++i) {
      if (i > 0) {
        out += flat && pretty ? ", " : ",";
      }
      if (!flat) {
        newline(out, pretty, indent + 1);
      }
      writeValue(out, array[i], pretty, indent + 1);
    }
    if (!flat) {
      newline(out, pretty, indent);
    }
    out += ']';
    break;
  }
  case JsonType::Object: {
    const auto &object = value.asObject();
    if (object.empty()) {
      out += "{}";
      break;
    }
    out += '{';
    bool first = true;
    for (const auto &[key, member] : object) {
      if (!first) {
        out += ',';
      }
      first = false;
      newline(out, pretty, indent + 1);
      writeString(out, key);
      out += pretty ? ": " : ":";
      writeValue(out, member, pretty, indent + 1);
    }
    newline(out, pretty, indent);
    out += '}';
    break;
  }
  }
}

} // namespace Wayfarer
