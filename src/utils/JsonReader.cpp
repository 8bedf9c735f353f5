/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <sstream>

namespace PyroForge {

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool())
    return asBool();
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (isNumber())
    return asInt();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
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
  static const JsonValue null_value;
  if (!isObject())
    return null_value;
  auto it = asObject().find(key);
  return it != asObject().end() ? it->second : null_value;
}

const JsonValue &JsonValue::operator[](size_t index) const {
  static const JsonValue null_value;
  if (!isArray() || index >= asArray().size())
    return null_value;
  return asArray()[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

std::string JsonValue::toString() const {
  std::string out;
  write(out);
  return out;
}

void JsonValue::write(std::string &out) const {
  switch (getType()) {
  case JsonType::Null:
    out += "null";
    break;
  case JsonType::Boolean:
    out += asBool() ? "true" : "false";
    break;
  case JsonType::Number: {
    double n = asNumber();
    if (std::isfinite(n) && n == std::floor(n) && std::fabs(n) < 1e15) {
      out += std::format("{}", static_cast<long long>(n));
    } else {
      out += std::format("{}", n);
    }
    break;
  }
  case JsonType::String:
    out += '"';
    for (char c : asString()) {
      switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\r':
        out += "\\r";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out += std::format("\\u{:04x}", static_cast<int>(c));
        } else {
          out += c;
        }
      }
    }
    out += '"';
    break;
  case JsonType::Array: {
    out += '[';
    bool first = true;
    for (const auto &v : asArray()) {
      if (!first)
        out += ',';
      first = false;
      v.write(out);
    }
    out += ']';
    break;
  }
  case JsonType::Object: {
    out += '{';
    bool first = true;
    for (const auto &[key, v] : asObject()) {
      if (!first)
        out += ',';
      first = false;
      JsonValue(key).write(out);
      out += ':';
      v.write(out);
    }
    out += '}';
    break;
  }
  }
}

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_root = JsonValue();
    m_lastError = std::format("Could not open file: {}", path);
    return false;
  }
  std::ostringstream buffer;
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

  JsonValue result;
  skipWhitespace();
  if (atEnd()) {
    return fail("Empty input");
  }
  if (!parseValue(result, 0)) {
    return false;
  }
  skipWhitespace();
  if (!atEnd()) {
    return fail("Unexpected trailing characters");
  }
  m_root = std::move(result);
  return true;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail("Maximum nesting depth exceeded");
  }
  skipWhitespace();
  switch (peek()) {
  case '{':
    return parseObject(out, depth);
  case '[':
    return parseArray(out, depth);
  case '"': {
    std::string s;
    if (!parseString(s))
      return false;
    out = JsonValue(std::move(s));
    return true;
  }
  case 't':
    return parseLiteral("true", JsonValue(true), out);
  case 'f':
    return parseLiteral("false", JsonValue(false), out);
  case 'n':
    return parseLiteral("null", JsonValue(), out);
  case '\0':
    return fail("Unexpected end of input");
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
      return parseNumber(out);
    }
    return fail(std::format("Unexpected character '{}'", peek()));
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // {
  JsonObject obj;
  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(obj));
    return true;
  }
  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      return fail("Expected string key");
    }
    std::string key;
    if (!parseString(key))
      return false;
    skipWhitespace();
    if (advance() != ':') {
      return fail("Expected ':' after object key");
    }
    JsonValue value;
    if (!parseValue(value, depth + 1))
      return false;
    obj[key] = std::move(value);
    skipWhitespace();
    char c = advance();
    if (c == '}')
      break;
    if (c != ',') {
      return fail("Expected ',' or '}' in object");
    }
  }
  out = JsonValue(std::move(obj));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // [
  JsonArray arr;
  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(arr));
    return true;
  }
  while (true) {
    JsonValue value;
    if (!parseValue(value, depth + 1))
      return false;
    arr.push_back(std::move(value));
    skipWhitespace();
    char c = advance();
    if (c == ']')
      break;
    if (c != ',') {
      return fail("Expected ',' or ']' in array");
    }
  }
  out = JsonValue(std::move(arr));
  return true;
}

bool JsonReader::parseHex4(uint32_t &out) {
  out = 0;
  for (int i = 0; i < 4; ++i) {
    char c = advance();
    out <<= 4;
    if (c >= '0' && c <= '9')
      out |= static_cast<uint32_t>(c - '0');
    else if (c >= 'a' && c <= 'f')
      out |= static_cast<uint32_t>(c - 'a' + 10);
    else if (c >= 'A' && c <= 'F')
      out |= static_cast<uint32_t>(c - 'A' + 10);
    else
      return fail("Invalid unicode escape");
  }
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  while (true) {
    if (atEnd()) {
      return fail("Unterminated string");
    }
    char c = advance();
    if (c == '"')
      return true;
    if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Control character in string");
    }
    if (c != '\\') {
      out += c;
      continue;
    }
    char e = advance();
    switch (e) {
    case '"':
    case '\\':
    case '/':
      out += e;
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
      if (!parseHex4(cp))
        return false;
      // Surrogate pair
      if (cp >= 0xD800 && cp <= 0xDBFF) {
        uint32_t low = 0;
        if (advance() != '\\' || advance() != 'u' || !parseHex4(low) ||
            low < 0xDC00 || low > 0xDFFF) {
          return fail("Invalid surrogate pair");
        }
        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
      }
      // UTF-8 encode
      if (cp < 0x80) {
        out += static_cast<char>(cp);
      } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
      } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
      } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
      }
      break;
    }
    default:
      return fail("Invalid escape sequence");
    }
  }
}

bool JsonReader::parseNumber(JsonValue &out) {
  size_t start = m_position;
  auto digits = [this]() {
    size_t n = 0;
    while (peek() >= '0' && peek() <= '9') {
      advance();
      ++n;
    }
    return n;
  };

  if (peek() == '-')
    advance();
  if (peek() == '0') {
    advance();
  } else if (digits() == 0) {
    return fail("Invalid number");
  }
  if (peek() == '.') {
    advance();
    if (digits() == 0)
      return fail("Expected digits after decimal point");
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (digits() == 0)
      return fail("Expected digits in exponent");
  }

  double value = 0.0;
  auto [ptr, ec] = std::from_chars(m_input.data() + start,
                                   m_input.data() + m_position, value);
  if (ec != std::errc()) {
    return fail("Number out of range");
  }
  out = JsonValue(value);
  return true;
}

bool JsonReader::parseLiteral(const char *word, JsonValue value,
                              JsonValue &out) {
  for (const char *p = word; *p != '\0'; ++p) {
    if (advance() != *p) {
      return fail(std::format("Invalid literal, expected '{}'", word));
    }
  }
  out = std::move(value);
  return true;
}

void JsonReader::skipWhitespace() {
  while (peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r') {
    advance();
  }
}

char JsonReader::advance() {
  if (atEnd())
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

bool JsonReader::fail(const std::string &message) {
  m_lastError = std::format("{} at line {}, column {}", message, m_line,
                            m_column);
  m_root = JsonValue();
  return false;
}

} // namespace PyroForge
