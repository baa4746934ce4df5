/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/JsonReader.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace CurveLights {

namespace {

constexpr int MAX_NESTING_DEPTH = 64;

bool isDigit(char c) { return c >= '0' && c <= '9'; }

void appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint <= 0x7F) {
    out += static_cast<char>(codepoint);
  } else if (codepoint <= 0x7FF) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint <= 0xFFFF) {
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

} // anonymous namespace

// JsonValue ---------------------------------------------------------------

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

bool JsonValue::hasKey(const std::string &key) const {
  if (!isObject())
    return false;
  return asObject().find(key) != asObject().end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue null_value;
  if (!isObject())
    return null_value;
  auto it = asObject().find(key);
  return (it != asObject().end()) ? it->second : null_value;
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

// JsonReader --------------------------------------------------------------

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
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

  JsonValue value = parseValue(0);
  if (failed()) {
    return false;
  }

  skipWhitespace();
  if (m_position < m_input.size()) {
    setError("Unexpected trailing content after JSON value");
    return false;
  }

  m_root = std::move(value);
  return true;
}

JsonValue JsonReader::parseValue(int depth) {
  if (depth > MAX_NESTING_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return JsonValue();
  }

  skipWhitespace();
  char c = peek();

  switch (c) {
  case '{':
    return parseObject(depth + 1);
  case '[':
    return parseArray(depth + 1);
  case '"': {
    std::string text;
    if (!parseString(text))
      return JsonValue();
    return JsonValue(std::move(text));
  }
  case 't':
    return parseLiteral("true") ? JsonValue(true) : JsonValue();
  case 'f':
    return parseLiteral("false") ? JsonValue(false) : JsonValue();
  case 'n':
    parseLiteral("null");
    return JsonValue();
  default:
    if (c == '-' || isDigit(c)) {
      return parseNumber();
    }
    if (c == '\0') {
      setError("Unexpected end of input");
    } else {
      setError(std::string("Unexpected character: ") + c);
    }
    return JsonValue();
  }
}

JsonValue JsonReader::parseObject(int depth) {
  JsonObject result;
  advance(); // '{'

  skipWhitespace();
  if (peek() == '}') {
    advance();
    return JsonValue(std::move(result));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      return JsonValue();
    }

    std::string key;
    if (!parseString(key))
      return JsonValue();

    skipWhitespace();
    if (peek() != ':') {
      setError("Expected ':' after object key");
      return JsonValue();
    }
    advance();

    JsonValue value = parseValue(depth);
    if (failed())
      return JsonValue();
    result[key] = std::move(value);

    skipWhitespace();
    char c = advance();
    if (c == '}')
      break;
    if (c != ',') {
      setError("Expected '}' or ',' in object");
      return JsonValue();
    }
  }

  return JsonValue(std::move(result));
}

JsonValue JsonReader::parseArray(int depth) {
  JsonArray result;
  advance(); // '['

  skipWhitespace();
  if (peek() == ']') {
    advance();
    return JsonValue(std::move(result));
  }

  while (true) {
    JsonValue value = parseValue(depth);
    if (failed())
      return JsonValue();
    result.push_back(std::move(value));

    skipWhitespace();
    char c = advance();
    if (c == ']')
      break;
    if (c != ',') {
      setError("Expected ']' or ',' in array");
      return JsonValue();
    }
  }

  return JsonValue(std::move(result));
}

JsonValue JsonReader::parseNumber() {
  const size_t start = m_position;

  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (isDigit(peek())) {
    while (isDigit(peek()))
      advance();
  } else {
    setError("Invalid number format");
    return JsonValue();
  }

  if (peek() == '.') {
    advance();
    if (!isDigit(peek())) {
      setError("Invalid number format: expected digit after decimal point");
      return JsonValue();
    }
    while (isDigit(peek()))
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!isDigit(peek())) {
      setError("Invalid number format: expected digit in exponent");
      return JsonValue();
    }
    while (isDigit(peek()))
      advance();
  }

  const std::string text = m_input.substr(start, m_position - start);
  double value = std::strtod(text.c_str(), nullptr);
  if (!std::isfinite(value)) {
    setError("Number out of range: " + text);
    return JsonValue();
  }
  return JsonValue(value);
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote

  while (m_position < m_input.size()) {
    char c = advance();

    if (c == '"') {
      return true;
    }

    if (c == '\\') {
      char escaped = advance();
      switch (escaped) {
      case '"':
      case '\\':
      case '/':
        out += escaped;
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
        uint32_t codepoint = 0;
        if (!parseHex4(codepoint))
          return false;
        appendUtf8(out, codepoint);
        break;
      }
      default:
        setError(std::string("Invalid escape sequence: \\") + escaped);
        return false;
      }
    } else if (static_cast<unsigned char>(c) < 0x20) {
      setError("Unescaped control character in string");
      return false;
    } else {
      out += c;
    }
  }

  setError("Unterminated string");
  return false;
}

bool JsonReader::parseLiteral(const char *literal) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (peek() != *p) {
      setError(std::string("Invalid literal, expected '") + literal + "'");
      return false;
    }
    advance();
  }
  return true;
}

bool JsonReader::parseHex4(uint32_t &out) {
  out = 0;
  for (int i = 0; i < 4; ++i) {
    char c = advance();
    uint32_t digit;
    if (c >= '0' && c <= '9') {
      digit = static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<uint32_t>(c - 'A' + 10);
    } else {
      setError("Invalid Unicode escape sequence");
      return false;
    }
    out = (out << 4) | digit;
  }
  return true;
}

char JsonReader::peek() const {
  return (m_position < m_input.size()) ? m_input[m_position] : '\0';
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
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n')
      break;
    advance();
  }
}

void JsonReader::setError(const std::string &message) {
  if (failed())
    return; // Keep the first, most specific error
  m_lastError = "Line " + std::to_string(m_line) + ", Column " +
                std::to_string(m_column) + ": " + message;
}

} // namespace CurveLights
