// Copyright 2022 Ringgaard Research ApS
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "bulkload/util/json.h"

#include <stdlib.h>

namespace bulkload {

const JSON JSON::ERROR_VALUE;
const string JSON::EMPTY_STRING;

// Recursive descent JSON parser.
class JSON::Parser {
 public:
  explicit Parser(const Slice &text)
      : next_(text.begin()), end_(text.end()) {}

  // Parse value.
  bool ParseValue(JSON *value, int depth);

  // Skip whitespace and check that all input has been consumed.
  bool AtEnd() {
    SkipWhitespace();
    return next_ == end_;
  }

  // Error message.
  const string &error() const { return error_; }

 private:
  // Maximum nesting depth.
  static const int kMaxDepth = 1000;

  bool ParseObject(JSON *value, int depth);
  bool ParseArray(JSON *value, int depth);
  bool ParseString(string *str);
  bool ParseNumber(JSON *value);
  bool ParseLiteral(const char *literal);
  bool ParseHex(int *code);

  void SkipWhitespace() {
    while (next_ < end_ &&
           (*next_ == ' ' || *next_ == '\t' || *next_ == '\n' ||
            *next_ == '\r')) {
      next_++;
    }
  }

  int current() const { return next_ < end_ ? *next_ : -1; }

  bool Error(const char *message) {
    if (error_.empty()) error_ = message;
    return false;
  }

  // Append Unicode code point as UTF-8.
  static void AppendUTF8(int code, string *str);

  const char *next_;
  const char *end_;
  string error_;
};

bool JSON::Parser::ParseValue(JSON *value, int depth) {
  if (depth > kMaxDepth) return Error("JSON nested too deeply");
  SkipWhitespace();
  switch (current()) {
    case '{':
      return ParseObject(value, depth);
    case '[':
      return ParseArray(value, depth);
    case '"': {
      JSON str(STRING);
      str.s_ = new string();
      if (!ParseString(str.s_)) return false;
      *value = std::move(str);
      return true;
    }
    case 't':
      if (!ParseLiteral("true")) return false;
      *value = JSON(BOOL);
      value->b_ = true;
      return true;
    case 'f':
      if (!ParseLiteral("false")) return false;
      *value = JSON(BOOL);
      value->b_ = false;
      return true;
    case 'n':
      if (!ParseLiteral("null")) return false;
      *value = JSON(NIL);
      return true;
    default:
      return ParseNumber(value);
  }
}

bool JSON::Parser::ParseObject(JSON *value, int depth) {
  next_++;
  JSON obj(OBJECT);
  obj.o_ = new Object();
  SkipWhitespace();
  if (current() == '}') {
    next_++;
    *value = std::move(obj);
    return true;
  }
  for (;;) {
    SkipWhitespace();
    if (current() != '"') return Error("Expected string key in JSON object");
    string key;
    if (!ParseString(&key)) return false;
    SkipWhitespace();
    if (current() != ':') return Error("Expected ':' in JSON object");
    next_++;
    JSON item;
    if (!ParseValue(&item, depth + 1)) return false;
    obj.o_->Add(key, std::move(item));
    SkipWhitespace();
    if (current() == ',') {
      next_++;
    } else if (current() == '}') {
      next_++;
      break;
    } else {
      return Error("Expected ',' or '}' in JSON object");
    }
  }
  *value = std::move(obj);
  return true;
}

bool JSON::Parser::ParseArray(JSON *value, int depth) {
  next_++;
  JSON arr(ARRAY);
  arr.a_ = new Array();
  SkipWhitespace();
  if (current() == ']') {
    next_++;
    *value = std::move(arr);
    return true;
  }
  for (;;) {
    JSON element;
    if (!ParseValue(&element, depth + 1)) return false;
    arr.a_->Add(std::move(element));
    SkipWhitespace();
    if (current() == ',') {
      next_++;
    } else if (current() == ']') {
      next_++;
      break;
    } else {
      return Error("Expected ',' or ']' in JSON array");
    }
  }
  *value = std::move(arr);
  return true;
}

bool JSON::Parser::ParseString(string *str) {
  next_++;
  while (next_ < end_) {
    char c = *next_++;
    if (c == '"') return true;
    if (c != '\\') {
      str->push_back(c);
      continue;
    }
    if (next_ == end_) break;
    c = *next_++;
    switch (c) {
      case '"': str->push_back('"'); break;
      case '\\': str->push_back('\\'); break;
      case '/': str->push_back('/'); break;
      case 'b': str->push_back('\b'); break;
      case 'f': str->push_back('\f'); break;
      case 'n': str->push_back('\n'); break;
      case 'r': str->push_back('\r'); break;
      case 't': str->push_back('\t'); break;
      case 'u': {
        int code;
        if (!ParseHex(&code)) return false;
        if (code >= 0xD800 && code <= 0xDBFF) {
          // Surrogate pair.
          int low;
          if (end_ - next_ < 2 || next_[0] != '\\' || next_[1] != 'u') {
            return Error("Invalid surrogate pair in JSON string");
          }
          next_ += 2;
          if (!ParseHex(&low)) return false;
          if (low < 0xDC00 || low > 0xDFFF) {
            return Error("Invalid surrogate pair in JSON string");
          }
          code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
        }
        AppendUTF8(code, str);
        break;
      }
      default:
        return Error("Invalid escape sequence in JSON string");
    }
  }
  return Error("Unterminated JSON string");
}

bool JSON::Parser::ParseHex(int *code) {
  if (end_ - next_ < 4) return Error("Truncated unicode escape in JSON string");
  int value = 0;
  for (int i = 0; i < 4; ++i) {
    char c = *next_++;
    value <<= 4;
    if (c >= '0' && c <= '9') {
      value += c - '0';
    } else if (c >= 'a' && c <= 'f') {
      value += c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      value += c - 'A' + 10;
    } else {
      return Error("Invalid unicode escape in JSON string");
    }
  }
  *code = value;
  return true;
}

void JSON::Parser::AppendUTF8(int code, string *str) {
  if (code < 0x80) {
    str->push_back(code);
  } else if (code < 0x800) {
    str->push_back(0xC0 | (code >> 6));
    str->push_back(0x80 | (code & 0x3F));
  } else if (code < 0x10000) {
    str->push_back(0xE0 | (code >> 12));
    str->push_back(0x80 | ((code >> 6) & 0x3F));
    str->push_back(0x80 | (code & 0x3F));
  } else {
    str->push_back(0xF0 | (code >> 18));
    str->push_back(0x80 | ((code >> 12) & 0x3F));
    str->push_back(0x80 | ((code >> 6) & 0x3F));
    str->push_back(0x80 | (code & 0x3F));
  }
}

bool JSON::Parser::ParseNumber(JSON *value) {
  const char *start = next_;
  bool integer = true;
  if (current() == '-') next_++;
  if (current() < '0' || current() > '9') {
    return Error("Unexpected character in JSON input");
  }
  while (current() >= '0' && current() <= '9') next_++;
  if (current() == '.') {
    integer = false;
    next_++;
    if (current() < '0' || current() > '9') return Error("Invalid JSON number");
    while (current() >= '0' && current() <= '9') next_++;
  }
  if (current() == 'e' || current() == 'E') {
    integer = false;
    next_++;
    if (current() == '+' || current() == '-') next_++;
    if (current() < '0' || current() > '9') return Error("Invalid JSON number");
    while (current() >= '0' && current() <= '9') next_++;
  }
  JSON number(integer ? INT : FLOAT);
  number.s_ = new string(start, next_ - start);
  *value = std::move(number);
  return true;
}

bool JSON::Parser::ParseLiteral(const char *literal) {
  const char *p = literal;
  while (*p != '\0') {
    if (next_ == end_ || *next_ != *p) return Error("Invalid JSON literal");
    next_++;
    p++;
  }
  return true;
}

JSON &JSON::operator=(JSON &&other) {
  if (this != &other) {
    Clear();
    s_ = other.s_;
    type_ = other.type_;
    other.s_ = nullptr;
    other.type_ = ERROR;
  }
  return *this;
}

JSON::~JSON() {
  Clear();
}

void JSON::Clear() {
  switch (type_) {
    case STRING:
    case INT:
    case FLOAT:
      delete s_;
      break;
    case OBJECT:
      delete o_;
      break;
    case ARRAY:
      delete a_;
      break;
    default:
      break;
  }
  s_ = nullptr;
  type_ = ERROR;
}

Status JSON::Parse(const Slice &text, JSON *result) {
  Parser parser(text);
  JSON value;
  if (!parser.ParseValue(&value, 0)) {
    return Status(EINVAL, parser.error());
  }
  if (!parser.AtEnd()) {
    return Status(EINVAL, "Unexpected trailing content after JSON value");
  }
  *result = std::move(value);
  return Status::OK;
}

const string &JSON::text() const {
  if (type_ == STRING || type_ == INT || type_ == FLOAT) return *s_;
  return EMPTY_STRING;
}

int64 JSON::i() const {
  if (type_ == INT) return strtoll(s_->c_str(), nullptr, 10);
  if (type_ == FLOAT) return static_cast<int64>(strtod(s_->c_str(), nullptr));
  return 0;
}

const JSON &JSON::operator [](const string &key) const {
  return type_ == OBJECT ? (*o_)[key] : ERROR_VALUE;
}

const JSON &JSON::Object::operator [](const string &key) const {
  for (const auto &item : items_) {
    if (item.first == key) return item.second;
  }
  return ERROR_VALUE;
}

}  // namespace bulkload
