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

#include "bulkload/loader/nquad.h"

#include <ctype.h>

#include "bulkload/util/json.h"

namespace bulkload {

namespace {

// Append Unicode code point as UTF-8.
void AppendUTF8(uint32 code, string *str) {
  if (code < 0x80) {
    str->push_back(code);
  } else if (code < 0x800) {
    str->push_back(0xc0 | (code >> 6));
    str->push_back(0x80 | (code & 0x3f));
  } else if (code < 0x10000) {
    str->push_back(0xe0 | (code >> 12));
    str->push_back(0x80 | ((code >> 6) & 0x3f));
    str->push_back(0x80 | (code & 0x3f));
  } else {
    str->push_back(0xf0 | (code >> 18));
    str->push_back(0x80 | ((code >> 12) & 0x3f));
    str->push_back(0x80 | ((code >> 6) & 0x3f));
    str->push_back(0x80 | (code & 0x3f));
  }
}

// Scanner for N-Quad lines.
class RDFScanner {
 public:
  explicit RDFScanner(const Slice &line)
      : p_(line.begin()), end_(line.end()), line_(line) {}

  // Skip whitespace.
  void SkipSpace() {
    while (p_ < end_ && (*p_ == ' ' || *p_ == '\t' || *p_ == '\r' ||
                         *p_ == '\n')) {
      p_++;
    }
  }

  // Check for end of line or comment.
  bool AtEnd() const { return p_ == end_ || *p_ == '#'; }

  // Current character.
  char peek() const { return p_ < end_ ? *p_ : 0; }

  // Parse IRI in angle brackets.
  Status ParseIRI(string *iri) {
    p_++;
    const char *start = p_;
    while (p_ < end_ && *p_ != '>') {
      if (*p_ == ' ' || *p_ == '<') return Error("Invalid character in IRI");
      p_++;
    }
    if (p_ == end_) return Error("Unterminated IRI");
    iri->assign(start, p_ - start);
    p_++;
    if (iri->empty()) return Error("Empty IRI");
    return Status::OK;
  }

  // Parse blank node.
  Status ParseBlank(string *id) {
    if (end_ - p_ < 3 || p_[1] != ':') return Error("Invalid blank node");
    const char *start = p_;
    p_ += 2;
    while (p_ < end_ && *p_ != ' ' && *p_ != '\t' && *p_ != '<' &&
           *p_ != '"') {
      p_++;
    }
    // A period directly after the blank node name terminates the statement.
    if (p_ - start > 2 && p_[-1] == '.') p_--;
    if (p_ - start == 2) return Error("Empty blank node name");
    id->assign(start, p_ - start);
    return Status::OK;
  }

  // Parse node id, either IRI or blank node.
  Status ParseNode(string *id) {
    SkipSpace();
    if (peek() == '<') return ParseIRI(id);
    if (peek() == '_') return ParseBlank(id);
    return Error("Node expected");
  }

  // Parse quoted literal with escapes.
  Status ParseLiteral(string *value) {
    p_++;
    value->clear();
    while (p_ < end_ && *p_ != '"') {
      char ch = *p_++;
      if (ch != '\\') {
        value->push_back(ch);
        continue;
      }
      if (p_ == end_) break;
      ch = *p_++;
      switch (ch) {
        case 't': value->push_back('\t'); break;
        case 'b': value->push_back('\b'); break;
        case 'n': value->push_back('\n'); break;
        case 'r': value->push_back('\r'); break;
        case 'f': value->push_back('\f'); break;
        case '"': value->push_back('"'); break;
        case '\'': value->push_back('\''); break;
        case '\\': value->push_back('\\'); break;
        case 'u':
        case 'U': {
          int digits = ch == 'u' ? 4 : 8;
          if (end_ - p_ < digits) return Error("Truncated unicode escape");
          uint32 code = 0;
          for (int i = 0; i < digits; ++i) {
            char h = *p_++;
            int d;
            if (h >= '0' && h <= '9') {
              d = h - '0';
            } else if (h >= 'a' && h <= 'f') {
              d = h - 'a' + 10;
            } else if (h >= 'A' && h <= 'F') {
              d = h - 'A' + 10;
            } else {
              return Error("Invalid unicode escape");
            }
            code = (code << 4) | d;
          }
          if (code > 0x10ffff) return Error("Invalid unicode code point");
          AppendUTF8(code, value);
          break;
        }
        default:
          return Error("Invalid escape in literal");
      }
    }
    if (p_ == end_) return Error("Unterminated literal");
    p_++;
    return Status::OK;
  }

  // Parse language tag after @.
  Status ParseLang(string *lang) {
    p_++;
    const char *start = p_;
    while (p_ < end_ && (isalnum(*p_) || *p_ == '-')) p_++;
    if (p_ == start) return Error("Empty language tag");
    lang->assign(start, p_ - start);
    return Status::OK;
  }

  // Check for and consume character.
  bool Consume(char ch) {
    if (peek() != ch) return false;
    p_++;
    return true;
  }

  // Return parse error.
  Status Error(const char *message) const {
    return Status(EINVAL, message, line_.str());
  }

 private:
  const char *p_;
  const char *end_;
  Slice line_;
};

}  // namespace

Status ParseRDF(const Slice &line, NQuad *nquad, bool *empty) {
  RDFScanner scanner(line);
  scanner.SkipSpace();
  if (scanner.AtEnd()) {
    *empty = true;
    return Status::OK;
  }
  *empty = false;
  *nquad = NQuad();

  // Subject and predicate.
  Status st = scanner.ParseNode(&nquad->subject);
  if (!st) return st;
  scanner.SkipSpace();
  if (scanner.peek() != '<') return scanner.Error("Predicate expected");
  st = scanner.ParseIRI(&nquad->predicate);
  if (!st) return st;

  // Object.
  scanner.SkipSpace();
  if (scanner.peek() == '"') {
    st = scanner.ParseLiteral(&nquad->object_value);
    if (!st) return st;
    if (scanner.peek() == '@') {
      st = scanner.ParseLang(&nquad->lang);
      if (!st) return st;
    } else if (scanner.Consume('^')) {
      if (!scanner.Consume('^') || scanner.peek() != '<') {
        return scanner.Error("Datatype expected after ^^");
      }
      string datatype;
      st = scanner.ParseIRI(&datatype);
      if (!st) return st;
      nquad->value_type = DatatypeValueType(datatype);
    }
  } else {
    st = scanner.ParseNode(&nquad->object_id);
    if (!st) return st;
  }

  // Optional label.
  scanner.SkipSpace();
  if (scanner.peek() == '<' || scanner.peek() == '_') {
    st = scanner.ParseNode(&nquad->label);
    if (!st) return st;
    scanner.SkipSpace();
  }

  // Terminating period.
  if (!scanner.Consume('.')) return scanner.Error("'.' expected");
  scanner.SkipSpace();
  if (!scanner.AtEnd()) return scanner.Error("Trailing content after '.'");
  return Status::OK;
}

Status JSONConverter::Convert(const Slice &text, std::vector<NQuad> *nquads) {
  JSON json;
  Status st = JSON::Parse(text, &json);
  if (!st) return st;
  if (json.type() != JSON::OBJECT) {
    return Status(EINVAL, "JSON record must be an object");
  }
  string id;
  return ConvertObject(json, nquads, &id);
}

Status JSONConverter::ConvertObject(const JSON &object,
                                    std::vector<NQuad> *nquads,
                                    string *id) {
  // Get node id from uid field or make a new blank node.
  const JSON &uid = object["uid"];
  if (uid.valid()) {
    if (uid.type() != JSON::STRING || uid.text().empty()) {
      return Status(EINVAL, "JSON uid field must be a non-empty string");
    }
    *id = uid.text();
  } else {
    *id = "_:" + blank_prefix_ + std::to_string(next_blank_++);
  }

  const JSON::Object *fields = object.o();
  for (int i = 0; i < fields->size(); ++i) {
    const string &key = fields->key(i);
    if (key == "uid") continue;
    const JSON &value = fields->value(i);
    if (value.type() == JSON::ARRAY) {
      const JSON::Array *elements = value.a();
      for (int j = 0; j < elements->size(); ++j) {
        if ((*elements)[j].type() == JSON::ARRAY) {
          return Status(EINVAL, "Nested arrays are not supported", key);
        }
        Status st = ConvertValue(*id, key, (*elements)[j], nquads);
        if (!st) return st;
      }
    } else {
      Status st = ConvertValue(*id, key, value, nquads);
      if (!st) return st;
    }
  }
  return Status::OK;
}

Status JSONConverter::ConvertValue(const string &subject, const string &key,
                                   const JSON &value,
                                   std::vector<NQuad> *nquads) {
  NQuad nq;
  nq.subject = subject;
  nq.predicate = key;
  int at = key.find('@');
  if (at != -1) {
    nq.predicate = key.substr(0, at);
    nq.lang = key.substr(at + 1);
  }
  if (nq.predicate.empty()) return Status(EINVAL, "Empty predicate", key);

  switch (value.type()) {
    case JSON::NIL:
      return Status::OK;
    case JSON::STRING:
      nq.object_value = value.text();
      break;
    case JSON::INT:
      nq.object_value = value.text();
      nq.value_type = TYPE_INT;
      break;
    case JSON::FLOAT:
      nq.object_value = value.text();
      nq.value_type = TYPE_FLOAT;
      break;
    case JSON::BOOL:
      nq.object_value = value.b() ? "true" : "false";
      nq.value_type = TYPE_BOOL;
      break;
    case JSON::OBJECT: {
      if (!nq.lang.empty()) {
        return Status(EINVAL, "Language tag on uid edge", key);
      }
      Status st = ConvertObject(value, nquads, &nq.object_id);
      if (!st) return st;
      break;
    }
    default:
      return Status(EINVAL, "Invalid JSON value for", key);
  }
  nquads->push_back(std::move(nq));
  return Status::OK;
}

bool ParseUidLiteral(const string &id, uint64 *uid) {
  if (id.size() < 3 || id.size() > 18 || id[0] != '0' ||
      (id[1] != 'x' && id[1] != 'X')) {
    return false;
  }
  uint64 value = 0;
  for (int i = 2; i < id.size(); ++i) {
    if (!isxdigit(id[i])) return false;
    value = (value << 4) | (isdigit(id[i]) ? id[i] - '0'
                                           : (tolower(id[i]) - 'a' + 10));
  }
  if (value == 0) return false;
  *uid = value;
  return true;
}

}  // namespace bulkload
