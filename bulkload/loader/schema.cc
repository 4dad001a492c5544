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

#include "bulkload/loader/schema.h"

#include <algorithm>
#include <set>
#include <utility>

#include "bulkload/base/logging.h"
#include "bulkload/file/recordio.h"
#include "bulkload/loader/input-files.h"
#include "bulkload/loader/keys.h"
#include "bulkload/loader/tokenizer.h"

namespace bulkload {

// Punctuation characters in schema text.
static bool IsPunct(char ch) {
  return ch == ':' || ch == '@' || ch == '(' || ch == ')' || ch == '[' ||
         ch == ']' || ch == ',' || ch == '.';
}

static bool IsSpace(char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' ||
         ch == '\v' || ch == '\f';
}

// Parser for schema text.
class SchemaParser {
 public:
  explicit SchemaParser(const string &text) : text_(text) {}

  // Parse all statements in the schema text.
  Status Parse(std::vector<PredicateSchema> *schema) {
    std::set<string> seen;
    Status st = NextToken();
    if (!st) return st;
    while (type_ != END) {
      PredicateSchema ps;
      st = ParseStatement(&ps);
      if (!st) return st;
      if (!seen.insert(ps.predicate).second) {
        return Error("Duplicate schema for predicate " + ps.predicate);
      }
      schema->push_back(std::move(ps));
    }
    return Status::OK;
  }

 private:
  // Token types.
  enum TokenType {END, NAME, PUNCT};

  // Parse one statement.
  Status ParseStatement(PredicateSchema *ps) {
    // Predicate name.
    if (type_ != NAME) return Error("Predicate name expected");
    ps->predicate = token_;
    Status st = NextToken();
    if (!st) return st;
    if (!IsToken(':')) return Error("':' expected after " + ps->predicate);
    st = NextToken();
    if (!st) return st;

    // Value type.
    if (IsToken('[')) {
      ps->list = true;
      st = NextToken();
      if (!st) return st;
    }
    if (type_ != NAME || !ParseValueType(token_, &ps->type)) {
      return Error("Unknown type for " + ps->predicate + ": " + token_);
    }
    st = NextToken();
    if (!st) return st;
    if (ps->list) {
      if (!IsToken(']')) return Error("']' expected in list type");
      st = NextToken();
      if (!st) return st;
    }

    // Directives.
    while (IsToken('@')) {
      st = NextToken();
      if (!st) return st;
      if (type_ != NAME) return Error("Directive expected after '@'");
      string directive = token_;
      st = NextToken();
      if (!st) return st;
      if (directive == "index") {
        st = ParseTokenizers(ps);
        if (!st) return st;
      } else if (directive == "reverse") {
        if (ps->type != TYPE_UID) {
          return Error("@reverse is only allowed for uid type: " +
                       ps->predicate);
        }
        ps->reverse = true;
      } else if (directive == "count") {
        ps->count = true;
      } else if (directive == "lang") {
        if (ps->type != TYPE_STRING) {
          return Error("@lang is only allowed for string type: " +
                       ps->predicate);
        }
        ps->lang = true;
      } else {
        return Error("Unknown directive @" + directive);
      }
    }

    // Terminating period.
    if (!IsToken('.')) return Error("'.' expected after " + ps->predicate);
    return NextToken();
  }

  // Parse tokenizer list for @index.
  Status ParseTokenizers(PredicateSchema *ps) {
    if (ps->type == TYPE_UID) {
      return Error("Cannot index uid predicate " + ps->predicate);
    }
    if (!IsToken('(')) return Error("'(' expected after @index");
    for (;;) {
      Status st = NextToken();
      if (!st) return st;
      if (type_ != NAME) return Error("Tokenizer expected");
      if (!ValidTokenizer(token_, ps->type)) {
        return Error("Invalid tokenizer " + token_ + " for " + ps->predicate);
      }
      ps->tokenizers.push_back(token_);
      st = NextToken();
      if (!st) return st;
      if (IsToken(')')) break;
      if (!IsToken(',')) return Error("',' or ')' expected in @index");
    }
    return NextToken();
  }

  // Read next token.
  Status NextToken() {
    // Skip whitespace and comments.
    for (;;) {
      while (pos_ < text_.size() && IsSpace(text_[pos_])) {
        if (text_[pos_] == '\n') line_++;
        pos_++;
      }
      if (pos_ < text_.size() && text_[pos_] == '#') {
        while (pos_ < text_.size() && text_[pos_] != '\n') pos_++;
        continue;
      }
      break;
    }

    token_.clear();
    if (pos_ == text_.size()) {
      type_ = END;
      return Status::OK;
    }

    char ch = text_[pos_];
    if (ch == '<') {
      // Predicate name in angle brackets.
      size_t end = text_.find('>', pos_);
      if (end == string::npos) return Error("Unterminated predicate name");
      token_ = text_.substr(pos_ + 1, end - pos_ - 1);
      pos_ = end + 1;
      type_ = NAME;
    } else if (IsPunct(ch)) {
      token_.push_back(ch);
      pos_++;
      type_ = PUNCT;
    } else {
      // Names can contain periods that are followed by a name character.
      while (pos_ < text_.size()) {
        ch = text_[pos_];
        if (IsSpace(ch) || ch == '#') break;
        if (IsPunct(ch)) {
          if (ch != '.' || pos_ + 1 == text_.size()) break;
          char next = text_[pos_ + 1];
          if (IsSpace(next) || IsPunct(next) || next == '#') break;
        }
        token_.push_back(ch);
        pos_++;
      }
      type_ = NAME;
    }
    return Status::OK;
  }

  // Check if current token is the punctuation character.
  bool IsToken(char punct) const {
    return type_ == PUNCT && token_[0] == punct;
  }

  // Return error with line number.
  Status Error(const string &message) const {
    return Status(EINVAL, "Schema error in line " + std::to_string(line_) +
                          ": " + message);
  }

  // Schema text and current position.
  const string &text_;
  size_t pos_ = 0;
  int line_ = 1;

  // Current token.
  TokenType type_ = END;
  string token_;
};

string PredicateSchema::ToString() const {
  string str = predicate + ": ";
  if (list) str.push_back('[');
  str.append(ValueTypeName(type));
  if (list) str.push_back(']');
  if (!tokenizers.empty()) {
    str.append(" @index(");
    for (size_t i = 0; i < tokenizers.size(); ++i) {
      if (i > 0) str.append(", ");
      str.append(tokenizers[i]);
    }
    str.push_back(')');
  }
  if (reverse) str.append(" @reverse");
  if (count) str.append(" @count");
  if (lang) str.append(" @lang");
  str.append(" .");
  return str;
}

Status ParseSchema(const string &text, std::vector<PredicateSchema> *schema) {
  schema->clear();
  SchemaParser parser(text);
  return parser.Parse(schema);
}

Status ReadSchema(const string &filename,
                  std::vector<PredicateSchema> *schema) {
  InputStream *input;
  Status st = OpenInputStream(filename, &input);
  if (!st) return st;
  string text;
  const void *data;
  int size;
  while (input->Next(&data, &size)) {
    text.append(static_cast<const char *>(data), size);
  }
  st = input->status();
  delete input;
  if (!st) return st;
  return ParseSchema(text, schema);
}

SchemaStore::SchemaStore(const std::vector<PredicateSchema> &schema) {
  for (const PredicateSchema &ps : schema) {
    predicates_[ps.predicate] = new PredicateSchema(ps);
  }
}

SchemaStore::~SchemaStore() {
  for (auto &it : predicates_) delete it.second;
}

const PredicateSchema *SchemaStore::Lookup(const string &predicate) {
  std::lock_guard<std::mutex> lock(mu_);
  auto f = predicates_.find(predicate);
  return f == predicates_.end() ? nullptr : f->second;
}

const PredicateSchema *SchemaStore::Get(const string &predicate,
                                        bool uid_edge) {
  std::lock_guard<std::mutex> lock(mu_);
  PredicateSchema *&ps = predicates_[predicate];
  if (ps == nullptr) {
    ps = new PredicateSchema();
    ps->predicate = predicate;
    ps->type = uid_edge ? TYPE_UID : TYPE_DEFAULT;
    ps->list = uid_edge;
    ps->inferred = true;
    VLOG(1) << "Inferred schema: " << ps->ToString();
  }
  return ps;
}

void SchemaStore::Add(const PredicateSchema &schema) {
  std::lock_guard<std::mutex> lock(mu_);
  PredicateSchema *&ps = predicates_[schema.predicate];
  if (ps == nullptr) ps = new PredicateSchema(schema);
}

Status SchemaStore::Write(OutputStore *store) {
  std::vector<std::pair<string, string>> entries;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto &it : predicates_) {
      entries.emplace_back(SchemaKey(it.first), it.second->ToString());
    }
  }
  std::sort(entries.begin(), entries.end());

  std::vector<Record> records;
  for (auto &entry : entries) {
    records.emplace_back(entry.first, entry.second);
  }
  return store->WriteSegment(records);
}

int SchemaStore::size() {
  std::lock_guard<std::mutex> lock(mu_);
  return predicates_.size();
}

}  // namespace bulkload
