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

#include "bulkload/loader/tokenizer.h"

#include <errno.h>
#include <stdlib.h>
#include <algorithm>

namespace bulkload {

// Tokenizer identifiers.
enum TokenizerId {
  TOKENIZER_TERM = 0x01,
  TOKENIZER_EXACT = 0x02,
  TOKENIZER_INT = 0x06,
};

// Word characters for the term tokenizer. Bytes of multi-byte UTF-8 sequences
// are treated as word characters.
static bool IsWordChar(uint8 ch) {
  return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z') ||
         (ch >= 'A' && ch <= 'Z') || ch >= 0x80;
}

bool ValidTokenizer(const string &name, ValueType type) {
  if (name == "exact") {
    return type != TYPE_UID;
  } else if (name == "term") {
    return type == TYPE_STRING || type == TYPE_DEFAULT;
  } else if (name == "int") {
    return type == TYPE_INT;
  }
  return false;
}

Status Tokenize(const string &tokenizer, const string &value,
                std::vector<string> *terms) {
  terms->clear();
  if (tokenizer == "exact") {
    string term(1, TOKENIZER_EXACT);
    term.append(value);
    terms->push_back(term);
  } else if (tokenizer == "term") {
    size_t i = 0;
    while (i < value.size()) {
      while (i < value.size() && !IsWordChar(value[i])) i++;
      if (i == value.size()) break;
      string term(1, TOKENIZER_TERM);
      while (i < value.size() && IsWordChar(value[i])) {
        char ch = value[i++];
        if (ch >= 'A' && ch <= 'Z') ch += 'a' - 'A';
        term.push_back(ch);
      }
      terms->push_back(term);
    }
    std::sort(terms->begin(), terms->end());
    terms->erase(std::unique(terms->begin(), terms->end()), terms->end());
  } else if (tokenizer == "int") {
    char *end;
    errno = 0;
    int64 n = strtoll(value.c_str(), &end, 10);
    if (value.empty() || *end != 0 || errno != 0) {
      return Status(EINVAL, "Invalid int value for index", value);
    }

    // Flip the sign bit so negative numbers sort before positive numbers.
    uint64 bits = static_cast<uint64>(n) ^ (1ULL << 63);
    string term(1, TOKENIZER_INT);
    for (int shift = 56; shift >= 0; shift -= 8) {
      term.push_back((bits >> shift) & 0xff);
    }
    terms->push_back(term);
  } else {
    return Status(EINVAL, "Unknown tokenizer", tokenizer);
  }
  return Status::OK;
}

}  // namespace bulkload
