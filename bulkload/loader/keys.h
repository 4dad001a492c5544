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

#ifndef BULKLOAD_LOADER_KEYS_H_
#define BULKLOAD_LOADER_KEYS_H_

#include <string>

#include "bulkload/base/slice.h"
#include "bulkload/base/types.h"

namespace bulkload {

// Key types. Keys are encoded as the type byte, the predicate name with a
// 16-bit big-endian length prefix, and a type-specific suffix. Data and
// reverse keys end with the big-endian uid so all keys for a predicate sort
// by uid.
enum KeyType {
  KEY_DATA = 0x00,
  KEY_SCHEMA = 0x01,
  KEY_INDEX = 0x02,
  KEY_REVERSE = 0x04,
};

// Key components.
struct ParsedKey {
  KeyType type = KEY_DATA;
  string attr;
  uint64 uid = 0;
  string term;
};

// Key for the edges of predicate attr from node uid.
string DataKey(const string &attr, uint64 uid);

// Key for the reverse edges of predicate attr to node uid.
string ReverseKey(const string &attr, uint64 uid);

// Key for index term of predicate attr.
string IndexKey(const string &attr, const string &term);

// Key for schema of predicate attr.
string SchemaKey(const string &attr);

// Decode key. Returns false if the key is malformed.
bool ParseKey(const Slice &key, ParsedKey *parsed);

}  // namespace bulkload

#endif  // BULKLOAD_LOADER_KEYS_H_
