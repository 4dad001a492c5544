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

#include "bulkload/loader/keys.h"

#include "bulkload/base/logging.h"

namespace bulkload {

// Encode key type and predicate.
static void KeyPrefix(KeyType type, const string &attr, string *key) {
  CHECK_LT(attr.size(), 1 << 16) << "Predicate name too long";
  key->push_back(type);
  key->push_back(attr.size() >> 8);
  key->push_back(attr.size() & 0xff);
  key->append(attr);
}

// Append uid in big-endian order.
static void AppendUid(uint64 uid, string *key) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    key->push_back((uid >> shift) & 0xff);
  }
}

string DataKey(const string &attr, uint64 uid) {
  string key;
  KeyPrefix(KEY_DATA, attr, &key);
  AppendUid(uid, &key);
  return key;
}

string ReverseKey(const string &attr, uint64 uid) {
  string key;
  KeyPrefix(KEY_REVERSE, attr, &key);
  AppendUid(uid, &key);
  return key;
}

string IndexKey(const string &attr, const string &term) {
  string key;
  KeyPrefix(KEY_INDEX, attr, &key);
  key.append(term);
  return key;
}

string SchemaKey(const string &attr) {
  string key;
  KeyPrefix(KEY_SCHEMA, attr, &key);
  return key;
}

bool ParseKey(const Slice &key, ParsedKey *parsed) {
  if (key.size() < 3) return false;
  const uint8 *p = reinterpret_cast<const uint8 *>(key.data());
  size_t attrlen = (p[1] << 8) | p[2];
  if (key.size() < 3 + attrlen) return false;
  parsed->attr.assign(key.data() + 3, attrlen);
  parsed->uid = 0;
  parsed->term.clear();
  const uint8 *rest = p + 3 + attrlen;
  size_t left = key.size() - 3 - attrlen;

  switch (p[0]) {
    case KEY_DATA:
    case KEY_REVERSE:
      if (left != 8) return false;
      parsed->type = static_cast<KeyType>(p[0]);
      for (int i = 0; i < 8; ++i) parsed->uid = (parsed->uid << 8) | rest[i];
      return true;
    case KEY_INDEX:
      parsed->type = KEY_INDEX;
      parsed->term.assign(reinterpret_cast<const char *>(rest), left);
      return true;
    case KEY_SCHEMA:
      parsed->type = KEY_SCHEMA;
      return left == 0;
  }
  return false;
}

}  // namespace bulkload
