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

#ifndef BULKLOAD_LOADER_POSTING_H_
#define BULKLOAD_LOADER_POSTING_H_

#include <string>
#include <vector>

#include "bulkload/base/slice.h"
#include "bulkload/base/types.h"
#include "bulkload/loader/value.h"

namespace bulkload {

// A posting is one entry in the posting list for a key. Uid edges only have
// the target uid. Value postings have the value uid, which is kValueUid for
// values without language and the fingerprint of the language tag otherwise.
struct Posting {
  uint64 uid = 0;
  ValueType type = TYPE_UID;
  string value;
  string lang;

  bool is_value() const { return type != TYPE_UID; }
};

// Uid for value postings without language tag.
static const uint64 kValueUid = ~0ULL;

// Uid for value posting with language tag.
uint64 ValueUid(const string &lang);

// Append encoded posting to buffer.
void EncodePosting(const Posting &posting, string *buffer);

// Decode posting from the start of input and advance input past it.
bool DecodePosting(Slice *input, Posting *posting);

// Encode posting list as count followed by postings.
void EncodePostingList(const std::vector<Posting> &postings, string *buffer);

// Decode posting list.
bool DecodePostingList(const Slice &input, std::vector<Posting> *postings);

// Map entry produced by the mappers and consumed by the reducers.
struct MapEntry {
  MapEntry() {}
  MapEntry(const string &key, const Posting &posting)
      : key(key), posting(posting) {}

  string key;
  Posting posting;

  // Approximate memory usage.
  size_t size() const {
    return sizeof(MapEntry) + key.size() + posting.value.size() +
           posting.lang.size();
  }
};

// Order map entries by key and then uid.
inline bool operator<(const MapEntry &a, const MapEntry &b) {
  int c = a.key.compare(b.key);
  if (c != 0) return c < 0;
  return a.posting.uid < b.posting.uid;
}

}  // namespace bulkload

#endif  // BULKLOAD_LOADER_POSTING_H_
