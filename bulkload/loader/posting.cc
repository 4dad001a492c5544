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

#include "bulkload/loader/posting.h"

#include <string.h>

#include "bulkload/util/fingerprint.h"
#include "bulkload/util/varint.h"

namespace bulkload {

// Append varint to buffer.
static void AppendVarint(uint64 value, string *buffer) {
  char buf[Varint::kMax64];
  char *end = Varint::Encode64(buf, value);
  buffer->append(buf, end - buf);
}

// Read varint from input.
static bool ReadVarint(Slice *input, uint64 *value) {
  const char *p = Varint::Parse64(input->begin(), input->end(), value);
  if (p == nullptr) return false;
  input->remove_prefix(p - input->begin());
  return true;
}

// Read length-prefixed string from input.
static bool ReadString(Slice *input, string *str) {
  uint64 size;
  if (!ReadVarint(input, &size) || size > input->size()) return false;
  str->assign(input->data(), size);
  input->remove_prefix(size);
  return true;
}

uint64 ValueUid(const string &lang) {
  if (lang.empty()) return kValueUid;
  return Fingerprint(lang);
}

void EncodePosting(const Posting &posting, string *buffer) {
  buffer->append(reinterpret_cast<const char *>(&posting.uid), 8);
  buffer->push_back(posting.type);
  if (posting.is_value()) {
    AppendVarint(posting.lang.size(), buffer);
    buffer->append(posting.lang);
    AppendVarint(posting.value.size(), buffer);
    buffer->append(posting.value);
  }
}

bool DecodePosting(Slice *input, Posting *posting) {
  if (input->size() < 9) return false;
  memcpy(&posting->uid, input->data(), 8);
  uint8 type = (*input)[8];
  if (type > TYPE_UID) return false;
  posting->type = static_cast<ValueType>(type);
  input->remove_prefix(9);
  posting->value.clear();
  posting->lang.clear();
  if (posting->is_value()) {
    if (!ReadString(input, &posting->lang)) return false;
    if (!ReadString(input, &posting->value)) return false;
  }
  return true;
}

void EncodePostingList(const std::vector<Posting> &postings, string *buffer) {
  AppendVarint(postings.size(), buffer);
  for (const Posting &posting : postings) EncodePosting(posting, buffer);
}

bool DecodePostingList(const Slice &input, std::vector<Posting> *postings) {
  Slice data = input;
  uint64 count;
  if (!ReadVarint(&data, &count)) return false;
  postings->clear();
  for (uint64 i = 0; i < count; ++i) {
    Posting posting;
    if (!DecodePosting(&data, &posting)) return false;
    postings->push_back(std::move(posting));
  }
  return data.empty();
}

}  // namespace bulkload
