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

#include "bulkload/util/fingerprint.h"

#include <string.h>

namespace bulkload {

static const uint64 kMul = 0x9ddfea08eb382d69ULL;
static const uint64 kSeed = 0xc3a5c85c97cb3127ULL;

// Final avalanche mixing of 64-bit value.
static inline uint64 Mix(uint64 h) {
  h ^= h >> 33;
  h *= 0xff51afd7ed558ccdULL;
  h ^= h >> 33;
  h *= 0xc4ceb9fe1a85ec53ULL;
  h ^= h >> 33;
  return h;
}

uint64 Fingerprint(const char *bytes, size_t len) {
  uint64 h = kSeed ^ (len * kMul);

  // Process input eight bytes at a time.
  while (len >= 8) {
    uint64 word;
    memcpy(&word, bytes, 8);
    h = (h ^ Mix(word)) * kMul;
    h ^= h >> 47;
    bytes += 8;
    len -= 8;
  }

  // Process remaining bytes.
  uint64 tail = 0;
  for (size_t i = 0; i < len; ++i) {
    tail |= static_cast<uint64>(static_cast<uint8>(bytes[i])) << (i * 8);
  }
  h = Mix(h ^ tail ^ (len << 56));

  // Avoid reserved fingerprints.
  if (h < 2) h += 2;
  return h;
}

uint64 FingerprintCat(uint64 fp1, uint64 fp2) {
  uint64 h = Mix(fp1 * kMul + fp2);
  if (h < 2) h += 2;
  return h;
}

}  // namespace bulkload
