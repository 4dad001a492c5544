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

#ifndef BULKLOAD_UTIL_VARINT_H_
#define BULKLOAD_UTIL_VARINT_H_

#include "bulkload/base/types.h"

namespace bulkload {

// Variable-length integer encoding with seven bits per byte.
class Varint {
 public:
  // Maximum length of encoded 64-bit integer.
  static const int kMax64 = 10;

  // Encode value and return pointer past the encoded bytes.
  static char *Encode64(char *dest, uint64 value) {
    uint8 *ptr = reinterpret_cast<uint8 *>(dest);
    while (value >= 128) {
      *ptr++ = value | 128;
      value >>= 7;
    }
    *ptr++ = value;
    return reinterpret_cast<char *>(ptr);
  }

  // Decode value from buffer. Returns pointer past the encoded bytes or null
  // if the value is truncated or malformed.
  static const char *Parse64(const char *p, const char *limit, uint64 *value) {
    uint64 result = 0;
    for (int shift = 0; shift < 64 && p < limit; shift += 7) {
      uint64 byte = static_cast<uint8>(*p++);
      result |= (byte & 127) << shift;
      if (byte < 128) {
        *value = result;
        return p;
      }
    }
    return nullptr;
  }

  // Number of bytes needed for encoding value.
  static int Length64(uint64 value) {
    int len = 1;
    while (value >= 128) {
      value >>= 7;
      len++;
    }
    return len;
  }
};

}  // namespace bulkload

#endif  // BULKLOAD_UTIL_VARINT_H_
