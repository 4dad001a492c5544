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

#ifndef BULKLOAD_UTIL_FINGERPRINT_H_
#define BULKLOAD_UTIL_FINGERPRINT_H_

#include "bulkload/base/slice.h"
#include "bulkload/base/types.h"

namespace bulkload {

// Compute 64-bit fingerprint for data. Never returns 0 or 1.
uint64 Fingerprint(const char *bytes, size_t len);
inline uint64 Fingerprint(const Slice &slice) {
  return Fingerprint(slice.data(), slice.size());
}

// Concatenate two fingerprints.
uint64 FingerprintCat(uint64 fp1, uint64 fp2);

}  // namespace bulkload

#endif  // BULKLOAD_UTIL_FINGERPRINT_H_
