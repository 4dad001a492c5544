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

#include "bulkload/base/status.h"

#include <ostream>

#include "bulkload/base/slice.h"

namespace bulkload {

const Status Status::OK;

Status::Status(int code, const char *message, const string &detail)
    : code_(code), message_(message) {
  if (!detail.empty()) {
    message_.append(": ");
    message_.append(detail);
  }
}

string Status::ToString() const {
  if (ok()) return "OK";
  return "[" + std::to_string(code_) + "] " + message_;
}

std::ostream &operator<<(std::ostream &os, const Status &status) {
  return os << status.ToString();
}

std::ostream &operator<<(std::ostream &os, const Slice &slice) {
  return os.write(slice.data(), slice.size());
}

}  // namespace bulkload
