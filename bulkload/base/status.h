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

#ifndef BULKLOAD_BASE_STATUS_H_
#define BULKLOAD_BASE_STATUS_H_

#include <errno.h>
#include <iosfwd>
#include <string>

#include "bulkload/base/types.h"

namespace bulkload {

// A status is either OK or an error code with a message. Error codes are
// errno values.
class Status {
 public:
  // Create OK status.
  Status() : code_(0) {}

  // Create error status.
  Status(int code, const string &message) : code_(code), message_(message) {}
  Status(int code, const char *message, const string &detail);
  Status(int code, const char *message, int size)
      : code_(code), message_(message, size) {}

  // Check if status is OK.
  bool ok() const { return code_ == 0; }
  explicit operator bool() const { return ok(); }

  // Error code and message.
  int code() const { return code_; }
  const string &message() const { return message_; }

  // Return status as string.
  string ToString() const;

  // OK status.
  static const Status OK;

 private:
  int code_;
  string message_;
};

std::ostream &operator<<(std::ostream &os, const Status &status);

}  // namespace bulkload

#endif  // BULKLOAD_BASE_STATUS_H_
