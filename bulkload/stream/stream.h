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

#ifndef BULKLOAD_STREAM_STREAM_H_
#define BULKLOAD_STREAM_STREAM_H_

#include "bulkload/base/status.h"
#include "bulkload/base/types.h"

namespace bulkload {

// Zero-copy input stream interface. Data is returned in blocks owned by the
// stream and valid until the next call.
class InputStream {
 public:
  virtual ~InputStream() = default;

  // Obtain a block of data from the stream. Returns false at the end of the
  // stream or on errors. Errors are reported by status().
  virtual bool Next(const void **data, int *size) = 0;

  // Back up a number of bytes so they are returned by the next call to Next().
  virtual void BackUp(int count) = 0;

  // Skip a number of bytes. Returns false if the end of the stream is reached.
  virtual bool Skip(int count) = 0;

  // Total number of bytes read.
  virtual int64 ByteCount() const = 0;

  // Error status for the stream.
  virtual Status status() const { return Status::OK; }
};

}  // namespace bulkload

#endif  // BULKLOAD_STREAM_STREAM_H_
