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

#ifndef BULKLOAD_UTIL_IOBUFFER_H_
#define BULKLOAD_UTIL_IOBUFFER_H_

#include <stdlib.h>

#include "bulkload/base/slice.h"
#include "bulkload/base/types.h"

namespace bulkload {

// Growable byte buffer with a consumed part, a used part and a free part:
//
//   floor <= begin <= end <= ceil
//
// Data is written at the end and consumed from the beginning.
class IOBuffer {
 public:
  IOBuffer() = default;
  ~IOBuffer() { free(floor_); }

  // Buffer capacity.
  size_t capacity() const { return ceil_ - floor_; }

  // Number of bytes available for reading.
  size_t available() const { return end_ - begin_; }

  // Number of bytes free for writing.
  size_t remaining() const { return ceil_ - end_; }

  // Number of bytes consumed.
  size_t consumed() const { return begin_ - floor_; }

  // Check if buffer is empty.
  bool empty() const { return begin_ == end_; }

  // Available data as slice.
  Slice data() const { return Slice(begin_, end_); }

  // Begin and end of available data.
  char *begin() const { return begin_; }
  char *end() const { return end_; }

  // Clear buffer without releasing memory.
  void Clear();

  // Reset buffer to new capacity.
  void Reset(size_t size);

  // Resize buffer, keeping the available data.
  void Resize(size_t size);

  // Move available data to the start of the buffer.
  void Flush();

  // Ensure room for at least size more bytes.
  void Ensure(size_t size);

  // Extend used part of buffer and return pointer to the new data.
  char *Append(size_t size);

  // Consume data from buffer and return pointer to the consumed data.
  char *Consume(size_t size);

  // Read data from buffer. Returns false if not enough data is available.
  bool Read(void *data, size_t size);

  // Write data to buffer.
  void Write(const void *data, size_t size);
  void Write(const Slice &data) { Write(data.data(), data.size()); }

  // Give back consumed bytes.
  void Unread(size_t size);

 private:
  char *floor_ = nullptr;
  char *ceil_ = nullptr;
  char *begin_ = nullptr;
  char *end_ = nullptr;

  DISALLOW_COPY_AND_ASSIGN(IOBuffer);
};

}  // namespace bulkload

#endif  // BULKLOAD_UTIL_IOBUFFER_H_
