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

#include "bulkload/stream/buffered-input.h"

#include <string.h>

#include "bulkload/base/logging.h"

namespace bulkload {

BufferedInput::BufferedInput(InputStream *stream, int buffer_size)
    : stream_(stream), buffer_size_(buffer_size) {
  CHECK_GT(buffer_size, 0);
  buffer_.Reset(buffer_size);
}

Status BufferedInput::Fill() {
  if (eof_) return Status::OK;

  // Move unread data to the front of the buffer to make room for more.
  buffer_.Flush();
  while (buffer_.remaining() > 0) {
    const void *data;
    int size;
    if (!stream_->Next(&data, &size)) {
      eof_ = true;
      return stream_->status();
    }
    if (size == 0) continue;
    int n = size;
    if (n > buffer_.remaining()) {
      n = buffer_.remaining();
      stream_->BackUp(size - n);
    }
    memcpy(buffer_.Append(n), data, n);
    return Status::OK;
  }
  return Status::OK;
}

Status BufferedInput::ReadSlice(char delim, Slice *slice, Outcome *outcome) {
  can_unread_ = false;
  size_t scanned = 0;
  for (;;) {
    // Search for delimiter in the data not yet scanned.
    size_t avail = buffer_.available();
    if (scanned < avail) {
      const char *start = buffer_.begin();
      const void *found = memchr(start + scanned, delim, avail - scanned);
      if (found != nullptr) {
        size_t n = static_cast<const char *>(found) - start + 1;
        *slice = Slice(buffer_.Consume(n), n);
        *outcome = DELIMITER;
        return Status::OK;
      }
      scanned = avail;
    }

    // Return the whole buffer if it is full.
    if (avail >= buffer_size_) {
      *slice = Slice(buffer_.Consume(avail), avail);
      *outcome = FULL;
      return Status::OK;
    }

    // Return remaining data at end of stream.
    if (eof_) {
      *slice = Slice(buffer_.Consume(avail), avail);
      *outcome = END;
      return Status::OK;
    }

    Status st = Fill();
    if (!st) return st;
  }
}

Status BufferedInput::ReadLine(char delim, string *line, bool *end) {
  line->clear();
  *end = false;
  for (;;) {
    Slice slice;
    Outcome outcome;
    Status st = ReadSlice(delim, &slice, &outcome);
    if (!st) return st;
    line->append(slice.data(), slice.size());
    if (outcome == DELIMITER) return Status::OK;
    if (outcome == END) {
      *end = true;
      return Status::OK;
    }
  }
}

Status BufferedInput::ReadChar(int *ch) {
  if (buffer_.empty()) {
    Status st = Fill();
    if (!st) return st;
    if (buffer_.empty()) {
      *ch = -1;
      can_unread_ = false;
      return Status::OK;
    }
  }
  *ch = static_cast<uint8>(*buffer_.Consume(1));
  can_unread_ = true;
  return Status::OK;
}

void BufferedInput::UnreadChar() {
  CHECK(can_unread_) << "UnreadChar() must follow a successful ReadChar()";
  buffer_.Unread(1);
  can_unread_ = false;
}

Status BufferedInput::SkipSpace(bool *end) {
  for (;;) {
    int ch;
    Status st = ReadChar(&ch);
    if (!st) return st;
    if (ch == -1) {
      *end = true;
      return Status::OK;
    }
    if (!IsSpace(ch)) {
      UnreadChar();
      *end = false;
      return Status::OK;
    }
  }
}

}  // namespace bulkload
