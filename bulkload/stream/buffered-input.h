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

#ifndef BULKLOAD_STREAM_BUFFERED_INPUT_H_
#define BULKLOAD_STREAM_BUFFERED_INPUT_H_

#include <string>

#include "bulkload/base/slice.h"
#include "bulkload/base/status.h"
#include "bulkload/base/types.h"
#include "bulkload/stream/stream.h"
#include "bulkload/util/iobuffer.h"

namespace bulkload {

// Buffered reader on top of an input stream with a fixed-size read buffer.
// Slices returned by ReadSlice() point into the read buffer and are only valid
// until the next read. Read errors from the underlying stream are returned as
// error status. The input stream is not owned.
class BufferedInput {
 public:
  // Outcome of ReadSlice().
  enum Outcome {
    DELIMITER,  // slice ends with the delimiter
    FULL,       // read buffer filled up before the delimiter was found
    END,        // end of stream reached before the delimiter was found
  };

  // Default read buffer size.
  static const int kDefaultBufferSize = 1 << 20;

  BufferedInput(InputStream *stream, int buffer_size = kDefaultBufferSize);

  // Read until and including the delimiter. If the delimiter is not found
  // within the read buffer size, the full buffer is returned. At the end of
  // the stream the remaining data, which may be empty, is returned.
  Status ReadSlice(char delim, Slice *slice, Outcome *outcome);

  // Read until and including the delimiter, without limit on the line length.
  // Sets *end if the stream ended before the delimiter was found.
  Status ReadLine(char delim, string *line, bool *end);

  // Read next byte. Returns -1 in *ch at the end of the stream.
  Status ReadChar(int *ch);

  // Push back the byte returned by the last ReadChar().
  void UnreadChar();

  // Skip whitespace. Sets *end if the end of the stream was reached.
  Status SkipSpace(bool *end);

  // Check if all input has been consumed.
  bool done() const { return eof_ && buffer_.empty(); }

  // Size of the read buffer.
  int buffer_size() const { return buffer_size_; }

  // Check for whitespace character.
  static bool IsSpace(int ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' ||
           ch == '\v' || ch == '\f';
  }

 private:
  // Read more data from the stream into the read buffer. Sets eof_ when the
  // stream has no more data.
  Status Fill();

  // Input stream.
  InputStream *stream_;

  // Read buffer.
  IOBuffer buffer_;
  int buffer_size_;

  // End of stream reached.
  bool eof_ = false;

  // Last operation was a ReadChar() that returned a byte.
  bool can_unread_ = false;
};

}  // namespace bulkload

#endif  // BULKLOAD_STREAM_BUFFERED_INPUT_H_
