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

#ifndef BULKLOAD_STREAM_ZLIB_H_
#define BULKLOAD_STREAM_ZLIB_H_

#include <zlib.h>

#include "bulkload/stream/stream.h"

namespace bulkload {

// Input stream decompressing gzip data from another input stream. The
// underlying stream is owned by the decompressor. Concatenated gzip members
// are decompressed as one stream.
class GZipDecompressor : public InputStream {
 public:
  GZipDecompressor(InputStream *input, int block_size = 1 << 16);
  ~GZipDecompressor() override;

  bool Next(const void **data, int *size) override;
  void BackUp(int count) override;
  bool Skip(int count) override;
  int64 ByteCount() const override { return position_ - backup_; }
  Status status() const override { return status_; }

 private:
  // Decompress next block into the output buffer. Returns false at the end of
  // input or on errors.
  bool Decompress();

  // Compressed input stream.
  InputStream *input_;

  // Decompression state.
  z_stream zstream_;
  bool finished_ = false;

  // The current gzip member has been fully decompressed.
  bool member_done_ = true;

  // Output buffer.
  char *buffer_;
  int block_size_;
  int used_ = 0;
  int backup_ = 0;

  // Number of decompressed bytes produced.
  int64 position_ = 0;

  // Decompression error.
  Status status_;
};

}  // namespace bulkload

#endif  // BULKLOAD_STREAM_ZLIB_H_
