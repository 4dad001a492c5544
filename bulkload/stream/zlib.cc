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

#include "bulkload/stream/zlib.h"

#include <stdlib.h>
#include <string.h>

#include "bulkload/base/logging.h"

namespace bulkload {

GZipDecompressor::GZipDecompressor(InputStream *input, int block_size)
    : input_(input), block_size_(block_size) {
  buffer_ = static_cast<char *>(malloc(block_size));
  CHECK(buffer_ != nullptr);
  memset(&zstream_, 0, sizeof(zstream_));
  int rc = inflateInit2(&zstream_, 16 + MAX_WBITS);
  if (rc != Z_OK) {
    status_ = Status(EINVAL, "Unable to initialize gzip decompressor");
    finished_ = true;
  }
}

GZipDecompressor::~GZipDecompressor() {
  inflateEnd(&zstream_);
  free(buffer_);
  delete input_;
}

bool GZipDecompressor::Next(const void **data, int *size) {
  if (backup_ > 0) {
    *data = buffer_ + used_ - backup_;
    *size = backup_;
    backup_ = 0;
    return true;
  }
  if (!Decompress()) return false;
  *data = buffer_;
  *size = used_;
  return true;
}

bool GZipDecompressor::Decompress() {
  used_ = 0;
  while (used_ == 0) {
    if (finished_) return false;

    // Get more compressed input if needed.
    if (zstream_.avail_in == 0) {
      const void *chunk;
      int chunk_size;
      if (!input_->Next(&chunk, &chunk_size)) {
        if (!input_->status()) {
          status_ = input_->status();
        } else if (!member_done_) {
          status_ = Status(EINVAL, "Truncated gzip stream");
        }
        finished_ = true;
        return false;
      }
      zstream_.next_in =
          reinterpret_cast<Bytef *>(const_cast<void *>(chunk));
      zstream_.avail_in = chunk_size;
    }

    // Decompress into output buffer.
    zstream_.next_out = reinterpret_cast<Bytef *>(buffer_);
    zstream_.avail_out = block_size_;
    member_done_ = false;
    int rc = inflate(&zstream_, Z_NO_FLUSH);
    used_ = block_size_ - zstream_.avail_out;
    if (rc == Z_STREAM_END) {
      // Start on the next gzip member, if any.
      member_done_ = true;
      inflateReset(&zstream_);
    } else if (rc != Z_OK && rc != Z_BUF_ERROR) {
      const char *msg = zstream_.msg != nullptr ? zstream_.msg : "corrupt data";
      status_ = Status(EINVAL, "gzip decompression failed", msg);
      finished_ = true;
      return false;
    }
  }
  position_ += used_;
  return true;
}

void GZipDecompressor::BackUp(int count) {
  DCHECK_LE(backup_ + count, used_);
  backup_ += count;
}

bool GZipDecompressor::Skip(int count) {
  const void *data;
  int size;
  while (count > 0) {
    if (!Next(&data, &size)) return false;
    if (size > count) {
      BackUp(size - count);
      return true;
    }
    count -= size;
  }
  return true;
}

}  // namespace bulkload
