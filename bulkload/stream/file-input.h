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

#ifndef BULKLOAD_STREAM_FILE_INPUT_H_
#define BULKLOAD_STREAM_FILE_INPUT_H_

#include "bulkload/file/file.h"
#include "bulkload/stream/stream.h"

namespace bulkload {

// Input stream reading blocks from a file. The file is closed when the stream
// is destroyed.
class FileInputStream : public InputStream {
 public:
  FileInputStream(File *file, int block_size = 1 << 16);
  ~FileInputStream() override;

  bool Next(const void **data, int *size) override;
  void BackUp(int count) override;
  bool Skip(int count) override;
  int64 ByteCount() const override { return position_ - backup_; }
  Status status() const override { return status_; }

 private:
  // Input file.
  File *file_;

  // Block buffer.
  char *buffer_;
  int block_size_;

  // Number of bytes in the buffer and number of bytes backed up.
  int used_ = 0;
  int backup_ = 0;

  // Number of bytes read from the file.
  int64 position_ = 0;

  // Read error.
  Status status_;
};

}  // namespace bulkload

#endif  // BULKLOAD_STREAM_FILE_INPUT_H_
