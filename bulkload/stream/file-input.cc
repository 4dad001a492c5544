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

#include "bulkload/stream/file-input.h"

#include <stdlib.h>

#include "bulkload/base/logging.h"

namespace bulkload {

FileInputStream::FileInputStream(File *file, int block_size)
    : file_(file), block_size_(block_size) {
  buffer_ = static_cast<char *>(malloc(block_size));
  CHECK(buffer_ != nullptr);
}

FileInputStream::~FileInputStream() {
  free(buffer_);
  Status st = file_->Close();
  if (!st) LOG(WARNING) << "Error closing input file: " << st;
}

bool FileInputStream::Next(const void **data, int *size) {
  if (backup_ > 0) {
    *data = buffer_ + used_ - backup_;
    *size = backup_;
    backup_ = 0;
    return true;
  }
  if (!status_) return false;

  uint64 bytes;
  status_ = file_->Read(buffer_, block_size_, &bytes);
  if (!status_ || bytes == 0) {
    used_ = 0;
    return false;
  }
  used_ = bytes;
  position_ += bytes;
  *data = buffer_;
  *size = used_;
  return true;
}

void FileInputStream::BackUp(int count) {
  DCHECK_LE(backup_ + count, used_);
  backup_ += count;
}

bool FileInputStream::Skip(int count) {
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
