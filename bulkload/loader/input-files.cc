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

#include "bulkload/loader/input-files.h"

#include "bulkload/base/slice.h"
#include "bulkload/file/file.h"
#include "bulkload/stream/file-input.h"
#include "bulkload/stream/zlib.h"

namespace bulkload {

Status FindDataFiles(const string &dir, const string &ext,
                     std::vector<string> *files) {
  files->clear();
  if (!File::IsDirectory(dir)) {
    return Status(ENOTDIR, "Input directory not found", dir);
  }
  string compressed = ext + ".gz";
  return File::Walk(dir, [&](const string &path) {
    Slice name(path);
    if (name.ends_with(ext) || name.ends_with(compressed)) {
      files->push_back(path);
    }
  });
}

bool IsCompressed(const string &filename) {
  return Slice(filename).ends_with(".gz");
}

Status OpenInputStream(const string &filename, InputStream **stream) {
  File *file;
  Status st = File::Open(filename, "r", &file);
  if (!st) return st;
  InputStream *input = new FileInputStream(file);
  if (IsCompressed(filename)) input = new GZipDecompressor(input);
  *stream = input;
  return Status::OK;
}

}  // namespace bulkload
