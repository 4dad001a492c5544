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

#ifndef BULKLOAD_LOADER_INPUT_FILES_H_
#define BULKLOAD_LOADER_INPUT_FILES_H_

#include <string>
#include <vector>

#include "bulkload/base/status.h"
#include "bulkload/base/types.h"
#include "bulkload/stream/stream.h"

namespace bulkload {

// Find all files under dir, recursively, whose name ends with the extension
// ext or with ext followed by ".gz". The files are returned in sorted order.
Status FindDataFiles(const string &dir, const string &ext,
                     std::vector<string> *files);

// Check if file name indicates gzip compression.
bool IsCompressed(const string &filename);

// Open input stream for file. Files ending in ".gz" are decompressed on the
// fly. The caller takes ownership of the stream.
Status OpenInputStream(const string &filename, InputStream **stream);

}  // namespace bulkload

#endif  // BULKLOAD_LOADER_INPUT_FILES_H_
