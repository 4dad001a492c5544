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

#ifndef BULKLOAD_LOADER_CHUNKER_H_
#define BULKLOAD_LOADER_CHUNKER_H_

#include <string>

#include "bulkload/base/status.h"
#include "bulkload/base/types.h"
#include "bulkload/stream/buffered-input.h"

namespace bulkload {

// Input formats supported by the loader.
enum InputFormat {
  FORMAT_RDF,   // N-Quads, one record per line
  FORMAT_JSON,  // array of JSON objects
};

// File extension for input format, e.g. ".rdf".
const char *InputFormatExtension(InputFormat format);

// A chunker splits an input stream into chunks that each hold one or more
// complete records. A chunker is used for one input file only. The calling
// sequence is Begin(), Chunk() until *eof is set, and then End().
class Chunker {
 public:
  virtual ~Chunker() = default;

  // Consume the framing before the first record.
  virtual Status Begin(BufferedInput *input) = 0;

  // Read next chunk. At the end of the input *eof is set and the chunk holds
  // the remaining records, which may be none.
  virtual Status Chunk(BufferedInput *input, string *chunk, bool *eof) = 0;

  // Check that no meaningful content is left after the last record.
  virtual Status End(BufferedInput *input) = 0;

  // Create chunker for input format.
  static Chunker *Create(InputFormat format);
};

// Chunker for line-oriented RDF input. Chunks consist of whole lines.
class RDFChunker : public Chunker {
 public:
  // Default number of lines per chunk.
  static const int kLinesPerChunk = 100000;

  explicit RDFChunker(int lines_per_chunk = kLinesPerChunk)
      : lines_per_chunk_(lines_per_chunk) {}

  Status Begin(BufferedInput *input) override { return Status::OK; }
  Status Chunk(BufferedInput *input, string *chunk, bool *eof) override;
  Status End(BufferedInput *input) override { return Status::OK; }

 private:
  // Maximum number of lines in a chunk.
  int lines_per_chunk_;

  // Buffer for lines longer than the read buffer.
  string line_;
};

// Chunker for JSON input consisting of one array of objects. Each chunk holds
// one array element. Only the lexical structure of objects and strings is
// checked here; the records are parsed by the mapper.
class JSONChunker : public Chunker {
 public:
  Status Begin(BufferedInput *input) override;
  Status Chunk(BufferedInput *input, string *chunk, bool *eof) override;
  Status End(BufferedInput *input) override;

 private:
  // Copy the rest of a quoted string after the opening quote into chunk.
  static Status CopyQuoted(BufferedInput *input, string *chunk);
};

}  // namespace bulkload

#endif  // BULKLOAD_LOADER_CHUNKER_H_
