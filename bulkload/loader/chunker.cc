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

#include "bulkload/loader/chunker.h"

#include "bulkload/base/logging.h"

namespace bulkload {

// Describe input byte for error messages.
static string Describe(int ch) {
  if (ch == -1) return "end of input";
  return string("'") + static_cast<char>(ch) + "'";
}

const char *InputFormatExtension(InputFormat format) {
  switch (format) {
    case FORMAT_RDF: return ".rdf";
    case FORMAT_JSON: return ".json";
  }
  return "";
}

Chunker *Chunker::Create(InputFormat format) {
  switch (format) {
    case FORMAT_RDF: return new RDFChunker();
    case FORMAT_JSON: return new JSONChunker();
  }
  LOG(FATAL) << "Unknown input format: " << format;
  return nullptr;
}

Status RDFChunker::Chunk(BufferedInput *input, string *chunk, bool *eof) {
  chunk->clear();
  *eof = false;
  for (int lines = 0; lines < lines_per_chunk_; ++lines) {
    Slice slice;
    BufferedInput::Outcome outcome;
    Status st = input->ReadSlice('\n', &slice, &outcome);
    if (!st) return st;
    chunk->append(slice.data(), slice.size());

    if (outcome == BufferedInput::END) {
      *eof = true;
      return Status::OK;
    }

    // The line is longer than the read buffer. Read the rest of it without
    // limit so lines are never split across chunks.
    if (outcome == BufferedInput::FULL) {
      bool end;
      st = input->ReadLine('\n', &line_, &end);
      if (!st) return st;
      chunk->append(line_);
      if (end) {
        *eof = true;
        return Status::OK;
      }
    }
  }
  return Status::OK;
}

Status JSONChunker::Begin(BufferedInput *input) {
  bool end;
  Status st = input->SkipSpace(&end);
  if (!st) return st;
  int ch;
  st = input->ReadChar(&ch);
  if (!st) return st;
  if (ch != '[') {
    return Status(EINVAL, "JSON file must contain array, found", Describe(ch));
  }
  return Status::OK;
}

Status JSONChunker::Chunk(BufferedInput *input, string *chunk, bool *eof) {
  chunk->clear();
  *eof = false;

  bool end;
  Status st = input->SkipSpace(&end);
  if (!st) return st;
  if (end) {
    *eof = true;
    return Status::OK;
  }

  int ch;
  st = input->ReadChar(&ch);
  if (!st) return st;
  if (ch != '{') {
    return Status(EINVAL, "Expected JSON object start, found", Describe(ch));
  }
  chunk->push_back(ch);

  // Find the matching closing brace. Braces inside strings do not count.
  int depth = 1;
  while (depth > 0) {
    st = input->ReadChar(&ch);
    if (!st) return st;
    if (ch == -1) return Status(EINVAL, "Malformed JSON: unterminated object");
    chunk->push_back(ch);
    switch (ch) {
      case '{':
        depth++;
        break;
      case '}':
        depth--;
        break;
      case '"':
        st = CopyQuoted(input, chunk);
        if (!st) return st;
        break;
    }
  }

  // The object must be followed by a comma or the end of the array.
  st = input->SkipSpace(&end);
  if (!st) return st;
  st = input->ReadChar(&ch);
  if (!st) return st;
  switch (ch) {
    case ']':
      *eof = true;
      break;
    case ',':
      break;
    case -1:
      return Status(EINVAL, "Malformed JSON: unterminated array");
    default:
      // Leave the unexpected token for the next call to report.
      input->UnreadChar();
  }
  return Status::OK;
}

Status JSONChunker::End(BufferedInput *input) {
  bool end;
  Status st = input->SkipSpace(&end);
  if (!st) return st;
  if (!end) return Status(EINVAL, "Not all of JSON file consumed");
  return Status::OK;
}

Status JSONChunker::CopyQuoted(BufferedInput *input, string *chunk) {
  for (;;) {
    int ch;
    Status st = input->ReadChar(&ch);
    if (!st) return st;
    if (ch == -1) return Status(EINVAL, "Malformed JSON: unterminated string");
    chunk->push_back(ch);

    if (ch == '\\') {
      // Copy the escaped character without interpreting it.
      st = input->ReadChar(&ch);
      if (!st) return st;
      if (ch == -1) {
        return Status(EINVAL, "Malformed JSON: unterminated string");
      }
      chunk->push_back(ch);
    } else if (ch == '"') {
      return Status::OK;
    }
  }
}

}  // namespace bulkload
