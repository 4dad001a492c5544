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

#include <memory>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "bulkload/loader/chunker.h"
#include "bulkload/stream/buffered-input.h"
#include "tests/test-util.h"

namespace bulkload {
namespace {

// Split input into chunks. Stops at the first error.
Status ChunkAll(Chunker *chunker, const string &data, int buffer_size,
                std::vector<string> *chunks) {
  StringInputStream stream(data, 7);
  BufferedInput input(&stream, buffer_size);
  Status st = chunker->Begin(&input);
  if (!st) return st;
  for (;;) {
    string chunk;
    bool eof;
    st = chunker->Chunk(&input, &chunk, &eof);
    if (!st) return st;
    if (!chunk.empty()) chunks->push_back(chunk);
    if (eof) break;
  }
  return chunker->End(&input);
}

TEST(RDFChunkerTest, ChunksReassembleToInput) {
  string data;
  for (int i = 0; i < 50; ++i) {
    data.append("<a" + std::to_string(i) + "> <name> \"n" + std::to_string(i) +
                "\" .\n");
  }
  // Line much longer than the read buffer.
  data.append("<long> <text> \"" + string(300, 'x') + "\" .\n");
  data.append("<last> <name> \"no newline\" .");

  RDFChunker chunker(4);
  std::vector<string> chunks;
  ASSERT_TRUE(ChunkAll(&chunker, data, 32, &chunks));

  string joined;
  for (const string &chunk : chunks) {
    int lines = 0;
    for (char c : chunk) if (c == '\n') lines++;
    EXPECT_LE(lines, 4);
    joined.append(chunk);
  }
  EXPECT_EQ(joined, data);

  // Lines are never split between chunks.
  for (int i = 0; i + 1 < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].back(), '\n');
  }
}

TEST(RDFChunkerTest, EmptyInput) {
  RDFChunker chunker;
  std::vector<string> chunks;
  ASSERT_TRUE(ChunkAll(&chunker, "", 32, &chunks));
  EXPECT_TRUE(chunks.empty());
}

TEST(JSONChunkerTest, OneChunkPerObject) {
  JSONChunker chunker;
  std::vector<string> chunks;
  string data = " [ {\"a\": 1},\n {\"b\": {\"c\": [1, 2]}} ]\n";
  ASSERT_TRUE(ChunkAll(&chunker, data, 16, &chunks));
  ASSERT_EQ(chunks.size(), 2);
  EXPECT_EQ(chunks[0], "{\"a\": 1}");
  EXPECT_EQ(chunks[1], "{\"b\": {\"c\": [1, 2]}}");
}

TEST(JSONChunkerTest, BracesInsideStrings) {
  JSONChunker chunker;
  std::vector<string> chunks;
  ASSERT_TRUE(ChunkAll(&chunker, "[{\"k\": \"a}b\"}]", 16, &chunks));
  ASSERT_EQ(chunks.size(), 1);
  EXPECT_EQ(chunks[0], "{\"k\": \"a}b\"}");
}

TEST(JSONChunkerTest, EscapedQuote) {
  JSONChunker chunker;
  std::vector<string> chunks;
  string object = R"({"k": "say \"}\" now", "n": 2})";
  ASSERT_TRUE(ChunkAll(&chunker, "[" + object + "]", 16, &chunks));
  ASSERT_EQ(chunks.size(), 1);
  EXPECT_EQ(chunks[0], object);
}

TEST(JSONChunkerTest, StrayTokenFailsOnNextChunk) {
  StringInputStream stream("[{\"a\": 1} x]");
  BufferedInput input(&stream);
  JSONChunker chunker;
  ASSERT_TRUE(chunker.Begin(&input));

  string chunk;
  bool eof;
  ASSERT_TRUE(chunker.Chunk(&input, &chunk, &eof));
  EXPECT_EQ(chunk, "{\"a\": 1}");
  EXPECT_FALSE(eof);

  Status st = chunker.Chunk(&input, &chunk, &eof);
  EXPECT_FALSE(st);
  EXPECT_EQ(st.code(), EINVAL);
}

TEST(JSONChunkerTest, TrailingContent) {
  JSONChunker chunker;
  std::vector<string> chunks;
  Status st = ChunkAll(&chunker, "[{\"a\": 1}] extra", 16, &chunks);
  EXPECT_FALSE(st);
  EXPECT_EQ(chunks.size(), 1);
}

TEST(JSONChunkerTest, ArrayEndingAtEndOfInput) {
  JSONChunker chunker;
  std::vector<string> chunks;
  ASSERT_TRUE(ChunkAll(&chunker, "[", 16, &chunks));
  EXPECT_TRUE(chunks.empty());

  JSONChunker trailing_comma;
  ASSERT_TRUE(ChunkAll(&trailing_comma, "[{\"a\": 1},\n", 16, &chunks));
  ASSERT_EQ(chunks.size(), 1);
  EXPECT_EQ(chunks[0], "{\"a\": 1}");
}

TEST(JSONChunkerTest, MalformedInput) {
  std::vector<string> inputs = {
    "{\"a\": 1}",       // not an array
    "[]",               // no objects
    "[{\"a\": 1}",      // unterminated array
    "[{\"a\": {\"b\"}",  // unterminated object
    "[{\"a\": \"b}]",   // unterminated string
  };
  for (const string &data : inputs) {
    JSONChunker chunker;
    std::vector<string> chunks;
    EXPECT_FALSE(ChunkAll(&chunker, data, 16, &chunks)) << data;
  }
}

TEST(ChunkerTest, Create) {
  std::unique_ptr<Chunker> rdf(Chunker::Create(FORMAT_RDF));
  EXPECT_TRUE(dynamic_cast<RDFChunker *>(rdf.get()) != nullptr);
  std::unique_ptr<Chunker> json(Chunker::Create(FORMAT_JSON));
  EXPECT_TRUE(dynamic_cast<JSONChunker *>(json.get()) != nullptr);
  EXPECT_STREQ(InputFormatExtension(FORMAT_RDF), ".rdf");
  EXPECT_STREQ(InputFormatExtension(FORMAT_JSON), ".json");
}

}  // namespace
}  // namespace bulkload
